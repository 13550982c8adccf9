#include <rbgen/decl_model.hpp>

#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace rbgen {

  namespace {

    const std::string model_ns = "http://rbgen.dev/model";

    [[noreturn]] void
    fail(const xml_node& node, const std::string& what) {
      throw std::runtime_error("decl_model::load: line " +
                               std::to_string(node.line) + ": " + what);
    }

    directive_instance
    load_directive(const xml_node& node) {
      std::vector<directive_attribute> attributes;

      for (const auto& child : node.children) {
        if (child.name != "attribute")
          fail(child, "unexpected <" + child.name + "> inside <directive>");

        directive_attribute attr;
        attr.name = child.required_attribute("name");

        if (auto* value = child.attribute("value")) {
          attr.value = *value;
        } else {
          // A list of type references; an empty list is kept as such
          type_ref_list refs;
          for (const auto& ref : child.children) {
            if (ref.name != "type")
              fail(ref, "unexpected <" + ref.name + "> inside <attribute>");
            refs.push_back(ref.required_attribute("ref"));
          }
          attr.value = std::move(refs);
        }

        attributes.push_back(std::move(attr));
      }

      return directive_instance(node.required_attribute("name"),
                                std::move(attributes));
    }

    void
    load_children(decl_model& model, const xml_node& parent,
                  declaration* enclosing) {
      for (const auto& child : parent.children) {
        if (child.name == "directive" || child.name == "component" ||
            child.name == "method") {
          if (enclosing == nullptr)
            fail(child, "<" + child.name + "> outside of a declaration");

          if (child.name == "directive") {
            enclosing->add_directive(load_directive(child));
          } else {
            enclosing->add_member(
                {child.required_attribute("type"),
                 child.required_attribute("name")});
          }
          continue;
        }

        // Any other element is a declaration whose kind is the element name
        std::string name;
        if (auto* n = child.attribute("name"))
          name = *n;
        else if (child.name != namespace_kind_name)
          fail(child, "<" + child.name + "> requires attribute 'name'");

        auto& decl = model.add(child.name, std::move(name), enclosing);
        if (auto* header = child.attribute("header")) decl.set_header(*header);

        load_children(model, child, &decl);
      }
    }

  } // namespace

  decl_model
  decl_model::load(const xml_node& root) {
    if (root.name != "model" || root.namespace_uri != model_ns) {
      throw std::runtime_error(
          "decl_model::load: expected <model> root element "
          "in namespace " +
          model_ns);
    }

    decl_model model;
    load_children(model, root, nullptr);
    return model;
  }

  declaration&
  decl_model::add(std::string kind_name, std::string name,
                  const declaration* enclosing) {
    declarations_.push_back(std::make_unique<declaration>(
        std::move(kind_name), std::move(name), enclosing));
    return *declarations_.back();
  }

  void
  decl_model::merge(decl_model&& other) {
    declarations_.insert(declarations_.end(),
                         std::make_move_iterator(other.declarations_.begin()),
                         std::make_move_iterator(other.declarations_.end()));
    other.declarations_.clear();
  }

  const declaration*
  decl_model::resolve(std::string_view type_ref) const {
    for (const auto& d : declarations_) {
      if (d->kind() == decl_kind::namespace_) continue;
      if (d->qualified_name() == type_ref) return d.get();
    }
    return nullptr;
  }

  std::vector<const declaration*>
  decl_model::annotated_with(std::string_view identity) const {
    std::vector<const declaration*> result;
    for (const auto& d : declarations_) {
      if (d->find_directive(identity) != nullptr) result.push_back(d.get());
    }
    return result;
  }

} // namespace rbgen
