#include <rbgen/xml_tree.hpp>

#include <expat.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rbgen {

  namespace {

    // Split "uri\nlocal" as produced by XML_ParserCreateNS. Unqualified
    // names have no separator.
    std::pair<std::string, std::string>
    split_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) return {std::string(), std::string(expat_name)};
      return {std::string(expat_name, sep), std::string(sep + 1)};
    }

    struct tree_builder {
      XML_Parser parser = nullptr;
      xml_node root;
      std::vector<xml_node*> open;
      bool has_root = false;

      static void XMLCALL
      on_start_element(void* user_data, const char* name, const char** atts) {
        auto* self = static_cast<tree_builder*>(user_data);

        xml_node* node = nullptr;
        if (self->open.empty()) {
          node = &self->root;
          self->has_root = true;
        } else {
          node = &self->open.back()->children.emplace_back();
        }

        auto [uri, local] = split_expat_name(name);
        node->namespace_uri = std::move(uri);
        node->name = std::move(local);
        node->line =
            static_cast<std::size_t>(XML_GetCurrentLineNumber(self->parser));

        for (const char** p = atts; *p != nullptr; p += 2) {
          // Attributes are matched by local name only
          node->attributes.emplace_back(split_expat_name(p[0]).second,
                                        std::string(p[1]));
        }

        self->open.push_back(node);
      }

      static void XMLCALL
      on_end_element(void* user_data, const char*) {
        auto* self = static_cast<tree_builder*>(user_data);
        self->open.pop_back();
      }

      static void XMLCALL
      on_character_data(void* user_data, const char* s, int len) {
        auto* self = static_cast<tree_builder*>(user_data);
        if (self->open.empty()) return;
        self->open.back()->text.append(s, static_cast<std::size_t>(len));
      }
    };

    struct parser_deleter {
      void
      operator()(XML_Parser p) const {
        XML_ParserFree(p);
      }
    };

  } // namespace

  const std::string*
  xml_node::attribute(std::string_view attr_name) const {
    for (const auto& [key, value] : attributes) {
      if (key == attr_name) return &value;
    }
    return nullptr;
  }

  const std::string&
  xml_node::required_attribute(std::string_view attr_name) const {
    if (auto* value = attribute(attr_name)) return *value;
    throw std::runtime_error("line " + std::to_string(line) + ": <" + name +
                             "> requires attribute '" +
                             std::string(attr_name) + "'");
  }

  xml_node
  parse_xml(std::string_view xml) {
    // '\n' as the namespace separator
    std::unique_ptr<XML_ParserStruct, parser_deleter> parser(
        XML_ParserCreateNS(nullptr, '\n'));
    if (!parser) throw std::runtime_error("failed to create expat parser");

    // Children are appended in place, so `open` may only hold pointers
    // to the last child of each level; emplace_back keeps those valid
    // because earlier siblings are closed before a new one is added.
    tree_builder builder;
    builder.parser = parser.get();

    XML_SetUserData(parser.get(), &builder);
    XML_SetElementHandler(parser.get(), tree_builder::on_start_element,
                          tree_builder::on_end_element);
    XML_SetCharacterDataHandler(parser.get(), tree_builder::on_character_data);

    XML_Status status = XML_Parse(parser.get(), xml.data(),
                                  static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser.get()));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser.get()));
      throw std::runtime_error(msg);
    }

    if (!builder.has_root) throw std::runtime_error("XML parse error: no content");

    return std::move(builder.root);
  }

} // namespace rbgen
