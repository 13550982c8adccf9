#include <rbgen/declaration.hpp>

#include <vector>

namespace rbgen {

  decl_kind
  classify_kind(std::string_view kind_name) {
    if (kind_name == namespace_kind_name) return decl_kind::namespace_;
    if (kind_name == record_kind_name) return decl_kind::value_type;
    if (kind_name == interface_kind_name) return decl_kind::interface_like;
    return decl_kind::other;
  }

  const attribute_value*
  directive_instance::find(std::string_view name) const {
    for (const auto& attr : attributes_) {
      if (attr.name == name) return &attr.value;
    }
    return nullptr;
  }

  std::string
  declaration::qualified_name() const {
    std::vector<const std::string*> parts;
    for (const declaration* d = this; d != nullptr; d = d->enclosing_) {
      if (!d->name_.empty()) parts.push_back(&d->name_);
    }

    std::string result;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
      if (!result.empty()) result += '.';
      result += **it;
    }
    return result;
  }

  const directive_instance*
  declaration::find_directive(std::string_view identity) const {
    for (const auto& d : directives_) {
      if (d.identity() == identity) return &d;
    }
    return nullptr;
  }

} // namespace rbgen
