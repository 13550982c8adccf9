#include <rbgen/directive.hpp>

#include <variant>

namespace rbgen {

  directive_kind
  directive_kind_for(std::string_view identity) {
    if (identity == record_builder_directive) return directive_kind::builder;
    if (identity == record_builder_include_directive)
      return directive_kind::builder_include;
    if (identity == record_interface_directive)
      return directive_kind::interface;
    if (identity == record_interface_include_directive)
      return directive_kind::interface_include;
    return directive_kind::unknown;
  }

  bool
  is_include(directive_kind kind) {
    return kind == directive_kind::builder_include ||
           kind == directive_kind::interface_include;
  }

  std::optional<bool>
  bool_attribute(const attribute_value* value, bool fallback) {
    if (value == nullptr) return fallback;
    if (auto* b = std::get_if<bool>(value)) return *b;
    if (auto* s = std::get_if<std::string>(value)) {
      if (*s == "true") return true;
      if (*s == "false") return false;
    }
    return std::nullopt;
  }

  std::optional<std::string>
  string_attribute(const attribute_value* value) {
    if (value == nullptr) return std::nullopt;
    if (auto* s = std::get_if<std::string>(value)) return *s;
    return std::nullopt;
  }

  const type_ref_list*
  list_attribute(const attribute_value* value) {
    if (value == nullptr) return nullptr;
    return std::get_if<type_ref_list>(value);
  }

} // namespace rbgen
