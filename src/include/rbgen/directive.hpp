#pragma once

#include <rbgen/declaration.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace rbgen {

  inline constexpr std::string_view record_builder_directive =
      "rbgen.record_builder";
  inline constexpr std::string_view record_builder_include_directive =
      "rbgen.record_builder.include";
  inline constexpr std::string_view record_interface_directive =
      "rbgen.record_interface";
  inline constexpr std::string_view record_interface_include_directive =
      "rbgen.record_interface.include";

  inline constexpr std::array<std::string_view, 4> supported_directives = {
      record_builder_directive,
      record_builder_include_directive,
      record_interface_directive,
      record_interface_include_directive,
  };

  inline constexpr std::string_view targets_attribute = "targets";
  inline constexpr std::string_view namespace_pattern_attribute =
      "namespacePattern";
  inline constexpr std::string_view add_builder_attribute = "addBuilder";

  inline constexpr std::string_view default_namespace_pattern = "*";

  // `unknown` is only produced for identities outside supported_directives.
  enum class directive_kind {
    builder,
    builder_include,
    interface,
    interface_include,
    unknown,
  };

  directive_kind
  directive_kind_for(std::string_view identity);

  bool
  is_include(directive_kind kind);

  // Reads a boolean attribute. Accepts a bool value or the strings
  // "true"/"false". Absence yields `fallback`; any other value is empty.
  std::optional<bool>
  bool_attribute(const attribute_value* value, bool fallback);

  std::optional<std::string>
  string_attribute(const attribute_value* value);

  const type_ref_list*
  list_attribute(const attribute_value* value);

} // namespace rbgen
