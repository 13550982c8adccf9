#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rbgen {

  // Replaces every occurrence of `from` in `text`. Replacement text is
  // never rescanned.
  std::string
  replace_all(std::string_view text, std::string_view from,
              std::string_view to);

  // "ns.Name", or just "Name" for the unnamed namespace.
  std::string
  qualified_name(std::string_view namespace_name, std::string_view simple_name);

  // "com.example" -> "com::example"
  std::string
  cpp_namespace_for(std::string_view namespace_name);

  // Fully qualified C++ spelling of a type: "::com::example::Outer::Inner".
  std::string
  cpp_qualified_type(std::string_view namespace_name,
                     const std::vector<std::string>& type_path);

  // True if every dot-separated segment is a non-empty identifier.
  bool
  is_qualified_identifier(std::string_view name);

  // "com.example.PointBuilder" -> "com/example/PointBuilder.hpp"
  std::string
  source_path_for(std::string_view fully_qualified_name);

  // Escapes C++ keywords with a trailing underscore.
  std::string
  to_cpp_identifier(std::string_view name);

  // ("with", "name") -> "withName"; an empty prefix returns `name`.
  std::string
  prefixed_name(std::string_view prefix, std::string_view name);

} // namespace rbgen
