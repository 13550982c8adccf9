#pragma once

#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rbgen {

  inline constexpr std::string_view target_namespace_token = "*";
  inline constexpr std::string_view host_namespace_token = "@";

  // Walks up from `element` (exclusive) to the nearest enclosing namespace.
  // Reports an error at `element` and returns nullptr if the chain ends
  // without one.
  const declaration*
  resolve_enclosing_namespace(const declaration& element,
                              diagnostic_reporter& reporter);

  // Renders an output namespace for an included `target`:
  //   "*" -> qualified name of target's enclosing namespace
  //   "@" -> qualified name of `host` if it is a namespace, otherwise of
  //          host's enclosing namespace
  // Returns std::nullopt if a needed namespace could not be resolved; the
  // diagnostic has already been reported.
  std::optional<std::string>
  build_namespace_name(std::string_view pattern, const declaration& host,
                       const declaration& target,
                       diagnostic_reporter& reporter);

} // namespace rbgen
