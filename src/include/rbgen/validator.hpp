#pragma once

#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>

namespace rbgen {

  // Builder directives apply to records only. The kind is compared by
  // name, so hosts without a record kind simply never match.
  bool
  validate_builder_target(const declaration& element,
                          diagnostic_reporter& reporter);

  bool
  validate_interface_target(const declaration& element,
                            diagnostic_reporter& reporter);

} // namespace rbgen
