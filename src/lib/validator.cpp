#include <rbgen/validator.hpp>

namespace rbgen {

  bool
  validate_builder_target(const declaration& element,
                          diagnostic_reporter& reporter) {
    if (element.kind_name() != record_kind_name) {
      reporter.error("record_builder only valid for records.", element);
      return false;
    }
    return true;
  }

  bool
  validate_interface_target(const declaration& element,
                            diagnostic_reporter& reporter) {
    if (element.kind() != decl_kind::interface_like) {
      reporter.error("record_interface only valid for interfaces.", element);
      return false;
    }
    return true;
  }

} // namespace rbgen
