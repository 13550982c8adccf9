#pragma once

#include <rbgen/cpp_code.hpp>
#include <rbgen/declaration.hpp>
#include <rbgen/generation_config.hpp>

#include <string>
#include <vector>

namespace rbgen {

  // What a builder needs to know about the value type it builds.
  struct record_shape {
    std::string namespace_name;
    // Enclosing type names followed by the record's own name
    std::vector<std::string> type_path;
    std::vector<typed_name> components;
    std::string header;
    // Components are read through accessor calls rather than members
    bool accessor_components = false;

    bool
    operator==(const record_shape&) const = default;
  };

  // The namespace is the nearest enclosing namespace, or the unnamed one
  // if there is none.
  record_shape
  record_shape_for(const declaration& record);

  class builder_synthesizer {
    const generation_config& config_;

  public:
    explicit builder_synthesizer(const generation_config& config)
        : config_(config) {}

    std::string
    builder_name(const record_shape& record) const;

    synthesized_artifact
    synthesize(const record_shape& record,
               const std::string& namespace_name) const;
  };

} // namespace rbgen
