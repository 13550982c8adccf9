#pragma once

#include <rbgen/builder_synthesizer.hpp>
#include <rbgen/cpp_code.hpp>
#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>
#include <rbgen/generation_config.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace rbgen {

  // Turns an interface's accessors into a concrete implementation class
  // and, through to_value_type(), into a value type.
  class interface_synthesizer {
    const declaration& interface_;
    const generation_config& config_;
    std::string namespace_name_;

  public:
    interface_synthesizer(const declaration& iface,
                          const generation_config& config,
                          std::string namespace_name)
        : interface_(iface), config_(config),
          namespace_name_(std::move(namespace_name)) {}

    // An interface without accessors has nothing to turn into components.
    // Reports an error and returns false in that case.
    bool
    validate(diagnostic_reporter& reporter) const;

    std::string
    value_type_name() const;

    // The intermediate class: a final implementation of the interface
    // holding one private member per accessor.
    synthesized_artifact
    implementation_class() const;

    // The generated value type as seen by a builder.
    record_shape
    value_type_shape() const;
  };

  // Rewrites a rendered implementation class into a value type: class heads
  // become struct heads and access specifier lines are dropped, leaving
  // every member public.
  std::string
  to_value_type(std::string_view class_source);

} // namespace rbgen
