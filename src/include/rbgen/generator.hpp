#pragma once

#include <rbgen/decl_model.hpp>
#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>
#include <rbgen/emission_sink.hpp>
#include <rbgen/generation_config.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rbgen {

  class generator {
    const symbol_table& symbols_;
    const config_loader& configs_;
    emission_sink& sink_;
    diagnostic_reporter& reporter_;

    void
    process_builder(const declaration& record, const generation_config& config,
                    const std::optional<std::string>& namespace_name) const;

    void
    process_interface(const declaration& iface, bool add_builder,
                      const generation_config& config,
                      const std::optional<std::string>& namespace_name) const;

    void
    process_includes(const declaration& host, std::string_view identity,
                     const generation_config& config) const;

  public:
    generator(const symbol_table& symbols, const config_loader& configs,
              emission_sink& sink, diagnostic_reporter& reporter)
        : symbols_(symbols), configs_(configs), sink_(sink),
          reporter_(reporter) {}

    // Runs every supported directive found in the symbol table. Per-element
    // failures are reported, never thrown; the return value only states
    // that the directives were claimed and is always true.
    bool
    process_round() const;

    // Handles one directive on one element. Throws std::logic_error for an
    // identity outside supported_directives.
    void
    process(std::string_view identity, const declaration& element) const;
  };

} // namespace rbgen
