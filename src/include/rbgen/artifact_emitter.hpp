#pragma once

#include <rbgen/cpp_code.hpp>
#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>
#include <rbgen/emission_sink.hpp>
#include <rbgen/generation_config.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace rbgen {

  using rewrite_fn = std::function<std::string(std::string_view)>;

  // Renders with the configured indent and file comment.
  std::string
  render(const cpp_file& file, const generation_config& config);

  // Removes the generated-marker line that heads a class, if any.
  std::string
  strip_generated_marker(std::string_view source);

  // Commits rendered artifacts to a sink. Sink failures are reported as an
  // error at the originating declaration and never escape.
  class artifact_emitter {
    emission_sink& sink_;
    diagnostic_reporter& reporter_;

    bool
    commit(const declaration& origin, const synthesized_artifact& artifact,
           std::string_view text) const;

  public:
    artifact_emitter(emission_sink& sink, diagnostic_reporter& reporter)
        : sink_(sink), reporter_(reporter) {}

    bool
    emit(const declaration& origin, const synthesized_artifact& artifact,
         const generation_config& config) const;

    // Renders, strips the generated marker, applies `rewrite` and commits
    // the rewritten text.
    bool
    emit_rewritten(const declaration& origin,
                   const synthesized_artifact& artifact,
                   const generation_config& config,
                   const rewrite_fn& rewrite) const;
  };

} // namespace rbgen
