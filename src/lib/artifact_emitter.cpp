#include <rbgen/artifact_emitter.hpp>
#include <rbgen/cpp_writer.hpp>
#include <rbgen/naming.hpp>

namespace rbgen {

  std::string
  render(const cpp_file& file, const generation_config& config) {
    write_options opts;
    opts.indent = config.file_indent;
    opts.file_comment = config.file_comment;
    return cpp_writer{}.write(file, opts);
  }

  std::string
  strip_generated_marker(std::string_view source) {
    // Only a marker line directly above a class head belongs to the class;
    // file comments may contain the same text.
    std::size_t start = 0;
    while (start < source.size()) {
      auto end = source.find('\n', start);
      if (end == std::string_view::npos) break;

      auto line = source.substr(start, end - start);
      auto next = source.substr(end + 1);
      if (line.starts_with(generated_marker) && next.starts_with("class ")) {
        std::string result(source.substr(0, start));
        result.append(next);
        return result;
      }
      start = end + 1;
    }
    return std::string(source);
  }

  bool
  artifact_emitter::commit(const declaration& origin,
                           const synthesized_artifact& artifact,
                           std::string_view text) const {
    const auto fully_qualified_name =
        qualified_name(artifact.namespace_name, artifact.simple_name);

    try {
      auto file = sink_.create_source_file(fully_qualified_name);
      file->write(text);
      file->close();
    } catch (const emission_error& e) {
      std::string message = "Could not create source file";
      if (*e.what() != '\0') {
        message += ": ";
        message += e.what();
      }
      reporter_.error(std::move(message), origin);
      return false;
    }
    return true;
  }

  bool
  artifact_emitter::emit(const declaration& origin,
                         const synthesized_artifact& artifact,
                         const generation_config& config) const {
    return commit(origin, artifact, render(artifact.file, config));
  }

  bool
  artifact_emitter::emit_rewritten(const declaration& origin,
                                   const synthesized_artifact& artifact,
                                   const generation_config& config,
                                   const rewrite_fn& rewrite) const {
    auto class_source = render(artifact.file, config);
    return commit(origin, artifact,
                  rewrite(strip_generated_marker(class_source)));
  }

} // namespace rbgen
