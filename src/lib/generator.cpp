#include <rbgen/artifact_emitter.hpp>
#include <rbgen/builder_synthesizer.hpp>
#include <rbgen/directive.hpp>
#include <rbgen/generator.hpp>
#include <rbgen/include_resolver.hpp>
#include <rbgen/interface_synthesizer.hpp>
#include <rbgen/validator.hpp>

#include <stdexcept>

namespace rbgen {

  bool
  generator::process_round() const {
    for (auto identity : supported_directives) {
      for (const declaration* element : symbols_.annotated_with(identity))
        process(identity, *element);
    }
    return true;
  }

  void
  generator::process(std::string_view identity,
                     const declaration& element) const {
    auto config = configs_.load(element, reporter_);

    switch (directive_kind_for(identity)) {
    case directive_kind::builder:
      process_builder(element, config, std::nullopt);
      return;

    case directive_kind::interface: {
      const directive_instance* directive = element.find_directive(identity);
      std::optional<bool> add_builder = true;
      if (directive != nullptr)
        add_builder =
            bool_attribute(directive->find(add_builder_attribute), true);
      if (!add_builder) {
        reporter_.error(
            "invalid addBuilder value for " + std::string(identity), element);
        return;
      }
      process_interface(element, *add_builder, config, std::nullopt);
      return;
    }

    case directive_kind::builder_include:
    case directive_kind::interface_include:
      process_includes(element, identity, config);
      return;

    case directive_kind::unknown: break;
    }

    throw std::logic_error("unknown directive: " + std::string(identity));
  }

  void
  generator::process_includes(const declaration& host, std::string_view identity,
                              const generation_config& config) const {
    const bool interfaces =
        directive_kind_for(identity) == directive_kind::interface_include;

    resolve_includes(host, identity, symbols_, reporter_,
                     [&](const include_target& t) {
                       if (interfaces)
                         process_interface(*t.target, t.add_builder, config,
                                           t.namespace_name);
                       else
                         process_builder(*t.target, config, t.namespace_name);
                     });
  }

  void
  generator::process_builder(
      const declaration& record, const generation_config& config,
      const std::optional<std::string>& namespace_name) const {
    if (!validate_builder_target(record, reporter_)) return;

    auto shape = record_shape_for(record);
    builder_synthesizer synthesizer(config);
    auto artifact = synthesizer.synthesize(
        shape, namespace_name.value_or(shape.namespace_name));

    artifact_emitter(sink_, reporter_).emit(record, artifact, config);
  }

  void
  generator::process_interface(
      const declaration& iface, bool add_builder,
      const generation_config& config,
      const std::optional<std::string>& namespace_name) const {
    if (!validate_interface_target(iface, reporter_)) return;

    interface_synthesizer synthesizer(
        iface, config,
        namespace_name.value_or(record_shape_for(iface).namespace_name));
    if (!synthesizer.validate(reporter_)) return;

    artifact_emitter emitter(sink_, reporter_);
    bool emitted = emitter.emit_rewritten(
        iface, synthesizer.implementation_class(), config, to_value_type);

    // The builder refers to the value type, so it only follows a value
    // type that was written
    if (emitted && add_builder) {
      auto shape = synthesizer.value_type_shape();
      auto builder =
          builder_synthesizer(config).synthesize(shape, shape.namespace_name);
      emitter.emit(iface, builder, config);
    }
  }

} // namespace rbgen
