#include <rbgen/directive.hpp>
#include <rbgen/include_resolver.hpp>
#include <rbgen/namespace_pattern.hpp>

namespace rbgen {

  void
  resolve_includes(const declaration& host, std::string_view identity,
                   const symbol_table& symbols, diagnostic_reporter& reporter,
                   const include_callback& on_target) {
    const directive_instance* directive = host.find_directive(identity);
    if (directive == nullptr) {
      reporter.error(
          "could not resolve directive for " + std::string(identity), host);
      return;
    }

    const type_ref_list* targets =
        list_attribute(directive->find(targets_attribute));
    if (targets == nullptr || targets->empty()) {
      reporter.error(
          "could not resolve target list for " + std::string(identity), host);
      return;
    }

    const std::string pattern =
        string_attribute(directive->find(namespace_pattern_attribute))
            .value_or(std::string(default_namespace_pattern));

    bool add_builder = false;
    if (directive_kind_for(identity) == directive_kind::interface_include) {
      auto value = bool_attribute(directive->find(add_builder_attribute), true);
      if (!value) {
        reporter.error(
            "invalid addBuilder value for " + std::string(identity), host);
        return;
      }
      add_builder = *value;
    }

    for (const auto& ref : *targets) {
      const declaration* target = symbols.resolve(ref);
      if (target == nullptr) {
        reporter.error("could not resolve target: " + ref, host);
        continue;
      }

      auto namespace_name =
          build_namespace_name(pattern, host, *target, reporter);
      if (!namespace_name) continue;

      on_target({target, std::move(*namespace_name), add_builder});
    }
  }

} // namespace rbgen
