#pragma once

#include <rbgen/decl_model.hpp>
#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace rbgen {

  struct include_target {
    const declaration* target = nullptr;
    std::string namespace_name;
    bool add_builder = true;
  };

  using include_callback = std::function<void(const include_target&)>;

  // Expands the include directive `identity` attached to `host`. Targets
  // are handled in list order; each resolvable one is passed to
  // `on_target` before the next is looked at. Unresolvable targets are
  // reported at `host` and skipped.
  void
  resolve_includes(const declaration& host, std::string_view identity,
                   const symbol_table& symbols, diagnostic_reporter& reporter,
                   const include_callback& on_target);

} // namespace rbgen
