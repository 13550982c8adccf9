#include <rbgen/namespace_pattern.hpp>

namespace rbgen {

  const declaration*
  resolve_enclosing_namespace(const declaration& element,
                              diagnostic_reporter& reporter) {
    for (const declaration* current = element.enclosing(); current != nullptr;
         current = current->enclosing()) {
      if (current->kind() == decl_kind::namespace_) return current;
    }
    reporter.error("element has no enclosing namespace", element);
    return nullptr;
  }

  std::optional<std::string>
  build_namespace_name(std::string_view pattern, const declaration& host,
                       const declaration& target,
                       diagnostic_reporter& reporter) {
    const declaration* target_ns = resolve_enclosing_namespace(target, reporter);
    if (target_ns == nullptr) return std::nullopt;

    // The host namespace is only looked up when the pattern asks for it
    std::string host_name;
    if (pattern.find(host_namespace_token) != std::string_view::npos) {
      const declaration* host_ns = &host;
      if (host.kind() != decl_kind::namespace_) {
        host_ns = resolve_enclosing_namespace(host, reporter);
        if (host_ns == nullptr) return std::nullopt;
      }
      host_name = host_ns->qualified_name();
    }

    // Single pass; substituted text is never rescanned
    const std::string target_name = target_ns->qualified_name();
    std::string replaced;
    for (char c : pattern) {
      if (c == target_namespace_token.front())
        replaced += target_name;
      else if (c == host_namespace_token.front())
        replaced += host_name;
      else
        replaced += c;
    }
    return replaced;
  }

} // namespace rbgen
