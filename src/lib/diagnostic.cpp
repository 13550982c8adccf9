#include <rbgen/diagnostic.hpp>

#include <algorithm>
#include <utility>

namespace rbgen {

  std::string_view
  to_string(severity s) {
    switch (s) {
    case severity::error: return "error";
    case severity::note: return "note";
    }
    return "";
  }

  void
  collecting_reporter::report(severity level, std::string message,
                              const declaration& element) {
    diagnostics_.push_back({level, std::move(message), &element});
  }

  std::size_t
  collecting_reporter::count(severity level) const {
    return static_cast<std::size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(),
                      [level](const diagnostic& d) { return d.level == level; }));
  }

  void
  ostream_reporter::report(severity level, std::string message,
                           const declaration& element) {
    if (level == severity::error) ++errors_;
    if (level == severity::note && !show_notes_) return;

    os_ << "rbgen: " << to_string(level) << ": ";
    auto name = element.qualified_name();
    if (!name.empty()) os_ << name << ": ";
    os_ << message << '\n';
  }

} // namespace rbgen
