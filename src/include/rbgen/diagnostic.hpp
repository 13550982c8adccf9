#pragma once

#include <rbgen/declaration.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rbgen {

  enum class severity { error, note };

  std::string_view
  to_string(severity s);

  struct diagnostic {
    severity level = severity::error;
    std::string message;
    const declaration* element = nullptr;

    bool
    operator==(const diagnostic&) const = default;
  };

  // Sink for diagnostics raised during a round. Implementations must not
  // throw from report().
  class diagnostic_reporter {
  public:
    virtual ~diagnostic_reporter() = default;

    virtual void
    report(severity level, std::string message,
           const declaration& element) = 0;

    void
    error(std::string message, const declaration& element) {
      report(severity::error, std::move(message), element);
    }

    void
    note(std::string message, const declaration& element) {
      report(severity::note, std::move(message), element);
    }
  };

  class collecting_reporter : public diagnostic_reporter {
    std::vector<diagnostic> diagnostics_;

  public:
    void
    report(severity level, std::string message,
           const declaration& element) override;

    const std::vector<diagnostic>&
    diagnostics() const {
      return diagnostics_;
    }

    std::size_t
    count(severity level) const;

    void
    clear() {
      diagnostics_.clear();
    }
  };

  // Writes "rbgen: <severity>: <qualified-name>: <message>" lines.
  class ostream_reporter : public diagnostic_reporter {
    std::ostream& os_;
    bool show_notes_;
    std::size_t errors_ = 0;

  public:
    explicit ostream_reporter(std::ostream& os, bool show_notes = false)
        : os_(os), show_notes_(show_notes) {}

    void
    report(severity level, std::string message,
           const declaration& element) override;

    std::size_t
    error_count() const {
      return errors_;
    }
  };

} // namespace rbgen
