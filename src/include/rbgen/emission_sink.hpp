#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rbgen {

  // Failure to create or write a generated source file. what() carries the
  // detail, which may be empty.
  class emission_error : public std::runtime_error {
  public:
    explicit emission_error(const std::string& detail)
        : std::runtime_error(detail) {}
  };

  // An open generated file. Destroying it releases the underlying handle
  // whether or not close() was reached.
  class source_file {
  public:
    virtual ~source_file() = default;

    virtual void
    write(std::string_view text) = 0;

    virtual void
    close() = 0;
  };

  // Creates generated files by fully qualified name. Each name can be
  // created once per sink, and every dot-separated segment of it must be
  // an identifier.
  class emission_sink {
  public:
    virtual ~emission_sink() = default;

    virtual std::unique_ptr<source_file>
    create_source_file(const std::string& fully_qualified_name) = 0;
  };

  // Writes <root>/<namespace path>/<Name>.hpp
  class directory_sink : public emission_sink {
    std::filesystem::path root_;
    std::set<std::string> created_;

  public:
    explicit directory_sink(std::filesystem::path root)
        : root_(std::move(root)) {}

    std::unique_ptr<source_file>
    create_source_file(const std::string& fully_qualified_name) override;

    const std::filesystem::path&
    root() const {
      return root_;
    }
  };

  class memory_sink : public emission_sink {
    std::map<std::string, std::string> files_;
    std::set<std::string> created_;
    std::map<std::string, std::string> failures_;

  public:
    std::unique_ptr<source_file>
    create_source_file(const std::string& fully_qualified_name) override;

    // Makes create_source_file(name) throw emission_error(detail).
    void
    fail_on(std::string fully_qualified_name, std::string detail = {});

    // Closed files, keyed by fully qualified name.
    const std::map<std::string, std::string>&
    files() const {
      return files_;
    }

    const std::string*
    find(const std::string& fully_qualified_name) const;
  };

} // namespace rbgen
