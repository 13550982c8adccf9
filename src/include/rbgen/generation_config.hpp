#pragma once

#include <rbgen/declaration.hpp>
#include <rbgen/diagnostic.hpp>
#include <rbgen/xml_tree.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rbgen {

  using option_callback =
      std::function<void(const std::string& name, const std::string& value)>;

  struct generation_config {
    std::string suffix = "Builder";
    std::string interface_suffix = "Record";
    std::string builder_method_name = "builder";
    std::string copy_method_name = "from";
    std::string build_method_name = "build";
    std::string setter_prefix;
    bool prefix_enclosing_class_names = true;
    std::string file_indent = "  ";
    std::string file_comment;

    // Sets an option by its configuration name ("fileIndent", ...).
    // Throws std::runtime_error for unknown names or malformed values.
    void
    set(std::string_view name, std::string_view value);

    // Reads a <config> document on top of the defaults, calling
    // `on_option` for every option applied.
    static generation_config
    load(const xml_node& root, const option_callback& on_option = {});

    bool
    operator==(const generation_config&) const = default;
  };

  // Produces a fresh generation_config for each processed element. The
  // document and overrides are checked once at construction; every load()
  // parses them again and reports one note per applied option.
  class config_loader {
    std::string document_;
    std::vector<std::pair<std::string, std::string>> overrides_;

    generation_config
    build(const option_callback& on_option) const;

  public:
    config_loader() = default;

    explicit config_loader(
        std::string document,
        std::vector<std::pair<std::string, std::string>> overrides = {});

    generation_config
    load(const declaration& element, diagnostic_reporter& reporter) const;
  };

} // namespace rbgen
