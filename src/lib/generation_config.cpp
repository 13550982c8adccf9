#include <rbgen/generation_config.hpp>

#include <stdexcept>
#include <string>

namespace rbgen {

  namespace {

    const std::string config_ns = "http://rbgen.dev/config";

    bool
    parse_bool(std::string_view name, std::string_view value) {
      if (value == "true") return true;
      if (value == "false") return false;
      throw std::runtime_error("generation_config: option '" +
                               std::string(name) +
                               "' expects true or false, got '" +
                               std::string(value) + "'");
    }

  } // namespace

  void
  generation_config::set(std::string_view name, std::string_view value) {
    if (name == "suffix")
      suffix = value;
    else if (name == "interfaceSuffix")
      interface_suffix = value;
    else if (name == "builderMethodName")
      builder_method_name = value;
    else if (name == "copyMethodName")
      copy_method_name = value;
    else if (name == "buildMethodName")
      build_method_name = value;
    else if (name == "setterPrefix")
      setter_prefix = value;
    else if (name == "prefixEnclosingClassNames")
      prefix_enclosing_class_names = parse_bool(name, value);
    else if (name == "fileIndent")
      file_indent = value;
    else if (name == "fileComment")
      file_comment = value;
    else
      throw std::runtime_error("generation_config: unknown option '" +
                               std::string(name) + "'");
  }

  generation_config
  generation_config::load(const xml_node& root,
                          const option_callback& on_option) {
    if (root.name != "config" || root.namespace_uri != config_ns) {
      throw std::runtime_error(
          "generation_config::load: expected <config> root element "
          "in namespace " +
          config_ns);
    }

    generation_config config;

    for (const auto& child : root.children) {
      if (child.name != "option") {
        throw std::runtime_error(
            "generation_config::load: unexpected element <" + child.name +
            "> inside <config>");
      }

      const auto& name = child.required_attribute("name");
      const auto& value = child.required_attribute("value");
      config.set(name, value);
      if (on_option) on_option(name, value);
    }

    return config;
  }

  config_loader::config_loader(
      std::string document,
      std::vector<std::pair<std::string, std::string>> overrides)
      : document_(std::move(document)), overrides_(std::move(overrides)) {
    // Fail early rather than once per element
    build({});
  }

  generation_config
  config_loader::build(const option_callback& on_option) const {
    generation_config config;
    if (!document_.empty())
      config = generation_config::load(parse_xml(document_), on_option);

    for (const auto& [name, value] : overrides_) {
      config.set(name, value);
      if (on_option) on_option(name, value);
    }
    return config;
  }

  generation_config
  config_loader::load(const declaration& element,
                      diagnostic_reporter& reporter) const {
    return build([&](const std::string& name, const std::string& value) {
      reporter.note("option " + name + " = \"" + value + "\"", element);
    });
  }

} // namespace rbgen
