#include <rbgen/directive.hpp>
#include <rbgen/interface_synthesizer.hpp>
#include <rbgen/naming.hpp>

#include <sstream>

namespace rbgen {

  bool
  interface_synthesizer::validate(diagnostic_reporter& reporter) const {
    if (interface_.members().empty()) {
      reporter.error(
          "record_interface requires at least one accessor method.",
          interface_);
      return false;
    }
    return true;
  }

  std::string
  interface_synthesizer::value_type_name() const {
    return interface_.simple_name() + config_.interface_suffix;
  }

  synthesized_artifact
  interface_synthesizer::implementation_class() const {
    const std::string name = value_type_name();
    const auto iface_shape = record_shape_for(interface_);

    cpp_class impl;
    impl.name = name;
    impl.is_final = true;
    impl.bases.push_back(
        "public " +
        cpp_qualified_type(iface_shape.namespace_name, iface_shape.type_path));
    impl.generated_by = std::string(record_interface_directive);

    cpp_function ctor;
    ctor.name = name;
    for (const auto& m : interface_.members()) {
      const std::string param = to_cpp_identifier(m.name);
      if (!ctor.parameters.empty()) {
        ctor.parameters += ", ";
        ctor.initializers += ", ";
      }
      ctor.parameters += m.type + " " + param;
      ctor.initializers += "m_" + m.name + "(std::move(" + param + "))";
    }
    impl.functions.push_back(std::move(ctor));

    for (const auto& m : interface_.members()) {
      cpp_function accessor;
      accessor.return_type = m.type;
      accessor.name = m.name;
      accessor.qualifiers = "const override";
      accessor.body.push_back("return m_" + m.name + ";");
      impl.functions.push_back(std::move(accessor));

      impl.fields.push_back({m.type, "m_" + m.name, ""});
    }

    synthesized_artifact artifact;
    artifact.namespace_name = namespace_name_;
    artifact.simple_name = name;
    artifact.file.filename =
        source_path_for(qualified_name(namespace_name_, name));
    artifact.file.includes.push_back({"<utility>"});
    if (!interface_.header().empty())
      artifact.file.includes.push_back({"\"" + interface_.header() + "\""});
    artifact.file.namespaces.push_back(
        {cpp_namespace_for(namespace_name_), {std::move(impl)}});
    return artifact;
  }

  record_shape
  interface_synthesizer::value_type_shape() const {
    const std::string name = value_type_name();

    record_shape shape;
    shape.namespace_name = namespace_name_;
    shape.type_path.push_back(name);
    shape.components = interface_.members();
    shape.header = source_path_for(qualified_name(namespace_name_, name));
    shape.accessor_components = true;
    return shape;
  }

  std::string
  to_value_type(std::string_view class_source) {
    std::istringstream in{std::string(class_source)};
    std::string result;
    std::string line;

    while (std::getline(in, line)) {
      if (line == "public:" || line == "private:" || line == "protected:")
        continue;
      if (line.starts_with("class ")) line.replace(0, 5, "struct");
      result += line;
      result += '\n';
    }
    return result;
  }

} // namespace rbgen
