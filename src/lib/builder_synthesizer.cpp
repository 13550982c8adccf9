#include <rbgen/builder_synthesizer.hpp>
#include <rbgen/directive.hpp>
#include <rbgen/naming.hpp>

#include <algorithm>

namespace rbgen {

  namespace {

    std::string
    member_name(const typed_name& component) {
      return "m_" + component.name;
    }

    std::string
    read_component(const record_shape& record, const typed_name& component) {
      std::string expr = "record." + component.name;
      if (record.accessor_components) expr += "()";
      return expr;
    }

  } // namespace

  record_shape
  record_shape_for(const declaration& record) {
    record_shape shape;

    const declaration* current = &record;
    while (current != nullptr && current->kind() != decl_kind::namespace_) {
      shape.type_path.push_back(current->simple_name());
      current = current->enclosing();
    }
    std::reverse(shape.type_path.begin(), shape.type_path.end());

    if (current != nullptr) shape.namespace_name = current->qualified_name();
    shape.components = record.members();
    shape.header = record.header();
    return shape;
  }

  std::string
  builder_synthesizer::builder_name(const record_shape& record) const {
    std::string name;
    if (config_.prefix_enclosing_class_names) {
      for (const auto& part : record.type_path)
        name += part;
    } else if (!record.type_path.empty()) {
      name = record.type_path.back();
    }
    return name + config_.suffix;
  }

  synthesized_artifact
  builder_synthesizer::synthesize(const record_shape& record,
                                  const std::string& namespace_name) const {
    const std::string name = builder_name(record);
    const std::string record_type =
        cpp_qualified_type(record.namespace_name, record.type_path);

    cpp_class builder;
    builder.name = name;
    builder.generate_equality = true;
    builder.generated_by = std::string(record_builder_directive);

    cpp_function ctor;
    ctor.name = name;
    ctor.is_defaulted = true;
    builder.functions.push_back(std::move(ctor));

    cpp_function make;
    make.return_type = name;
    make.name = config_.builder_method_name;
    make.is_static = true;
    make.body.push_back("return " + name + "();");
    builder.functions.push_back(std::move(make));

    cpp_function copy;
    copy.return_type = name;
    copy.name = config_.copy_method_name;
    copy.parameters = "const " + record_type + "& record";
    copy.is_static = true;
    copy.body.push_back(name + " result;");
    for (const auto& c : record.components) {
      copy.body.push_back("result." + member_name(c) + " = " +
                          read_component(record, c) + ";");
    }
    copy.body.push_back("return result;");
    builder.functions.push_back(std::move(copy));

    for (const auto& c : record.components) {
      const std::string identifier = to_cpp_identifier(c.name);

      cpp_function setter;
      setter.return_type = name + "&";
      setter.name = prefixed_name(config_.setter_prefix, identifier);
      setter.parameters = c.type + " value";
      setter.body.push_back(member_name(c) + " = std::move(value);");
      setter.body.push_back("return *this;");
      builder.functions.push_back(std::move(setter));

      cpp_function getter;
      getter.return_type = "const " + c.type + "&";
      getter.name = identifier;
      getter.qualifiers = "const";
      getter.body.push_back("return " + member_name(c) + ";");
      builder.functions.push_back(std::move(getter));
    }

    std::string arguments;
    for (const auto& c : record.components) {
      if (!arguments.empty()) arguments += ", ";
      arguments += member_name(c);
    }

    cpp_function build;
    build.return_type = record_type;
    build.name = config_.build_method_name;
    build.qualifiers = "const";
    build.body.push_back("return " + record_type + "{" + arguments + "};");
    builder.functions.push_back(std::move(build));

    for (const auto& c : record.components)
      builder.fields.push_back({c.type, member_name(c), "{}"});

    synthesized_artifact artifact;
    artifact.namespace_name = namespace_name;
    artifact.simple_name = name;
    artifact.file.filename =
        source_path_for(qualified_name(namespace_name, name));
    artifact.file.includes.push_back({"<utility>"});
    if (!record.header.empty())
      artifact.file.includes.push_back({"\"" + record.header + "\""});
    artifact.file.namespaces.push_back(
        {cpp_namespace_for(namespace_name), {std::move(builder)}});
    return artifact;
  }

} // namespace rbgen
