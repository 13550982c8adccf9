#include <rbgen/cpp_writer.hpp>

#include <sstream>

namespace rbgen {

  namespace {

    void
    write_file_comment(std::ostream& os, const std::string& comment) {
      if (comment.empty()) return;

      std::istringstream lines(comment);
      std::string line;
      while (std::getline(lines, line)) {
        if (line.empty())
          os << "//\n";
        else
          os << "// " << line << '\n';
      }
      os << '\n';
    }

    void
    write_includes(std::ostream& os, const std::vector<cpp_include>& includes) {
      if (includes.empty()) return;

      // Partition into system (<...>) and local ("...") includes
      std::vector<const cpp_include*> system_includes;
      std::vector<const cpp_include*> local_includes;

      for (const auto& inc : includes) {
        if (!inc.path.empty() && inc.path.front() == '<')
          system_includes.push_back(&inc);
        else
          local_includes.push_back(&inc);
      }

      os << '\n';

      for (const auto* inc : system_includes)
        os << "#include " << inc->path << '\n';

      if (!system_includes.empty() && !local_includes.empty()) os << '\n';

      for (const auto* inc : local_includes)
        os << "#include " << inc->path << '\n';
    }

    void
    write_field(std::ostream& os, const cpp_field& field,
                const std::string& indent) {
      os << indent << field.type << ' ' << field.name;
      if (!field.default_value.empty()) os << " = " << field.default_value;
      os << ";\n";
    }

    void
    write_function(std::ostream& os, const cpp_function& f,
                   const std::string& indent) {
      os << indent;
      if (f.is_static) os << "static ";
      if (!f.return_type.empty()) os << f.return_type << ' ';
      os << f.name << '(' << f.parameters << ')';
      if (!f.qualifiers.empty()) os << ' ' << f.qualifiers;

      if (f.is_defaulted) {
        os << " = default;\n";
        return;
      }

      if (!f.initializers.empty()) os << " : " << f.initializers;

      if (f.body.empty()) {
        os << " {}\n";
        return;
      }

      os << " {\n";
      for (const auto& line : f.body)
        os << indent << indent << line << '\n';
      os << indent << "}\n";
    }

    void
    write_class(std::ostream& os, const cpp_class& c,
                const std::string& indent) {
      if (!c.generated_by.empty())
        os << generated_marker << ' ' << c.generated_by << '\n';

      os << "class " << c.name;
      if (c.is_final) os << " final";
      if (!c.bases.empty()) {
        os << " : ";
        for (std::size_t i = 0; i < c.bases.size(); ++i) {
          if (i != 0) os << ", ";
          os << c.bases[i];
        }
      }

      bool has_public = !c.functions.empty() || c.generate_equality;
      if (!has_public && c.fields.empty()) {
        os << " {};\n";
        return;
      }

      os << " {\n";

      if (has_public) {
        os << "public:\n";
        for (const auto& f : c.functions)
          write_function(os, f, indent);
        if (c.generate_equality) {
          os << indent << "bool operator==(const " << c.name
             << "&) const = default;\n";
        }
      }

      if (!c.fields.empty()) {
        if (has_public) os << '\n';
        os << "private:\n";
        for (const auto& field : c.fields)
          write_field(os, field, indent);
      }

      os << "};\n";
    }

    void
    write_namespace(std::ostream& os, const cpp_namespace& ns,
                    const std::string& indent) {
      if (ns.name.empty()) {
        for (const auto& c : ns.classes) {
          os << '\n';
          write_class(os, c, indent);
        }
        return;
      }

      os << "\nnamespace " << ns.name << " {\n";
      for (const auto& c : ns.classes) {
        os << '\n';
        write_class(os, c, indent);
      }
      os << "\n} // namespace " << ns.name << '\n';
    }

  } // namespace

  std::string
  cpp_writer::write(const cpp_file& file) const {
    return write(file, write_options{});
  }

  std::string
  cpp_writer::write(const cpp_file& file, const write_options& opts) const {
    std::ostringstream os;
    write_file_comment(os, opts.file_comment);
    os << "#pragma once\n";
    write_includes(os, file.includes);
    for (const auto& ns : file.namespaces)
      write_namespace(os, ns, opts.indent);
    return os.str();
  }

} // namespace rbgen
