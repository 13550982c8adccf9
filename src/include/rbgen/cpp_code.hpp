#pragma once

#include <string>
#include <vector>

namespace rbgen {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_field {
    std::string type;
    std::string name;
    std::string default_value;

    bool
    operator==(const cpp_field&) const = default;
  };

  // A member function. An empty return_type denotes a constructor.
  struct cpp_function {
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string qualifiers;
    std::string initializers;
    std::vector<std::string> body;
    bool is_static = false;
    bool is_defaulted = false;

    bool
    operator==(const cpp_function&) const = default;
  };

  // Functions are rendered in a public section, fields in a private one.
  struct cpp_class {
    std::string name;
    std::vector<std::string> bases;
    bool is_final = false;
    std::vector<cpp_function> functions;
    std::vector<cpp_field> fields;
    bool generate_equality = false;
    // Identity of the directive that produced the class, rendered as a
    // marker comment above it. Empty for no marker.
    std::string generated_by;

    bool
    operator==(const cpp_class&) const = default;
  };

  // An empty name places the classes at global scope.
  struct cpp_namespace {
    std::string name;
    std::vector<cpp_class> classes;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  struct cpp_file {
    std::string filename;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;

    bool
    operator==(const cpp_file&) const = default;
  };

  // A generated type and where it goes. `namespace_name` is dotted, as in
  // the symbol model.
  struct synthesized_artifact {
    std::string namespace_name;
    std::string simple_name;
    cpp_file file;
  };

} // namespace rbgen
