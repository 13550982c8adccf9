#pragma once

#include <rbgen/cpp_code.hpp>

#include <string>
#include <string_view>

namespace rbgen {

  inline constexpr std::string_view generated_marker = "// @generated";

  struct write_options {
    std::string indent = "  ";
    // Emitted as line comments ahead of everything else when non-empty.
    std::string file_comment;
  };

  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;

    std::string
    write(const cpp_file& file, const write_options& opts) const;
  };

} // namespace rbgen
