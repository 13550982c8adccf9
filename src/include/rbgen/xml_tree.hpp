#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rbgen {

  // An element of a parsed XML document. Character data between child
  // elements is concatenated into `text`.
  struct xml_node {
    std::string namespace_uri;
    std::string name;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<xml_node> children;
    std::string text;
    std::size_t line = 0;

    const std::string*
    attribute(std::string_view attr_name) const;

    // Throws std::runtime_error naming the element and line if absent.
    const std::string&
    required_attribute(std::string_view attr_name) const;
  };

  // Parses a whole document with expat. Throws std::runtime_error on
  // malformed input.
  xml_node
  parse_xml(std::string_view xml);

} // namespace rbgen
