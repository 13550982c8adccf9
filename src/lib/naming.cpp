#include <rbgen/naming.hpp>

#include <unordered_set>

namespace rbgen {

  namespace {

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_identifier_start(char c) {
      return is_lower(c) || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool
    is_identifier_char(char c) {
      return is_identifier_start(c) || (c >= '0' && c <= '9');
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    const std::unordered_set<std::string>&
    cpp_keywords() {
      static const std::unordered_set<std::string> keywords = {
          "alignas",       "alignof",     "and",
          "and_eq",        "asm",         "auto",
          "bitand",        "bitor",       "bool",
          "break",         "case",        "catch",
          "char",          "char8_t",     "char16_t",
          "char32_t",      "class",       "compl",
          "concept",       "const",       "consteval",
          "constexpr",     "constinit",   "const_cast",
          "continue",      "co_await",    "co_return",
          "co_yield",      "decltype",    "default",
          "delete",        "do",          "double",
          "dynamic_cast",  "else",        "enum",
          "explicit",      "export",      "extern",
          "false",         "float",       "for",
          "friend",        "goto",        "if",
          "inline",        "int",         "long",
          "mutable",       "namespace",   "new",
          "noexcept",      "not",         "not_eq",
          "nullptr",       "operator",    "or",
          "or_eq",         "private",     "protected",
          "public",        "register",    "reinterpret_cast",
          "requires",      "return",      "short",
          "signed",        "sizeof",      "static",
          "static_assert", "static_cast", "struct",
          "switch",        "template",    "this",
          "thread_local",  "throw",       "true",
          "try",           "typedef",     "typeid",
          "typename",      "union",       "unsigned",
          "using",         "virtual",     "void",
          "volatile",      "wchar_t",     "while",
          "xor",           "xor_eq",
      };
      return keywords;
    }

  } // namespace

  std::string
  replace_all(std::string_view text, std::string_view from,
              std::string_view to) {
    if (from.empty()) return std::string(text);

    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (true) {
      auto found = text.find(from, pos);
      if (found == std::string_view::npos) break;
      result.append(text.substr(pos, found - pos));
      result.append(to);
      pos = found + from.size();
    }
    result.append(text.substr(pos));
    return result;
  }

  std::string
  qualified_name(std::string_view namespace_name,
                 std::string_view simple_name) {
    if (namespace_name.empty()) return std::string(simple_name);
    std::string result(namespace_name);
    result += '.';
    result += simple_name;
    return result;
  }

  std::string
  cpp_namespace_for(std::string_view namespace_name) {
    return replace_all(namespace_name, ".", "::");
  }

  std::string
  cpp_qualified_type(std::string_view namespace_name,
                     const std::vector<std::string>& type_path) {
    std::string result;
    if (!namespace_name.empty()) {
      result += "::";
      result += cpp_namespace_for(namespace_name);
    }
    for (const auto& part : type_path) {
      result += "::";
      result += part;
    }
    return result;
  }

  bool
  is_qualified_identifier(std::string_view name) {
    std::size_t start = 0;
    while (true) {
      auto end = name.find('.', start);
      auto segment = name.substr(
          start, end == std::string_view::npos ? std::string_view::npos
                                               : end - start);
      if (segment.empty() || !is_identifier_start(segment.front()))
        return false;
      for (char c : segment) {
        if (!is_identifier_char(c)) return false;
      }
      if (end == std::string_view::npos) return true;
      start = end + 1;
    }
  }

  std::string
  source_path_for(std::string_view fully_qualified_name) {
    return replace_all(fully_qualified_name, ".", "/") + ".hpp";
  }

  std::string
  to_cpp_identifier(std::string_view name) {
    std::string result(name);
    if (cpp_keywords().count(result)) result += '_';
    return result;
  }

  std::string
  prefixed_name(std::string_view prefix, std::string_view name) {
    if (prefix.empty() || name.empty()) return std::string(name);
    std::string result(prefix);
    result += to_upper(name.front());
    result.append(name.substr(1));
    return result;
  }

} // namespace rbgen
