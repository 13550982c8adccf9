#include <rbgen/xml_tree.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace rbgen;

TEST_CASE("single empty element", "[xml_tree]") {
  auto root = parse_xml("<root/>");
  CHECK(root.name == "root");
  CHECK(root.namespace_uri.empty());
  CHECK(root.children.empty());
  CHECK(root.line == 1);
}

TEST_CASE("default namespace is split from the local name", "[xml_tree]") {
  auto root = parse_xml(R"(<model xmlns="http://rbgen.dev/model"/>)");
  CHECK(root.name == "model");
  CHECK(root.namespace_uri == "http://rbgen.dev/model");
}

TEST_CASE("attributes are looked up by local name", "[xml_tree]") {
  auto root = parse_xml(R"(<option name="fileIndent" value="    "/>)");
  REQUIRE(root.attribute("name") != nullptr);
  CHECK(*root.attribute("name") == "fileIndent");
  CHECK(*root.attribute("value") == "    ");
  CHECK(root.attribute("missing") == nullptr);
}

TEST_CASE("nested children keep document order", "[xml_tree]") {
  auto root = parse_xml(R"(<a>
  <b id="1"><c/></b>
  <b id="2"/>
  <d/>
</a>)");
  REQUIRE(root.children.size() == 3);
  CHECK(root.children[0].name == "b");
  CHECK(*root.children[0].attribute("id") == "1");
  REQUIRE(root.children[0].children.size() == 1);
  CHECK(root.children[0].children[0].name == "c");
  CHECK(*root.children[1].attribute("id") == "2");
  CHECK(root.children[2].name == "d");
  CHECK(root.children[2].line == 4);
}

TEST_CASE("character data is collected", "[xml_tree]") {
  auto root = parse_xml("<a>hello <b/>world</a>");
  CHECK(root.text == "hello world");
}

TEST_CASE("required_attribute throws with the element and line",
          "[xml_tree]") {
  auto root = parse_xml("<a>\n<b/>\n</a>");
  try {
    (void)root.children[0].required_attribute("name");
    FAIL("expected std::runtime_error");
  } catch (const std::runtime_error& e) {
    std::string what = e.what();
    CHECK(what.find("line 2") != std::string::npos);
    CHECK(what.find("<b>") != std::string::npos);
    CHECK(what.find("'name'") != std::string::npos);
  }
}

TEST_CASE("malformed XML throws", "[xml_tree]") {
  CHECK_THROWS_AS(parse_xml("<a><b></a>"), std::runtime_error);
}

TEST_CASE("empty input throws", "[xml_tree]") {
  CHECK_THROWS_AS(parse_xml(""), std::runtime_error);
}
