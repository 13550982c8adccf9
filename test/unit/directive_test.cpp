#include <rbgen/directive.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace rbgen;

TEST_CASE("directive kinds are identified by exact identity", "[directive]") {
  CHECK(directive_kind_for("rbgen.record_builder") == directive_kind::builder);
  CHECK(directive_kind_for("rbgen.record_builder.include") ==
        directive_kind::builder_include);
  CHECK(directive_kind_for("rbgen.record_interface") ==
        directive_kind::interface);
  CHECK(directive_kind_for("rbgen.record_interface.include") ==
        directive_kind::interface_include);
}

TEST_CASE("near-miss identities are unknown", "[directive]") {
  CHECK(directive_kind_for("") == directive_kind::unknown);
  CHECK(directive_kind_for("record_builder") == directive_kind::unknown);
  CHECK(directive_kind_for("rbgen.record_builder$include") ==
        directive_kind::unknown);
  CHECK(directive_kind_for("rbgen.RecordBuilder") == directive_kind::unknown);
}

TEST_CASE("every supported directive has a known kind", "[directive]") {
  for (auto identity : supported_directives)
    CHECK(directive_kind_for(identity) != directive_kind::unknown);
}

TEST_CASE("is_include", "[directive]") {
  CHECK(is_include(directive_kind::builder_include));
  CHECK(is_include(directive_kind::interface_include));
  CHECK_FALSE(is_include(directive_kind::builder));
  CHECK_FALSE(is_include(directive_kind::interface));
  CHECK_FALSE(is_include(directive_kind::unknown));
}

TEST_CASE("bool_attribute accepts bools and boolean strings", "[directive]") {
  attribute_value yes = true;
  attribute_value no_text = std::string("false");

  CHECK(bool_attribute(&yes, false) == true);
  CHECK(bool_attribute(&no_text, true) == false);
  CHECK(bool_attribute(nullptr, true) == true);
  CHECK(bool_attribute(nullptr, false) == false);
}

TEST_CASE("bool_attribute rejects other values", "[directive]") {
  attribute_value junk = std::string("yes");
  attribute_value upper = std::string("TRUE");
  attribute_value list = type_ref_list{"a.B"};

  CHECK_FALSE(bool_attribute(&junk, true).has_value());
  CHECK_FALSE(bool_attribute(&upper, false).has_value());
  CHECK_FALSE(bool_attribute(&list, false).has_value());
}

TEST_CASE("string_attribute and list_attribute check the held type",
          "[directive]") {
  attribute_value pattern = std::string("*.gen");
  attribute_value list = type_ref_list{"a.B", "a.C"};

  CHECK(string_attribute(&pattern) == "*.gen");
  CHECK_FALSE(string_attribute(&list).has_value());
  CHECK_FALSE(string_attribute(nullptr).has_value());

  REQUIRE(list_attribute(&list) != nullptr);
  CHECK(list_attribute(&list)->size() == 2);
  CHECK(list_attribute(&pattern) == nullptr);
  CHECK(list_attribute(nullptr) == nullptr);
}
