#include <rbgen/decl_model.hpp>
#include <rbgen/generation_config.hpp>
#include <rbgen/xml_tree.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace rbgen;

TEST_CASE("default configuration", "[generation_config]") {
  generation_config config;
  CHECK(config.suffix == "Builder");
  CHECK(config.interface_suffix == "Record");
  CHECK(config.builder_method_name == "builder");
  CHECK(config.copy_method_name == "from");
  CHECK(config.build_method_name == "build");
  CHECK(config.setter_prefix.empty());
  CHECK(config.prefix_enclosing_class_names);
  CHECK(config.file_indent == "  ");
  CHECK(config.file_comment.empty());
}

TEST_CASE("set applies options by name", "[generation_config]") {
  generation_config config;
  config.set("suffix", "Maker");
  config.set("setterPrefix", "with");
  config.set("prefixEnclosingClassNames", "false");
  config.set("fileIndent", "    ");

  CHECK(config.suffix == "Maker");
  CHECK(config.setter_prefix == "with");
  CHECK_FALSE(config.prefix_enclosing_class_names);
  CHECK(config.file_indent == "    ");
}

TEST_CASE("set rejects unknown options and malformed bools",
          "[generation_config]") {
  generation_config config;
  CHECK_THROWS_AS(config.set("nope", "x"), std::runtime_error);
  CHECK_THROWS_AS(config.set("prefixEnclosingClassNames", "yes"),
                  std::runtime_error);
}

TEST_CASE("load reads options in document order", "[generation_config]") {
  auto root = parse_xml(R"(<config xmlns="http://rbgen.dev/config">
  <option name="suffix" value="Maker"/>
  <option name="fileComment" value="do not edit"/>
</config>)");

  std::vector<std::string> seen;
  auto config = generation_config::load(
      root, [&](const std::string& name, const std::string&) {
        seen.push_back(name);
      });

  CHECK(config.suffix == "Maker");
  CHECK(config.file_comment == "do not edit");
  CHECK(seen == std::vector<std::string>{"suffix", "fileComment"});
}

TEST_CASE("load rejects a wrong root or child", "[generation_config]") {
  CHECK_THROWS_AS(generation_config::load(parse_xml("<config/>")),
                  std::runtime_error);
  CHECK_THROWS_AS(
      generation_config::load(parse_xml(
          R"(<config xmlns="http://rbgen.dev/config"><setting/></config>)")),
      std::runtime_error);
  CHECK_THROWS_AS(
      generation_config::load(parse_xml(
          R"(<config xmlns="http://rbgen.dev/config"><option name="suffix"/></config>)")),
      std::runtime_error);
}

TEST_CASE("config_loader without a document yields defaults",
          "[generation_config]") {
  decl_model model;
  collecting_reporter reporter;
  auto& point = model.add("record", "Point");

  config_loader loader;
  CHECK(loader.load(point, reporter) == generation_config{});
  CHECK(reporter.diagnostics().empty());
}

TEST_CASE("config_loader reports one note per applied option",
          "[generation_config]") {
  decl_model model;
  collecting_reporter reporter;
  auto& point = model.add("record", "Point");

  config_loader loader(R"(<config xmlns="http://rbgen.dev/config">
  <option name="suffix" value="Maker"/>
</config>)",
                       {{"setterPrefix", "with"}});

  auto config = loader.load(point, reporter);
  CHECK(config.suffix == "Maker");
  CHECK(config.setter_prefix == "with");
  REQUIRE(reporter.diagnostics().size() == 2);
  CHECK(reporter.count(severity::note) == 2);
  CHECK(reporter.diagnostics()[0].message == "option suffix = \"Maker\"");
  CHECK(reporter.diagnostics()[1].message == "option setterPrefix = \"with\"");
  CHECK(reporter.diagnostics()[0].element == &point);
}

TEST_CASE("config_loader yields a fresh config for every element",
          "[generation_config]") {
  decl_model model;
  collecting_reporter reporter;
  auto& a = model.add("record", "A");
  auto& b = model.add("record", "B");

  config_loader loader("", {{"suffix", "Maker"}});
  auto first = loader.load(a, reporter);
  first.suffix = "Changed";
  auto second = loader.load(b, reporter);
  CHECK(second.suffix == "Maker");
  CHECK(reporter.count(severity::note) == 2);
}

TEST_CASE("overrides win over the document", "[generation_config]") {
  decl_model model;
  collecting_reporter reporter;
  auto& point = model.add("record", "Point");

  config_loader loader(R"(<config xmlns="http://rbgen.dev/config">
  <option name="suffix" value="Maker"/>
</config>)",
                       {{"suffix", "Factory"}});
  CHECK(loader.load(point, reporter).suffix == "Factory");
}

TEST_CASE("config_loader rejects bad input at construction",
          "[generation_config]") {
  CHECK_THROWS_AS(config_loader("<config"), std::runtime_error);
  CHECK_THROWS_AS((config_loader("", {{"bogus", "1"}})), std::runtime_error);
}
