#include <rbgen/artifact_emitter.hpp>
#include <rbgen/decl_model.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace rbgen;

namespace {

  synthesized_artifact
  make_artifact(const std::string& ns, const std::string& name) {
    cpp_class c;
    c.name = name;
    c.generated_by = "rbgen.record_interface";
    cpp_function get;
    get.return_type = "int";
    get.name = "get";
    get.qualifiers = "const";
    get.body = {"return 1;"};
    c.functions.push_back(get);

    synthesized_artifact artifact;
    artifact.namespace_name = ns;
    artifact.simple_name = name;
    artifact.file.filename = name + ".hpp";
    artifact.file.namespaces.push_back({ns, {std::move(c)}});
    return artifact;
  }

  struct fixture {
    decl_model model;
    declaration& origin = model.add("record", "Point");
    memory_sink sink;
    collecting_reporter reporter;
    artifact_emitter emitter{sink, reporter};
    generation_config config;
  };

} // namespace

TEST_CASE("emit commits under the fully qualified name", "[artifact_emitter]") {
  fixture f;
  CHECK(f.emitter.emit(f.origin, make_artifact("gen", "Thing"), f.config));

  auto* text = f.sink.find("gen.Thing");
  REQUIRE(text != nullptr);
  CHECK(text->find("// @generated rbgen.record_interface\n") !=
        std::string::npos);
  CHECK(text->find("class Thing {") != std::string::npos);
  CHECK(f.reporter.diagnostics().empty());
}

TEST_CASE("emit in the unnamed namespace uses the simple name",
          "[artifact_emitter]") {
  fixture f;
  CHECK(f.emitter.emit(f.origin, make_artifact("", "Thing"), f.config));
  CHECK(f.sink.find("Thing") != nullptr);
}

TEST_CASE("render applies indent and file comment", "[artifact_emitter]") {
  generation_config config;
  config.file_indent = "    ";
  config.file_comment = "generated";

  auto text = render(make_artifact("gen", "Thing").file, config);
  CHECK(text.starts_with("// generated\n\n#pragma once\n"));
  CHECK(text.find("\n    int get() const {\n        return 1;\n    }\n") !=
        std::string::npos);
}

TEST_CASE("strip_generated_marker removes the marker above a class head",
          "[artifact_emitter]") {
  CHECK(strip_generated_marker("a\n// @generated x\nclass A {};\n") ==
        "a\nclass A {};\n");
  CHECK(strip_generated_marker("// @generated x\n\n// @generated y\nclass B {};\n") ==
        "// @generated x\n\nclass B {};\n");
  CHECK(strip_generated_marker("no marker\n") == "no marker\n");
  CHECK(strip_generated_marker("// @generated x\nint y;\n") ==
        "// @generated x\nint y;\n");
  CHECK(strip_generated_marker("x // @generated y\nclass A {};\n") ==
        "x // @generated y\nclass A {};\n");
}

TEST_CASE("a file comment that looks like a marker is kept",
          "[artifact_emitter]") {
  fixture f;
  f.config.file_comment = "@generated file, do not edit";

  std::string seen;
  CHECK(f.emitter.emit_rewritten(f.origin, make_artifact("gen", "Thing"),
                                 f.config, [&](std::string_view source) {
                                   seen = std::string(source);
                                   return seen;
                                 }));

  CHECK(seen.starts_with("// @generated file, do not edit\n\n#pragma once\n"));
  CHECK(seen.find("// @generated rbgen.record_interface") == std::string::npos);
  CHECK(seen.find("\nclass Thing {") != std::string::npos);
}

TEST_CASE("emit_rewritten commits the rewritten text", "[artifact_emitter]") {
  fixture f;
  std::string seen;
  auto ok = f.emitter.emit_rewritten(
      f.origin, make_artifact("gen", "Thing"), f.config,
      [&](std::string_view source) {
        seen = std::string(source);
        return std::string("rewritten");
      });

  CHECK(ok);
  CHECK(seen.find("@generated") == std::string::npos);
  CHECK(seen.find("class Thing {") != std::string::npos);
  REQUIRE(f.sink.find("gen.Thing") != nullptr);
  CHECK(*f.sink.find("gen.Thing") == "rewritten");
}

TEST_CASE("sink failure becomes one error at the origin", "[artifact_emitter]") {
  fixture f;
  f.sink.fail_on("gen.Thing", "disk full");

  CHECK_FALSE(f.emitter.emit(f.origin, make_artifact("gen", "Thing"), f.config));
  REQUIRE(f.reporter.diagnostics().size() == 1);
  CHECK(f.reporter.diagnostics()[0].level == severity::error);
  CHECK(f.reporter.diagnostics()[0].message ==
        "Could not create source file: disk full");
  CHECK(f.reporter.diagnostics()[0].element == &f.origin);
  CHECK(f.sink.files().empty());
}

TEST_CASE("sink failure without detail has no trailing colon",
          "[artifact_emitter]") {
  fixture f;
  f.sink.fail_on("gen.Thing");

  CHECK_FALSE(f.emitter.emit(f.origin, make_artifact("gen", "Thing"), f.config));
  REQUIRE(f.reporter.diagnostics().size() == 1);
  CHECK(f.reporter.diagnostics()[0].message == "Could not create source file");
}

TEST_CASE("emitting the same name twice reports the second",
          "[artifact_emitter]") {
  fixture f;
  CHECK(f.emitter.emit(f.origin, make_artifact("gen", "Thing"), f.config));
  CHECK_FALSE(f.emitter.emit(f.origin, make_artifact("gen", "Thing"), f.config));
  REQUIRE(f.reporter.count(severity::error) == 1);
  CHECK(f.reporter.diagnostics()[0].message.starts_with(
      "Could not create source file: attempt to recreate file"));
}
