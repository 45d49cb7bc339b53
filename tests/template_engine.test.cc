#include "distill/loader.hh"
#include "distill/template_engine.hh"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

using distill::ordered_node;
using distill::parse_yaml;
using distill::TemplateEngine;
using distill::TemplateError;
using distill::internal::to_string_any;

namespace {

  // Render and return the error kind, failing the test if nothing is thrown
  TemplateError::Details render_error( const TemplateEngine& engine,
    const std::string& tmpl, const ordered_node& ctx,
    const ordered_node* item = nullptr )
  {
    try {
      engine.render( tmpl, ctx, item );
    }
    catch ( const TemplateError& e ) {
      return e.info();
    }
    FAIL("expected a TemplateError for: " + tmpl);
    return {};
  }

} // namespace

TEST_CASE("template_engine: plain text converges on the first pass") {
  TemplateEngine engine;
  const ordered_node ctx = ordered_node::mapping();
  int passes = 0;
  CHECK(engine.render("/opt/distill", ctx, nullptr, &passes)
    == "/opt/distill");
  CHECK(passes == 1);
  CHECK(engine.render("", ctx, nullptr, &passes).empty());
  CHECK(passes == 1);
  CHECK(engine.render("a } b { c", ctx) == "a } b { c");
}

TEST_CASE("template_engine: adjacent expressions") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "x: A\nyy: BB\n" );
  CHECK(engine.render("{{x}}-{{yy}}", ctx) == "A-BB");
  CHECK(engine.render("{{ x }}{{ yy }}{{ x }}", ctx) == "ABBA");
}

TEST_CASE("template_engine: a chain of depth d needs d+1 passes") {
  const ordered_node ctx = parse_yaml(
    "a: \"{{ b }}\"\n"
    "b: \"{{ c }}\"\n"
    "c: end\n" );

  TemplateEngine engine( 4 );
  int passes = 0;
  CHECK(engine.render("{{ a }}", ctx, nullptr, &passes) == "end");
  CHECK(passes == 4);

  TemplateEngine short_engine( 3 );
  const TemplateError::Details d = render_error( short_engine, "{{ a }}",
    ctx );
  CHECK(d.what == TemplateError::Kind::NonConvergence);
  CHECK(d.pass == 3);
  CHECK(d.last_result == "end");
}

TEST_CASE("template_engine: rendering is idempotent") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml(
    "base: /data\n"
    "domain: example.com\n"
    "root: \"{{ base }}/{{ domain }}\"\n" );
  const std::string once = engine.render( "{{ root }}/src", ctx );
  CHECK(once == "/data/example.com/src");

  int passes = 0;
  CHECK(engine.render(once, ctx, nullptr, &passes) == once);
  CHECK(passes == 1);
}

TEST_CASE("template_engine: undefined variable is fatal") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "a:\n  b: 1\n" );

  CHECK(engine.render("{{ a.b }}", ctx) == "1");

  const TemplateError::Details d = render_error( engine, "{{ a.c }}", ctx );
  CHECK(d.what == TemplateError::Kind::UndefinedVariable);
  CHECK(d.pass == 1);
  CHECK(d.undefined_path == "a.c");
  CHECK(d.undefined_root == "a");
  CHECK(d.template_snippet == "{{ a.c }}");
  REQUIRE(d.available_keys.size() == 1);
  CHECK(d.available_keys.front() == "a");

  CHECK_THROWS_AS(engine.render("{{ missing }}", ctx), TemplateError);
  CHECK_THROWS_AS(engine.render("{{ missing }}", ctx), distill::Error);
}

TEST_CASE("template_engine: error message carries the diagnosis") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "zeta: 1\nalpha: 2\n" );
  try {
    engine.render( "pre {{ nope }} post", ctx );
    FAIL("expected a TemplateError");
  }
  catch ( const TemplateError& e ) {
    const std::string msg = e.what();
    CHECK(msg.find("Template undefined variable at pass 1") == 0);
    CHECK(msg.find("Template: pre {{ nope }} post") != std::string::npos);
    CHECK(msg.find("Context keys: [alpha, zeta]") != std::string::npos);
  }
}

TEST_CASE("template_engine: undefined variable in a later pass") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "a: \"{{ ghost }}\"\n" );
  const TemplateError::Details d = render_error( engine, "x/{{ a }}", ctx );
  CHECK(d.what == TemplateError::Kind::UndefinedVariable);
  CHECK(d.pass == 2);
  CHECK(d.last_result == "x/{{ ghost }}");
  CHECK(d.undefined_root == "ghost");
}

TEST_CASE("template_engine: self reference does not converge") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "self: \"{{ self }}\"\n" );
  const TemplateError::Details d = render_error( engine, "{{ self }}", ctx );
  CHECK(d.what == TemplateError::Kind::NonConvergence);
  CHECK(d.pass == TemplateEngine::DEFAULT_MAX_PASSES);
  CHECK(d.last_result == "{{ self }}");
}

TEST_CASE("template_engine: mutual reference does not converge") {
  TemplateEngine engine( 6 );
  const ordered_node ctx = parse_yaml(
    "ping: \"{{ pong }}\"\n"
    "pong: \"{{ ping }}\"\n" );
  const TemplateError::Details d = render_error( engine, "{{ ping }}", ctx );
  CHECK(d.what == TemplateError::Kind::NonConvergence);
  CHECK(d.pass == 6);
}

TEST_CASE("template_engine: malformed expressions are syntax errors") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "a:\n  b: 1\n" );

  CHECK(render_error(engine, "{{ }}", ctx).what
    == TemplateError::Kind::Syntax);
  CHECK(render_error(engine, "prefix {{ a.b", ctx).what
    == TemplateError::Kind::Syntax);
  CHECK(render_error(engine, "{{ a..b }}", ctx).what
    == TemplateError::Kind::Syntax);
  CHECK(render_error(engine, "{{ a.b + 1 }}", ctx).what
    == TemplateError::Kind::Syntax);
  CHECK(render_error(engine, "{{ 0.a }}", ctx).what
    == TemplateError::Kind::Syntax);
}

TEST_CASE("template_engine: subscripts and numeric segments") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml(
    "mirrors:\n"
    "  - https://a.example\n"
    "  - https://b.example\n"
    "labels:\n"
    "  \"org key\": distill\n"
    "build-id: 42\n" );
  CHECK(engine.render("{{ mirrors[1] }}", ctx) == "https://b.example");
  CHECK(engine.render("{{ mirrors.0 }}", ctx) == "https://a.example");
  CHECK(engine.render("{{ labels['org key'] }}", ctx) == "distill");
  CHECK(engine.render("{{ labels[\"org key\"] }}", ctx) == "distill");
  CHECK(engine.render("{{ build-id }}", ctx) == "42");
  CHECK(render_error(engine, "{{ mirrors[2] }}", ctx).what
    == TemplateError::Kind::UndefinedVariable);
}

TEST_CASE("template_engine: item scope is bound as this") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "registry: ghcr.io\n" );
  const ordered_node item = parse_yaml(
    "name: stable\n"
    "metadata:\n"
    "  alpine_version: \"3.19\"\n" );

  CHECK(engine.render("{{ registry }}/{{ this.name }}:{{ "
    "this.metadata.alpine_version }}", ctx, &item)
    == "ghcr.io/stable:3.19");
}

TEST_CASE("template_engine: this never falls back to the context") {
  TemplateEngine engine;

  const ordered_node ctx = parse_yaml( "this:\n  name: global\n" );
  const TemplateError::Details d = render_error( engine, "{{ this.name }}",
    ctx );
  CHECK(d.what == TemplateError::Kind::UndefinedVariable);
  CHECK(d.undefined_root == "this");

  // Item keys are not promoted to top-level names either
  const ordered_node empty = ordered_node::mapping();
  const ordered_node item = parse_yaml( "name: stable\n" );
  CHECK(render_error(engine, "{{ name }}", empty, &item).what
    == TemplateError::Kind::UndefinedVariable);

  const TemplateError::Details missing = render_error( engine,
    "{{ this.tag }}", empty, &item );
  CHECK(missing.undefined_root == "this");
  REQUIRE(missing.available_keys.size() == 1);
  CHECK(missing.available_keys.front() == "this");
}

TEST_CASE("template_engine: scalar values render as text") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml(
    "jobs: 8\n"
    "enabled: false\n"
    "unset: null\n" );
  CHECK(engine.render("-j{{ jobs }}", ctx) == "-j8");
  CHECK(engine.render("{{ enabled }}", ctx) == "false");
  CHECK(engine.render("{{ unset }}", ctx) == "null");
}

TEST_CASE("template_engine: structure-preserving renders") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "base: /srv\n" );
  const ordered_node tree = parse_yaml(
    "downloads: \"{{ base }}/downloads\"\n"
    "list:\n"
    "  - \"{{ base }}/a\"\n"
    "  - 7\n"
    "keep: true\n" );

  const ordered_node out = engine.render_node( tree, ctx );
  REQUIRE(out.is_mapping());
  CHECK(to_string_any(out.at("downloads")) == "/srv/downloads");
  REQUIRE(out.at("list").is_sequence());
  CHECK(out.at("list").size() == 2);
  CHECK(to_string_any(out.at("list").at(0)) == "/srv/a");
  CHECK(out.at("list").at(1).is_integer());
  CHECK(out.at("keep").is_boolean());

  CHECK_THROWS_AS(engine.render_mapping(tree.at("list"), ctx),
    std::invalid_argument);
  CHECK_THROWS_AS(engine.render_sequence(tree, ctx), std::invalid_argument);
}

TEST_CASE("template_engine: rendered mappings keep non-string keys") {
  TemplateEngine engine;
  const ordered_node ctx = parse_yaml( "jobs: 4\n" );
  const ordered_node tree = parse_yaml(
    "8080: \"-j{{ jobs }}\"\n"
    "false: off\n"
    "name: x\n" );

  const ordered_node out = engine.render_mapping( tree, ctx );
  std::vector< ordered_node > keys;
  for ( const auto& [mk, mv] : out.map_items() ) keys.push_back( mk );
  REQUIRE(keys.size() == 3);
  CHECK(keys[0].is_integer());
  CHECK(keys[1].is_boolean());
  CHECK(keys[2].is_string());
  CHECK(to_string_any(out.at(keys[0])) == "-j4");
}

TEST_CASE("template_engine: has_template_vars") {
  CHECK(TemplateEngine::has_template_vars("{{ a }}"));
  CHECK(TemplateEngine::has_template_vars("x{{a}}y"));
  CHECK_FALSE(TemplateEngine::has_template_vars("/opt/plain"));
  CHECK_FALSE(TemplateEngine::has_template_vars("{{ open only"));
  CHECK_FALSE(TemplateEngine::has_template_vars("}} {{"));
}

TEST_CASE("template_engine: max_passes must be positive") {
  CHECK_THROWS_AS(TemplateEngine(0), std::invalid_argument);
  CHECK_THROWS_AS(TemplateEngine(-2), std::invalid_argument);
  CHECK(TemplateEngine(1).max_passes() == 1);
}
