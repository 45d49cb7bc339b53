#include "distill/context_builder.hh"
#include "distill/loader.hh"
#include "distill/path_resolver.hh"

#include <doctest/doctest.h>

#include <string>

using distill::build_context;
using distill::Config;
using distill::lookup;
using distill::ordered_node;
using distill::RegistryEndpoint;
using distill::internal::to_string_any;

namespace {

  std::string at( const ordered_node& ctx, const std::string& path ) {
    const ordered_node* v = lookup( path, ctx );
    REQUIRE(v != nullptr);
    return to_string_any( *v );
  }

  Config sample_config() {
    Config cfg;
    cfg.variables = distill::parse_yaml(
      "domain: example.com\n"
      "base_dir: /data\n" );
    cfg.path.base = "{{ base_dir }}/{{ domain }}";

    RegistryEndpoint ghcr;
    ghcr.url = "ghcr.io";
    ghcr.namespace_ = "distillery";
    RegistryEndpoint docker;
    docker.url = "docker.io";
    docker.namespace_ = "other";
    cfg.registry.primary.emplace_back( "ghcr", ghcr );
    cfg.registry.primary.emplace_back( "dockerhub", docker );

    cfg.build_type.emplace();
    return cfg;
  }

} // namespace

TEST_CASE("build_context: variables are namespaced and flattened") {
  const ordered_node ctx = build_context( sample_config() );
  CHECK(at(ctx, "variables.domain") == "example.com");
  CHECK(at(ctx, "domain") == "example.com");
  CHECK(at(ctx, "base_dir") == "/data");
}

TEST_CASE("build_context: registry values come from the first primary") {
  const ordered_node ctx = build_context( sample_config() );
  CHECK(at(ctx, "registry_url") == "ghcr.io");
  CHECK(at(ctx, "registry_namespace") == "distillery");
  CHECK(at(ctx, "variables.registry_url") == "ghcr.io");
  CHECK(at(ctx, "variables.registry_namespace") == "distillery");
}

TEST_CASE("build_context: container image basename") {
  Config cfg = sample_config();
  CHECK(at(build_context(cfg), "build.type.container.image_basename")
    == "builda-bar");

  cfg.build_type->container.image_basename = "custom";
  CHECK(at(build_context(cfg), "build.type.container.image_basename")
    == "custom");

  cfg.build_type.reset();
  CHECK(lookup("build", build_context(cfg)) == nullptr);
}

TEST_CASE("build_context: path.base is copied unrendered") {
  const ordered_node ctx = build_context( sample_config() );
  CHECK(at(ctx, "path.base") == "{{ base_dir }}/{{ domain }}");
  CHECK(lookup("path.downloads", ctx) == nullptr);
}

TEST_CASE("build_context: snapshot of the configuration") {
  Config cfg = sample_config();
  const ordered_node ctx = build_context( cfg );
  cfg.variables[ "domain" ] = distill::internal::make_node_from(
    std::string("changed.org") );
  cfg.registry.primary.front().second.url = "quay.io";
  CHECK(at(ctx, "domain") == "example.com");
  CHECK(at(ctx, "registry_url") == "ghcr.io");
}

TEST_CASE("build_context: no variables section") {
  Config cfg;
  cfg.path.base = "/opt";
  const ordered_node ctx = build_context( cfg );
  CHECK(lookup("variables", ctx) == nullptr);
  CHECK(lookup("registry_url", ctx) == nullptr);
  CHECK(at(ctx, "path.base") == "/opt");
}
