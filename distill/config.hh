// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "distill/diagnostics.hh"
#include "distill/errors.hh"
#include "distill/node.hh"

namespace distill {

  // Entries of an authored mapping, in authored order. The first entry of a
  // registry/repository mapping is the "primary" one.
  template < typename T >
  using NamedEntries = std::vector< std::pair< std::string, T > >;

  enum class BuildRuntime { Docker, Podman };
  enum class PullPolicy { Always, IfNotPresent, Never };
  enum class RegistryStrategy {
    PrimaryOnly, PrimaryWithFallback, RoundRobin
  };
  enum class LogOutput { Console, File };

  // Unprivileged account used inside build containers
  struct BuildUserConfig {
    std::string name;
    std::string group;
    std::int64_t uid = 0; // >= 1000
    std::int64_t gid = 0; // >= 1000
    std::string homedir;
    std::string shell = "/bin/bash";
  };

  struct TmpfsConfig {
    bool enabled = true;
    std::string size = "2g";
    std::string mount_point = "/tmp";
  };

  struct FakerootConfig {
    bool enabled = true;
  };

  struct SecurityConfig {
    bool no_new_privileges = true;
    std::vector< std::string > drop_capabilities{ "ALL" };
    std::vector< std::string > add_capabilities;
  };

  struct RuntimeConfig {
    TmpfsConfig tmpfs;
    FakerootConfig fakeroot;
    SecurityConfig security;
  };

  struct GeneratedPaths {
    std::string libraries;
    std::string applications; // may keep a per-package placeholder
  };

  struct PathConfig {
    std::string base;
    std::string downloads;
    std::string sources;
    std::string build;
    GeneratedPaths generated;
  };

  struct VariantMetadata {
    std::string alpine_version;
    std::string musl_version;
    std::string kernel;
    std::string arch = "amd64";

    // Mapping form exposed to templates as this.metadata
    ordered_node to_node() const;
  };

  // Template form of a build variant, as authored
  struct BuildVariant {
    std::string image;
    VariantMetadata metadata;
    std::optional< std::string > description;
    std::optional< std::string > support_until; // YYYY-MM-DD
  };

  struct ContainerBuildType {
    std::string image_basename = "builda-bar";
    BuildRuntime runtime = BuildRuntime::Docker;
    PullPolicy pull = PullPolicy::IfNotPresent;
  };

  struct BuildTypeConfig {
    ContainerBuildType container;
  };

  struct RegistryEndpoint {
    bool is_public = true;
    std::string url;
    std::string namespace_;
    std::optional< std::string > username;
    std::optional< std::string > password;
    std::optional< std::string > token;
    std::int64_t timeout = 30;
    std::int64_t retry = 3;
  };

  struct RegistryConfig {
    RegistryStrategy strategy = RegistryStrategy::PrimaryWithFallback;
    NamedEntries< RegistryEndpoint > primary;
    std::optional< NamedEntries< RegistryEndpoint > > fallback;
  };

  inline const std::string DEFAULT_PATH_TEMPLATE
    = "{package}/{major_minor}/{full_version}";

  // Nexus/Artifactory style repository
  struct NexusRepository {
    std::string url;
    std::string repository;
    std::string path_template = DEFAULT_PATH_TEMPLATE;
    std::optional< std::string > username;
    std::optional< std::string > password;
    std::int64_t timeout = 60;
    std::int64_t retry = 3;
  };

  // S3 compatible repository
  struct S3Repository {
    std::string bucket;
    std::string region;
    std::optional< std::string > endpoint;
    std::string path_template = DEFAULT_PATH_TEMPLATE;
    std::optional< std::string > access_key;
    std::optional< std::string > secret_key;
    std::int64_t timeout = 60;
    std::int64_t retry = 3;
  };

  using RepositoryEndpoint = std::variant< NexusRepository, S3Repository >;

  inline std::string base_url( const RepositoryEndpoint& ep );

  struct RepositoryConfig {
    RegistryStrategy strategy = RegistryStrategy::PrimaryWithFallback;
    NamedEntries< RepositoryEndpoint > primary;
    std::optional< NamedEntries< RepositoryEndpoint > > fallback;
  };

  struct DefaultsConfig {
    struct BuildDefaults {
      std::string variant = "stable";
      std::string arch = "amd64";
      bool cleanup_on_success = true;
      bool cleanup_on_failure = false;
    };

    struct PackagingDefaults {
      std::string format = "tar.gz";
      bool generate_checksum = true;
      bool generate_sbom = true;
      bool generate_signature = false;
    };

    BuildDefaults build;
    PackagingDefaults packaging;
  };

  struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Json;
    LogOutput output = LogOutput::Console;
    std::optional< std::string > file;
  };

  struct GithubConfig {
    std::optional< std::string > token;
    std::string api_url = "https://api.github.com";
  };

  // Validated configuration tree. Template strings are still unresolved;
  // ResolutionPipeline produces the resolved form.
  struct Config {
    ordered_node variables = ordered_node::mapping();
    DefaultsConfig defaults;
    PathConfig path;

    // Raw option/build sections plus their parsed structures
    ordered_node option = ordered_node::mapping();
    std::optional< BuildUserConfig > build_user;
    std::optional< RuntimeConfig > runtime;
    ordered_node build = ordered_node::mapping();
    std::optional< BuildTypeConfig > build_type;
    NamedEntries< BuildVariant > build_variants;

    RegistryConfig registry;
    RepositoryConfig repository;
    LoggingConfig logging;
    GithubConfig github;

    const BuildVariant* variant( const std::string& name ) const;
    std::vector< std::string > variant_names() const;

    const std::pair< std::string, RegistryEndpoint >& primary_registry() const;
    const std::pair< std::string, RegistryEndpoint >* fallback_registry() const;

    const std::pair< std::string, RepositoryEndpoint >&
      primary_repository() const;
    const std::pair< std::string, RepositoryEndpoint >*
      fallback_repository() const;
  };

  // Top-level YAML envelope
  struct ConfigFile {
    std::string version;
    std::string schema = "distillery-config";
    Config cfg;
  };

  inline const char* to_string( BuildRuntime r ) {
    return r == BuildRuntime::Docker ? "docker" : "podman";
  }

  inline const char* to_string( PullPolicy p ) {
    switch ( p ) {
      case PullPolicy::Always: return "always";
      case PullPolicy::IfNotPresent: return "if-not-present";
      case PullPolicy::Never: return "never";
    }
    return "unknown";
  }

  inline const char* to_string( RegistryStrategy s ) {
    switch ( s ) {
      case RegistryStrategy::PrimaryOnly: return "primary-only";
      case RegistryStrategy::PrimaryWithFallback:
        return "primary-with-fallback";
      case RegistryStrategy::RoundRobin: return "round-robin";
    }
    return "unknown";
  }

} // namespace distill

inline distill::ordered_node distill::VariantMetadata::to_node() const {
  using internal::make_node_from;
  ordered_node n = ordered_node::mapping();
  n[ "alpine_version" ] = make_node_from( alpine_version );
  n[ "musl_version" ] = make_node_from( musl_version );
  n[ "kernel" ] = make_node_from( kernel );
  n[ "arch" ] = make_node_from( arch );
  return n;
}

inline std::string distill::base_url( const RepositoryEndpoint& ep ) {
  if ( const auto* nexus = std::get_if< NexusRepository >(&ep) ) {
    return nexus->url + '/' + nexus->repository;
  }
  const auto& s3 = std::get< S3Repository >( ep );
  if ( s3.endpoint ) return *s3.endpoint + '/' + s3.bucket;
  return "https://s3." + s3.region + ".amazonaws.com/" + s3.bucket;
}

inline const distill::BuildVariant* distill::Config::variant(
  const std::string& name ) const
{
  for ( const auto& [vname, v] : build_variants ) {
    if ( vname == name ) return &v;
  }
  return nullptr;
}

inline std::vector< std::string > distill::Config::variant_names() const {
  std::vector< std::string > names;
  names.reserve( build_variants.size() );
  for ( const auto& entry : build_variants ) names.push_back( entry.first );
  return names;
}

inline const std::pair< std::string, distill::RegistryEndpoint >&
  distill::Config::primary_registry() const
{
  if ( registry.primary.empty() ) {
    throw ConfigurationError( "No primary registry configured" );
  }
  return registry.primary.front();
}

inline const std::pair< std::string, distill::RegistryEndpoint >*
  distill::Config::fallback_registry() const
{
  if ( !registry.fallback || registry.fallback->empty() ) return nullptr;
  return &registry.fallback->front();
}

inline const std::pair< std::string, distill::RepositoryEndpoint >&
  distill::Config::primary_repository() const
{
  if ( repository.primary.empty() ) {
    throw ConfigurationError( "No primary repository configured" );
  }
  return repository.primary.front();
}

inline const std::pair< std::string, distill::RepositoryEndpoint >*
  distill::Config::fallback_repository() const
{
  if ( !repository.fallback || repository.fallback->empty() ) return nullptr;
  return &repository.fallback->front();
}
