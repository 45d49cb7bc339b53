// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "distill/config.hh"
#include "distill/errors.hh"
#include "distill/node.hh"

namespace distill {

  // Outcome of typed construction: either a configuration or the complete
  // list of field-level violations
  struct ValidationResult {
    std::optional< ConfigFile > file;
    std::vector< FieldViolation > violations;

    bool ok() const { return file.has_value() && violations.empty(); }
  };

  // Build the typed configuration from a parsed document. Never throws for
  // schema problems; every violation found is returned.
  inline ValidationResult validate_document( const ordered_node& root );

  // Same, but throws StructuralError on any violation
  inline ConfigFile validate_or_throw( const ordered_node& root );

namespace internal {

  // Replace "${NAME}" with the value of environment variable NAME. An unset
  // variable yields no value; any other string is returned as-is.
  inline std::optional< std::string > expand_env_reference(
    const std::optional< std::string >& v )
  {
    if ( !v || v->size() < 3 ) return v;
    if ( v->compare(0, 2, "${") != 0 || v->back() != '}' ) return v;
    const std::string name = v->substr( 2, v->size() - 3 );
    const char* value = std::getenv( name.c_str() );
    if ( !value ) return std::nullopt;
    return std::string( value );
  }

  // Expand a leading "~" (or "~/") with $HOME
  inline std::string expand_user( const std::string& p ) {
    if ( p.empty() || p[0] != '~' ) return p;
    if ( p.size() > 1 && p[1] != '/' ) return p; // ~user is not supported
    const char* home = std::getenv( "HOME" );
    if ( !home ) return p;
    return std::string( home ) + p.substr( 1 );
  }

  // Collects violations while reading typed fields out of mapping nodes.
  // Every reader records a violation and leaves the output untouched when
  // the field is missing or has the wrong type.
  class SchemaReader {
  public:
    explicit SchemaReader( std::vector< FieldViolation >& out )
      : violations_( out ) {}

    void violation( const std::string& field, const std::string& msg ) {
      violations_.push_back( { field, msg } );
    }

    static std::string child( const std::string& where, const std::string& k ) {
      return where.empty() ? k : where + PATH_DELIMITER + k;
    }

    // Present and not null
    static const ordered_node* field( const ordered_node& m,
      const std::string& key )
    {
      if ( !m.is_mapping() || !m.contains(key) ) return nullptr;
      const ordered_node& v = m.at( key );
      if ( v.is_null() ) return nullptr;
      return &v;
    }

    // Mapping-valued field. Returns nullptr (with a violation when required
    // or mistyped) when the mapping is not usable.
    const ordered_node* mapping( const ordered_node& m, const std::string& where,
      const std::string& key, bool required )
    {
      const ordered_node* v = field( m, key );
      if ( !v ) {
        if ( required ) violation( child(where, key), "field required" );
        return nullptr;
      }
      if ( !v->is_mapping() ) {
        violation( child(where, key), "Input should be a valid mapping" );
        return nullptr;
      }
      return v;
    }

    bool string( const ordered_node& m, const std::string& where,
      const std::string& key, std::string& out, bool required,
      const char* pattern = nullptr )
    {
      const ordered_node* v = field( m, key );
      if ( !v ) {
        if ( required ) violation( child(where, key), "field required" );
        return false;
      }
      if ( !v->is_string() ) {
        violation( child(where, key), "Input should be a valid string" );
        return false;
      }
      std::string s = to_native_checked< std::string >( *v );
      if ( pattern && !std::regex_match(s, std::regex(pattern)) ) {
        violation( child(where, key), "String should match pattern '"
          + std::string(pattern) + "' (got '" + s + "')" );
        return false;
      }
      out = std::move( s );
      return true;
    }

    void optional_string( const ordered_node& m, const std::string& where,
      const std::string& key, std::optional< std::string >& out )
    {
      std::string s;
      if ( string(m, where, key, s, false) ) out = std::move( s );
    }

    void boolean( const ordered_node& m, const std::string& where,
      const std::string& key, bool& out )
    {
      const ordered_node* v = field( m, key );
      if ( !v ) return;
      if ( !v->is_boolean() ) {
        violation( child(where, key), "Input should be a valid boolean" );
        return;
      }
      out = v->get_value< bool >();
    }

    void integer( const ordered_node& m, const std::string& where,
      const std::string& key, std::int64_t& out, bool required,
      std::int64_t minimum )
    {
      const ordered_node* v = field( m, key );
      if ( !v ) {
        if ( required ) violation( child(where, key), "field required" );
        return;
      }
      if ( !v->is_integer() ) {
        violation( child(where, key), "Input should be a valid integer" );
        return;
      }
      const std::int64_t i = to_native_checked< std::int64_t >( *v );
      if ( i < minimum ) {
        violation( child(where, key), "Input should be greater than or equal"
          " to " + std::to_string(minimum) );
        return;
      }
      out = i;
    }

    void string_list( const ordered_node& m, const std::string& where,
      const std::string& key, std::vector< std::string >& out )
    {
      const ordered_node* v = field( m, key );
      if ( !v ) return;
      if ( !v->is_sequence() ) {
        violation( child(where, key), "Input should be a valid list" );
        return;
      }
      std::vector< std::string > items;
      for ( size_t i = 0; i < v->size(); ++i ) {
        const ordered_node& el = v->at( i );
        if ( !el.is_string() ) {
          violation( child(where, key) + '[' + std::to_string(i) + ']',
            "Input should be a valid string" );
          return;
        }
        items.push_back( to_native_checked< std::string >(el) );
      }
      out = std::move( items );
    }

    // String field restricted to a fixed set of spellings
    template < typename E >
    void enumeration( const ordered_node& m, const std::string& where,
      const std::string& key, E& out,
      const std::vector< std::pair< std::string, E > >& table )
    {
      std::string s;
      if ( !string(m, where, key, s, false) ) return;
      std::string expected;
      for ( const auto& [spelling, value] : table ) {
        if ( spelling == s ) {
          out = value;
          return;
        }
        if ( !expected.empty() ) expected += ", ";
        expected += "'" + spelling + "'";
      }
      violation( child(where, key), "Input should be one of " + expected
        + " (got '" + s + "')" );
    }

  private:
    std::vector< FieldViolation >& violations_;
  };

  inline const std::vector< std::pair< std::string, RegistryStrategy > >&
    strategy_table()
  {
    static const std::vector< std::pair< std::string, RegistryStrategy > > t{
      { "primary-only", RegistryStrategy::PrimaryOnly },
      { "primary-with-fallback", RegistryStrategy::PrimaryWithFallback },
      { "round-robin", RegistryStrategy::RoundRobin }
    };
    return t;
  }

  inline RegistryEndpoint read_registry_endpoint( SchemaReader& r,
    const ordered_node& m, const std::string& where )
  {
    RegistryEndpoint ep;
    r.boolean( m, where, "public", ep.is_public );
    r.string( m, where, "url", ep.url, true );
    r.string( m, where, "namespace", ep.namespace_, true );
    r.optional_string( m, where, "username", ep.username );
    r.optional_string( m, where, "password", ep.password );
    r.optional_string( m, where, "token", ep.token );
    r.integer( m, where, "timeout", ep.timeout, false, 1 );
    r.integer( m, where, "retry", ep.retry, false, 0 );
    ep.username = expand_env_reference( ep.username );
    ep.password = expand_env_reference( ep.password );
    ep.token = expand_env_reference( ep.token );
    return ep;
  }

  inline RepositoryEndpoint read_repository_endpoint( SchemaReader& r,
    const ordered_node& m, const std::string& where )
  {
    std::string type = "nexus";
    r.string( m, where, "type", type, false );

    if ( type == "s3" ) {
      S3Repository s3;
      r.string( m, where, "bucket", s3.bucket, true );
      r.string( m, where, "region", s3.region, true );
      r.optional_string( m, where, "endpoint", s3.endpoint );
      r.string( m, where, "path_template", s3.path_template, false );
      r.optional_string( m, where, "access_key", s3.access_key );
      r.optional_string( m, where, "secret_key", s3.secret_key );
      r.integer( m, where, "timeout", s3.timeout, false, 1 );
      r.integer( m, where, "retry", s3.retry, false, 0 );
      s3.access_key = expand_env_reference( s3.access_key );
      s3.secret_key = expand_env_reference( s3.secret_key );
      return s3;
    }

    if ( type != "nexus" ) {
      r.violation( SchemaReader::child(where, "type"),
        "Input should be 'nexus' or 's3' (got '" + type + "')" );
    }
    NexusRepository nexus;
    r.string( m, where, "url", nexus.url, true );
    r.string( m, where, "repository", nexus.repository, true );
    r.string( m, where, "path_template", nexus.path_template, false );
    r.optional_string( m, where, "username", nexus.username );
    r.optional_string( m, where, "password", nexus.password );
    r.integer( m, where, "timeout", nexus.timeout, false, 1 );
    r.integer( m, where, "retry", nexus.retry, false, 0 );
    nexus.username = expand_env_reference( nexus.username );
    nexus.password = expand_env_reference( nexus.password );
    return nexus;
  }

  // Read a name -> endpoint mapping, preserving authored order
  template < typename T, typename ReadFn >
  inline NamedEntries< T > read_named( SchemaReader& r, const ordered_node& m,
    const std::string& where, ReadFn read )
  {
    NamedEntries< T > out;
    for ( const auto& [mk, mv] : m.map_items() ) {
      const std::string name = key_string( mk );
      const std::string here = SchemaReader::child( where, name );
      if ( !mv.is_mapping() ) {
        r.violation( here, "Input should be a valid mapping" );
        continue;
      }
      out.emplace_back( name, read(r, mv, here) );
    }
    return out;
  }

  inline void read_paths( SchemaReader& r, const ordered_node& cfg,
    PathConfig& path )
  {
    const ordered_node* p = r.mapping( cfg, "config", "path", true );
    if ( !p ) return;
    const std::string where = "config.path";
    r.string( *p, where, "base", path.base, true );
    r.string( *p, where, "downloads", path.downloads, true );
    r.string( *p, where, "sources", path.sources, true );
    r.string( *p, where, "build", path.build, true );
    path.base = expand_user( path.base );
    path.downloads = expand_user( path.downloads );
    path.sources = expand_user( path.sources );
    path.build = expand_user( path.build );

    const ordered_node* g = r.mapping( *p, where, "generated", true );
    if ( !g ) return;
    r.string( *g, where + ".generated", "libraries",
      path.generated.libraries, true );
    r.string( *g, where + ".generated", "applications",
      path.generated.applications, true );
  }

  inline void read_defaults( SchemaReader& r, const ordered_node& cfg,
    DefaultsConfig& d )
  {
    const ordered_node* m = r.mapping( cfg, "config", "defaults", false );
    if ( !m ) return;
    if ( const ordered_node* b = r.mapping(*m, "config.defaults", "build",
      false) )
    {
      const std::string where = "config.defaults.build";
      r.string( *b, where, "variant", d.build.variant, false );
      r.string( *b, where, "arch", d.build.arch, false );
      r.boolean( *b, where, "cleanup_on_success", d.build.cleanup_on_success );
      r.boolean( *b, where, "cleanup_on_failure", d.build.cleanup_on_failure );
    }
    if ( const ordered_node* p = r.mapping(*m, "config.defaults", "packaging",
      false) )
    {
      const std::string where = "config.defaults.packaging";
      r.string( *p, where, "format", d.packaging.format, false );
      r.boolean( *p, where, "generate_checksum", d.packaging.generate_checksum );
      r.boolean( *p, where, "generate_sbom", d.packaging.generate_sbom );
      r.boolean( *p, where, "generate_signature",
        d.packaging.generate_signature );
    }
  }

  inline void read_option( SchemaReader& r, const ordered_node& cfg,
    Config& c )
  {
    const ordered_node* opt = r.mapping( cfg, "config", "option", false );
    if ( !opt ) return;
    c.option = *opt;

    if ( const ordered_node* u = r.mapping(*opt, "config.option", "build_user",
      false) )
    {
      const std::string where = "config.option.build_user";
      BuildUserConfig bu;
      r.string( *u, where, "name", bu.name, true );
      r.string( *u, where, "group", bu.group, true );
      r.integer( *u, where, "uid", bu.uid, true, 1000 );
      r.integer( *u, where, "gid", bu.gid, true, 1000 );
      r.string( *u, where, "homedir", bu.homedir, true );
      r.string( *u, where, "shell", bu.shell, false );
      c.build_user = bu;
    }

    if ( const ordered_node* rt = r.mapping(*opt, "config.option", "runtime",
      false) )
    {
      const std::string where = "config.option.runtime";
      RuntimeConfig rc;
      if ( const ordered_node* t = r.mapping(*rt, where, "tmpfs", false) ) {
        r.boolean( *t, where + ".tmpfs", "enabled", rc.tmpfs.enabled );
        r.string( *t, where + ".tmpfs", "size", rc.tmpfs.size, false,
          R"(^\d+[kmg]$)" );
        r.string( *t, where + ".tmpfs", "mount_point", rc.tmpfs.mount_point,
          false );
      }
      if ( const ordered_node* f = r.mapping(*rt, where, "fakeroot", false) ) {
        r.boolean( *f, where + ".fakeroot", "enabled", rc.fakeroot.enabled );
      }
      if ( const ordered_node* s = r.mapping(*rt, where, "security", false) ) {
        const std::string sw = where + ".security";
        r.boolean( *s, sw, "no_new_privileges", rc.security.no_new_privileges );
        r.string_list( *s, sw, "drop_capabilities",
          rc.security.drop_capabilities );
        r.string_list( *s, sw, "add_capabilities",
          rc.security.add_capabilities );
      }
      c.runtime = rc;
    }
  }

  inline BuildVariant read_variant( SchemaReader& r, const ordered_node& m,
    const std::string& where )
  {
    BuildVariant v;
    r.string( m, where, "image", v.image, true );
    r.optional_string( m, where, "description", v.description );
    r.optional_string( m, where, "support_until", v.support_until );

    const ordered_node* md = r.mapping( m, where, "metadata", true );
    if ( md ) {
      const std::string mw = where + ".metadata";
      r.string( *md, mw, "alpine_version", v.metadata.alpine_version, true,
        R"(^\d+\.\d+$)" );
      r.string( *md, mw, "musl_version", v.metadata.musl_version, true,
        R"(^\d+\.\d+\.\d+$)" );
      r.string( *md, mw, "kernel", v.metadata.kernel, true, R"(^\d+\.\d+$)" );
      r.string( *md, mw, "arch", v.metadata.arch, false );
    }
    return v;
  }

  inline void read_build( SchemaReader& r, const ordered_node& cfg,
    Config& c )
  {
    const ordered_node* b = r.mapping( cfg, "config", "build", true );
    if ( !b ) return;
    c.build = *b;

    if ( const ordered_node* t = r.mapping(*b, "config.build", "type",
      false) )
    {
      BuildTypeConfig bt;
      if ( const ordered_node* ct = r.mapping(*t, "config.build.type",
        "container", false) )
      {
        const std::string where = "config.build.type.container";
        r.string( *ct, where, "image_basename", bt.container.image_basename,
          false );
        r.enumeration( *ct, where, "runtime", bt.container.runtime,
          std::vector< std::pair< std::string, BuildRuntime > >{
            { "docker", BuildRuntime::Docker },
            { "podman", BuildRuntime::Podman } } );
        r.enumeration( *ct, where, "pull_policy", bt.container.pull,
          std::vector< std::pair< std::string, PullPolicy > >{
            { "always", PullPolicy::Always },
            { "if-not-present", PullPolicy::IfNotPresent },
            { "never", PullPolicy::Never } } );
      }
      c.build_type = bt;
    }

    if ( const ordered_node* vs = r.mapping(*b, "config.build", "variant",
      false) )
    {
      c.build_variants = read_named< BuildVariant >( r, *vs,
        "config.build.variant", read_variant );
    }
  }

  inline void read_registry( SchemaReader& r, const ordered_node& cfg,
    RegistryConfig& reg )
  {
    const ordered_node* m = r.mapping( cfg, "config", "registry", true );
    if ( !m ) return;
    const std::string where = "config.registry";
    r.enumeration( *m, where, "strategy", reg.strategy, strategy_table() );

    if ( const ordered_node* p = r.mapping(*m, where, "primary", true) ) {
      reg.primary = read_named< RegistryEndpoint >( r, *p,
        where + ".primary", read_registry_endpoint );
      if ( p->size() == 0 ) {
        r.violation( where + ".primary",
          "At least one primary registry must be configured" );
      }
    }
    if ( const ordered_node* f = r.mapping(*m, where, "fallback", false) ) {
      reg.fallback = read_named< RegistryEndpoint >( r, *f,
        where + ".fallback", read_registry_endpoint );
    }
  }

  inline void read_repository( SchemaReader& r, const ordered_node& cfg,
    RepositoryConfig& repo )
  {
    const ordered_node* m = r.mapping( cfg, "config", "repository", true );
    if ( !m ) return;
    const std::string where = "config.repository";
    r.enumeration( *m, where, "strategy", repo.strategy, strategy_table() );

    if ( const ordered_node* p = r.mapping(*m, where, "primary", true) ) {
      repo.primary = read_named< RepositoryEndpoint >( r, *p,
        where + ".primary", read_repository_endpoint );
      if ( p->size() == 0 ) {
        r.violation( where + ".primary",
          "At least one primary repository must be configured" );
      }
    }
    if ( const ordered_node* f = r.mapping(*m, where, "fallback", false) ) {
      repo.fallback = read_named< RepositoryEndpoint >( r, *f,
        where + ".fallback", read_repository_endpoint );
    }
  }

  inline void read_logging( SchemaReader& r, const ordered_node& cfg,
    LoggingConfig& lc )
  {
    const ordered_node* m = r.mapping( cfg, "config", "logging", false );
    if ( !m ) return;
    const std::string where = "config.logging";
    r.enumeration( *m, where, "level", lc.level,
      std::vector< std::pair< std::string, LogLevel > >{
        { "DEBUG", LogLevel::Debug }, { "INFO", LogLevel::Info },
        { "WARNING", LogLevel::Warning }, { "ERROR", LogLevel::Error } } );
    r.enumeration( *m, where, "format", lc.format,
      std::vector< std::pair< std::string, LogFormat > >{
        { "json", LogFormat::Json }, { "text", LogFormat::Text } } );
    r.enumeration( *m, where, "output", lc.output,
      std::vector< std::pair< std::string, LogOutput > >{
        { "stdout", LogOutput::Console }, { "file", LogOutput::File } } );
    r.optional_string( *m, where, "file", lc.file );
  }

  inline void read_github( SchemaReader& r, const ordered_node& cfg,
    GithubConfig& gh )
  {
    const ordered_node* m = r.mapping( cfg, "config", "github", false );
    if ( !m ) return;
    r.optional_string( *m, "config.github", "token", gh.token );
    r.string( *m, "config.github", "api_url", gh.api_url, false );
    gh.token = expand_env_reference( gh.token );
  }

} // namespace distill::internal

} // namespace distill

inline distill::ValidationResult distill::validate_document(
  const ordered_node& root )
{
  using namespace distill::internal;

  ValidationResult result;
  SchemaReader r( result.violations );

  if ( !root.is_mapping() ) {
    r.violation( "<root>", "Config file must contain a YAML mapping" );
    return result;
  }

  ConfigFile file;
  r.string( root, "", "version", file.version, true, R"(^\d+\.\d+\.\d+$)" );
  r.string( root, "", "schema", file.schema, false );

  const ordered_node* cfg = r.mapping( root, "", "config", true );
  if ( !cfg ) return result;

  Config& c = file.cfg;
  if ( const ordered_node* vars = r.mapping(*cfg, "config", "variables",
    false) )
  {
    c.variables = *vars;
  }
  read_defaults( r, *cfg, c.defaults );
  read_paths( r, *cfg, c.path );
  read_option( r, *cfg, c );
  read_build( r, *cfg, c );
  read_registry( r, *cfg, c.registry );
  read_repository( r, *cfg, c.repository );
  read_logging( r, *cfg, c.logging );
  read_github( r, *cfg, c.github );

  if ( result.violations.empty() ) result.file = std::move( file );
  return result;
}

inline distill::ConfigFile distill::validate_or_throw(
  const ordered_node& root )
{
  ValidationResult result = validate_document( root );
  if ( !result.ok() ) throw StructuralError( std::move(result.violations) );
  return std::move( *result.file );
}
