// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "distill/config.hh"
#include "distill/context_builder.hh"
#include "distill/diagnostics.hh"
#include "distill/errors.hh"
#include "distill/node.hh"
#include "distill/template_engine.hh"

namespace distill {

  enum class PathState { Resolved, PartiallyResolved };

  // Immutable result of rendering one build variant
  struct ResolvedVariant {
    std::string name;
    std::string image; // fully resolved
    std::string image_template; // as authored
    VariantMetadata metadata;
    std::optional< std::string > description;
    std::optional< std::string > support_until;
  };

  // Output of ResolutionPipeline::run(). The path fields of cfg are
  // resolved, except generated.applications when applications_state is
  // partially_resolved (it then still holds its per-package placeholder).
  struct ResolvedConfig {
    Config cfg;
    PathState applications_state = PathState::Resolved;
    std::vector< ResolvedVariant > variants;

    // Lookup context as it stood after the path values were merged in
    ordered_node context = ordered_node::mapping();

    const ResolvedVariant* variant( const std::string& name ) const;

    // Complete the deferred substitution of generated.applications for one
    // package, with package.name bound
    std::string application_path( const std::string& package_name,
      const TemplateEngine& engine = TemplateEngine() ) const;
  };

  // Drives context assembly and strict rendering in a fixed order:
  //   1) validated configuration (input)
  //   2) initial context
  //   3) path.base, downloads, sources, build, generated.libraries
  //   4) path.generated.applications, tolerating deferred runtime variables
  //   5) resolved paths merged back into the context under path.*
  //   6) per-variant image templates, with the variant bound as "this"
  // Variant images may reference path values, so 6) must follow 5).
  class ResolutionPipeline {
  public:
    inline explicit ResolutionPipeline(
      int max_passes = TemplateEngine::DEFAULT_MAX_PASSES,
      Logger& log = diag() )
      : engine_( max_passes ), deferred_{ "package" }, log_( &log ) {}

    const TemplateEngine& engine() const { return engine_; }

    // Root names known only at build time (e.g. "package" in
    // "{{ package.name }}")
    const std::vector< std::string >& deferred_roots() const {
      return deferred_;
    }
    void add_deferred_root( const std::string& root );

    // Any TemplateError outside the deferred carve-out propagates; no
    // partially resolved configuration is ever returned.
    ResolvedConfig run( Config cfg ) const;

  private:
    std::string resolve_path_field( const std::string& value,
      const std::string& field, const ordered_node& ctx ) const;

    PathState resolve_applications_path( std::string& value,
      const ordered_node& ctx ) const;

    static void merge_paths( ordered_node& ctx, const PathConfig& path );

    ResolvedVariant resolve_variant( const std::string& name,
      const BuildVariant& v, const ordered_node& ctx ) const;

    bool is_deferred( const TemplateError& e ) const;

    TemplateEngine engine_;
    std::vector< std::string > deferred_;
    Logger* log_;
  };

} // namespace distill

inline const distill::ResolvedVariant* distill::ResolvedConfig::variant(
  const std::string& name ) const
{
  for ( const auto& v : variants ) {
    if ( v.name == name ) return &v;
  }
  return nullptr;
}

inline std::string distill::ResolvedConfig::application_path(
  const std::string& package_name, const TemplateEngine& engine ) const
{
  const std::string& apps = cfg.path.generated.applications;
  if ( !TemplateEngine::has_template_vars(apps) ) return apps;

  ordered_node ctx = context;
  ordered_node package = ordered_node::mapping();
  package[ "name" ] = internal::make_node_from( package_name );
  ctx[ "package" ] = package;
  return engine.render( apps, ctx );
}

inline void distill::ResolutionPipeline::add_deferred_root(
  const std::string& root )
{
  if ( std::find(deferred_.begin(), deferred_.end(), root) == deferred_.end() )
  {
    deferred_.push_back( root );
  }
}

inline distill::ResolvedConfig distill::ResolutionPipeline::run(
  Config cfg ) const
{
  log_->debug( "Resolving configuration templates..." );

  ordered_node ctx = build_context( cfg );

  PathConfig& path = cfg.path;
  path.base = resolve_path_field( path.base, "path.base", ctx );
  path.downloads = resolve_path_field( path.downloads, "path.downloads", ctx );
  path.sources = resolve_path_field( path.sources, "path.sources", ctx );
  path.build = resolve_path_field( path.build, "path.build", ctx );
  path.generated.libraries = resolve_path_field( path.generated.libraries,
    "path.generated.libraries", ctx );

  ResolvedConfig out;
  out.applications_state = resolve_applications_path(
    path.generated.applications, ctx );

  merge_paths( ctx, path );

  out.variants.reserve( cfg.build_variants.size() );
  for ( const auto& [name, v] : cfg.build_variants ) {
    out.variants.push_back( resolve_variant(name, v, ctx) );
  }

  out.cfg = std::move( cfg );
  out.context = std::move( ctx );
  return out;
}

inline std::string distill::ResolutionPipeline::resolve_path_field(
  const std::string& value, const std::string& field,
  const ordered_node& ctx ) const
{
  if ( !TemplateEngine::has_template_vars(value) ) return value;
  std::string resolved = engine_.render( value, ctx );
  log_->debug( "Resolved " + field + ": " + resolved );
  return resolved;
}

inline distill::PathState
  distill::ResolutionPipeline::resolve_applications_path( std::string& value,
    const ordered_node& ctx ) const
{
  if ( !TemplateEngine::has_template_vars(value) ) return PathState::Resolved;

  try {
    value = engine_.render( value, ctx );
    log_->debug( "Resolved path.generated.applications: " + value );
    return PathState::Resolved;
  }
  catch ( const TemplateError& e ) {
    if ( !is_deferred(e) ) throw;
    log_->debug( "Path contains runtime variables: " + value
      + " (will be resolved at build time)" );
    return PathState::PartiallyResolved;
  }
}

inline bool distill::ResolutionPipeline::is_deferred(
  const TemplateError& e ) const
{
  if ( e.what_kind() != TemplateError::Kind::UndefinedVariable ) return false;
  const std::string& root = e.info().undefined_root;
  return std::find( deferred_.begin(), deferred_.end(), root )
    != deferred_.end();
}

// Override the pre-resolution path entries so later stages see final values
inline void distill::ResolutionPipeline::merge_paths( ordered_node& ctx,
  const PathConfig& path )
{
  using internal::make_node_from;

  ordered_node generated = ordered_node::mapping();
  generated[ "libraries" ] = make_node_from( path.generated.libraries );
  generated[ "applications" ] = make_node_from( path.generated.applications );

  ordered_node p = ordered_node::mapping();
  p[ "base" ] = make_node_from( path.base );
  p[ "downloads" ] = make_node_from( path.downloads );
  p[ "sources" ] = make_node_from( path.sources );
  p[ "build" ] = make_node_from( path.build );
  p[ "generated" ] = generated;
  ctx[ "path" ] = p;
}

inline distill::ResolvedVariant distill::ResolutionPipeline::resolve_variant(
  const std::string& name, const BuildVariant& v,
  const ordered_node& ctx ) const
{
  // Item scope bound as "this" for this render only
  ordered_node item = ordered_node::mapping();
  item[ "name" ] = internal::make_node_from( name );
  item[ "metadata" ] = v.metadata.to_node();

  ResolvedVariant out;
  out.name = name;
  out.image_template = v.image;
  out.image = engine_.render( v.image, ctx, &item );
  out.metadata = v.metadata;
  out.description = v.description;
  out.support_until = v.support_until;

  log_->debug( "Resolved " + name + " image: " + out.image );
  return out;
}
