// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <iostream>
#include <string>

#include "distill/diagnostics.hh"
#include "distill/errors.hh"
#include "distill/lenient_expander.hh"
#include "distill/node.hh"
#include "distill/path_resolver.hh"

namespace distill {

  // Which package build to preview
  struct PackageRequest {
    std::string package;
    std::string variant;
    std::string tag; // "library" or "application"
  };

  // Lookup context for one package build plus the selected variant entry
  struct PreviewContext {
    ordered_node context = ordered_node::mapping();
    ordered_node variant = ordered_node::mapping();

    std::string full_version() const;
    std::string default_prefix() const;
  };

  // Receives expanded build commands. This library never runs them.
  class CommandSink {
  public:
    virtual ~CommandSink() = default;
    virtual void submit( const std::string& stage,
      const std::string& command ) = 0;
  };

  // Writes a banner per stage followed by the command
  class PrintSink : public CommandSink {
  public:
    explicit PrintSink( std::ostream& out = std::cout ) : out_( out ) {}

    void submit( const std::string& stage,
      const std::string& command ) override;

  private:
    std::ostream& out_;
  };

  // Assemble the preview context from the raw config and packages
  // documents. Throws ConfigurationError when the package, the variant or
  // a required field cannot be found.
  inline PreviewContext build_preview_context( const ordered_node& config_doc,
    const ordered_node& packages_doc, const PackageRequest& req,
    const LenientExpander& expander = LenientExpander(),
    Logger& log = diag() );

  // Expand every "commands.<stage>" entry of the package, in authored order,
  // and hand the results to the sink
  inline void submit_commands( const ordered_node& packages_doc,
    const PackageRequest& req, const PreviewContext& pc, CommandSink& sink,
    const LenientExpander& expander = LenientExpander() );

namespace internal {

  // Required value below root, reported with the document name on failure
  inline const ordered_node& require_path( const ordered_node& root,
    const std::string& path, const std::string& document )
  {
    LookupFailure failure;
    const ordered_node* v = lookup( path, root, &failure );
    if ( !v ) {
      throw ConfigurationError( document + ": " + failure.describe() );
    }
    return *v;
  }

  // A variant entry matches by name, or by membership when name is a list
  inline bool variant_matches( const ordered_node& entry,
    const std::string& wanted )
  {
    if ( !entry.is_mapping() || !entry.contains("name") ) return false;
    const ordered_node& name = entry.at( "name" );
    if ( name.is_sequence() ) {
      for ( size_t i = 0; i < name.size(); ++i ) {
        if ( to_string_any(name.at(i)) == wanted ) return true;
      }
      return false;
    }
    return to_string_any( name ) == wanted;
  }

  inline const ordered_node& package_entry( const ordered_node& packages_doc,
    const std::string& package )
  {
    const ordered_node& all = require_path( packages_doc, "package",
      "packages" );
    if ( !all.is_mapping() || !all.contains(package)
      || all.at(package).is_null() )
    {
      throw ConfigurationError( "Package '" + package
        + "' not found in packages document" );
    }
    return all.at( package );
  }

} // namespace distill::internal

} // namespace distill

inline std::string distill::PreviewContext::full_version() const {
  return internal::to_string_any( context.at("full_version") );
}

inline std::string distill::PreviewContext::default_prefix() const {
  return internal::to_string_any( context.at("default_prefix") );
}

inline void distill::PrintSink::submit( const std::string& stage,
  const std::string& command )
{
  const std::string rule( 60, '=' );
  out_ << '\n' << rule << '\n'
    << "Stage: " << stage << '\n'
    << rule << '\n'
    << command << '\n';
}

inline distill::PreviewContext distill::build_preview_context(
  const ordered_node& config_doc, const ordered_node& packages_doc,
  const PackageRequest& req, const LenientExpander& expander, Logger& log )
{
  using internal::make_node_from;
  using internal::require_path;

  const ordered_node& pkg = internal::package_entry( packages_doc,
    req.package );

  // The tag only selects the prefix; a package not tagged that way is
  // still previewed
  bool tagged = false;
  if ( pkg.is_mapping() && pkg.contains("tags") && pkg.at("tags").is_sequence() )
  {
    const ordered_node& tags = pkg.at( "tags" );
    for ( size_t i = 0; i < tags.size(); ++i ) {
      if ( internal::to_string_any(tags.at(i)) == req.tag ) tagged = true;
    }
  }
  if ( !tagged ) {
    log.warning( "Tag '" + req.tag + "' is not listed in the tags of package '"
      + req.package + "'" );
  }

  PreviewContext pc;

  const ordered_node& variants = require_path( pkg, "variant",
    "package " + req.package );
  bool found = false;
  if ( variants.is_sequence() ) {
    for ( size_t i = 0; i < variants.size(); ++i ) {
      if ( internal::variant_matches(variants.at(i), req.variant) ) {
        pc.variant = variants.at( i );
        found = true;
        break;
      }
    }
  }
  if ( !found ) {
    throw ConfigurationError( "Variant '" + req.variant
      + "' not found for package '" + req.package + "'" );
  }

  std::string prefix_path;
  if ( req.tag == "library" ) {
    prefix_path = "config.libraries.default_prefix";
  }
  else if ( req.tag == "application" ) {
    prefix_path = "config.applications.default_prefix";
  }
  else {
    throw ConfigurationError( "Tag '" + req.tag + "' is not valid"
      " (expected 'library' or 'application')" );
  }

  ordered_node& ctx = pc.context;
  ctx[ "config" ] = require_path( config_doc, "config", "config" );
  ctx[ "package_name" ] = make_node_from( req.package );
  ctx[ "name" ] = make_node_from( req.package );
  ctx[ "default_prefix" ] = require_path( config_doc, prefix_path, "config" );

  const std::string where = "package " + req.package + " variant "
    + req.variant;
  ctx[ "full_version" ] = require_path( pc.variant, "full_version", where );
  ctx[ "major_version" ] = require_path( pc.variant, "major_version", where );
  ctx[ "patch_version" ] = require_path( pc.variant, "patch_version", where );

  ctx[ "git" ] = ( pkg.contains("git") && !pkg.at("git").is_null() )
    ? pkg.at( "git" ) : ordered_node::mapping();
  ctx[ "website" ] = ( pkg.contains("website") && !pkg.at("website").is_null() )
    ? pkg.at( "website" ) : make_node_from( std::string() );

  // Templates inside the git section (e.g. a release download URL) may
  // reference the versions above
  ordered_node git = expander.expand_tree( ctx.at("git"), ctx );
  ctx[ "git" ] = git;

  return pc;
}

inline void distill::submit_commands( const ordered_node& packages_doc,
  const PackageRequest& req, const PreviewContext& pc, CommandSink& sink,
  const LenientExpander& expander )
{
  const ordered_node& pkg = internal::package_entry( packages_doc,
    req.package );
  const ordered_node& commands = internal::require_path( pkg, "commands",
    "package " + req.package );
  if ( !commands.is_mapping() ) {
    throw ConfigurationError( "package " + req.package
      + ": 'commands' must be a mapping of stage -> command" );
  }

  for ( const auto& [mk, mv] : commands.map_items() ) {
    const std::string stage = internal::key_string( mk );
    if ( !mv.is_string() ) {
      sink.submit( stage, internal::to_string_any(mv) );
      continue;
    }
    sink.submit( stage, expander.expand(
      internal::to_native_checked< std::string >(mv), pc.context) );
  }
}
