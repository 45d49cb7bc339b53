// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "distill/config.hh"
#include "distill/diagnostics.hh"
#include "distill/errors.hh"
#include "distill/node.hh"
#include "distill/pipeline.hh"
#include "distill/schema.hh"

namespace distill {

  // Parse YAML text into a document, translating fkYAML failures
  inline ordered_node parse_yaml( const std::string& text );

  // Read a whole YAML file; a missing file is a ConfigurationError
  inline ordered_node read_yaml_file( const std::string& path );

  // Load, validate and resolve a configuration file:
  //   1) read and parse YAML
  //   2) validate against the configuration schema (StructuralError)
  //   3) resolve templates (ResolutionPipeline)
  // read() covers 1 and 2 and resolve() covers 3, so a caller can apply
  // the document's logging settings before resolution starts.
  class ConfigLoader {
  public:
    static constexpr const char* DEFAULT_CONFIG_PATH = "config/config.yaml";

    inline explicit ConfigLoader( std::string path = DEFAULT_CONFIG_PATH,
      Logger& log = diag() )
      : path_( std::move(path) ), pipeline_( TemplateEngine::DEFAULT_MAX_PASSES,
        log ), log_( &log ) {}

    const std::string& path() const { return path_; }

    ResolvedConfig load() const;

    // Same stages for a document that is already in memory
    ResolvedConfig load_text( const std::string& yaml_text ) const;

    ConfigFile read() const;
    ConfigFile read_text( const std::string& yaml_text ) const;

    ResolvedConfig resolve( ConfigFile file ) const;

  private:
    ConfigFile validate_document_root( const ordered_node& doc ) const;

    std::string path_;
    ResolutionPipeline pipeline_;
    Logger* log_;
  };

  // Apply the logging section to a logger. keep_threshold leaves a level
  // that was already chosen (e.g. on the command line) in place.
  inline void configure_logger( Logger& log, const LoggingConfig& lc,
    bool keep_threshold = false );

  // Convenience function
  inline ResolvedConfig load_config(
    const std::string& path = ConfigLoader::DEFAULT_CONFIG_PATH )
  {
    return ConfigLoader( path ).load();
  }

} // namespace distill

inline distill::ordered_node distill::parse_yaml( const std::string& text ) {
  try {
    return ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& e ) {
    throw ConfigurationError( std::string("Invalid YAML syntax: ")
      + e.what() );
  }
}

inline distill::ordered_node distill::read_yaml_file(
  const std::string& path )
{
  std::ifstream in( path );
  if ( !in.is_open() ) {
    throw ConfigurationError( "Config file not found: " + path );
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  try {
    return parse_yaml( ss.str() );
  }
  catch ( const ConfigurationError& e ) {
    throw ConfigurationError( path + ": " + e.what() );
  }
}

inline void distill::configure_logger( Logger& log, const LoggingConfig& lc,
  bool keep_threshold )
{
  if ( !keep_threshold ) log.set_threshold( lc.level );
  log.set_format( lc.format );
  if ( lc.output == LogOutput::File && lc.file ) log.open_file( *lc.file );
}

inline distill::ResolvedConfig distill::ConfigLoader::load() const {
  return resolve( read() );
}

inline distill::ResolvedConfig distill::ConfigLoader::load_text(
  const std::string& yaml_text ) const
{
  return resolve( read_text(yaml_text) );
}

inline distill::ConfigFile distill::ConfigLoader::read() const {
  log_->info( "Loading configuration from: " + path_ );
  return validate_document_root( read_yaml_file(path_) );
}

inline distill::ConfigFile distill::ConfigLoader::read_text(
  const std::string& yaml_text ) const
{
  return validate_document_root( parse_yaml(yaml_text) );
}

inline distill::ConfigFile distill::ConfigLoader::validate_document_root(
  const ordered_node& doc ) const
{
  if ( !doc.is_mapping() ) {
    throw ConfigurationError( "Config file must contain a YAML mapping" );
  }

  ConfigFile file = validate_or_throw( doc );
  log_->debug( "Config schema validated: " + file.schema + " v"
    + file.version );
  return file;
}

inline distill::ResolvedConfig distill::ConfigLoader::resolve(
  ConfigFile file ) const
{
  // TemplateError propagates unchanged so callers can tell the kinds apart
  ResolvedConfig out = pipeline_.run( std::move(file.cfg) );
  log_->info( "Configuration loaded successfully" );
  return out;
}
