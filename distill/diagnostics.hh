// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace distill {

  enum class LogLevel { Debug = 0, Info, Warning, Error };

  enum class LogFormat { Json, Text };

  // Text lines are written as "[distill] <level>: <message>" to the
  // configured stream, the same shape the command-line front ends use for
  // fatal errors. Json lines carry the same fields as one object per line.
  class Logger {
  public:
    inline explicit Logger( std::ostream& out = std::cerr,
      LogLevel threshold = LogLevel::Info, LogFormat format = LogFormat::Text )
      : out_( &out ), threshold_( threshold ), format_( format ) {}

    LogLevel threshold() const { return threshold_; }
    void set_threshold( LogLevel lvl ) { threshold_ = lvl; }

    LogFormat format() const { return format_; }
    void set_format( LogFormat f ) { format_ = f; }

    // Redirect to a caller-owned stream (e.g., a std::ostringstream in tests)
    void set_stream( std::ostream& out ) { owned_.reset(); out_ = &out; }

    // Redirect to a file opened in append mode and owned by the logger
    void open_file( const std::string& path );

    bool enabled( LogLevel lvl ) const { return lvl >= threshold_; }

    void write( LogLevel lvl, const std::string& msg );

    void debug( const std::string& msg ) { write( LogLevel::Debug, msg ); }
    void info( const std::string& msg ) { write( LogLevel::Info, msg ); }
    void warning( const std::string& msg ) { write( LogLevel::Warning, msg ); }
    void error( const std::string& msg ) { write( LogLevel::Error, msg ); }

  private:
    std::ostream* out_;
    std::unique_ptr< std::ofstream > owned_;
    LogLevel threshold_;
    LogFormat format_;
  };

  inline const char* to_string( LogLevel lvl ) {
    switch ( lvl ) {
      case LogLevel::Debug: return "debug";
      case LogLevel::Info: return "info";
      case LogLevel::Warning: return "warning";
      case LogLevel::Error: return "error";
    }
    return "unknown";
  }

  // Accepts the configuration spellings (DEBUG, INFO, WARNING, ERROR) as
  // well as lower case
  inline std::optional< LogLevel > parse_log_level( const std::string& s ) {
    std::string t;
    for ( char c : s ) {
      t += static_cast< char >( std::tolower( static_cast<unsigned char>(c) ) );
    }
    if ( t == "debug" ) return LogLevel::Debug;
    if ( t == "info" ) return LogLevel::Info;
    if ( t == "warning" ) return LogLevel::Warning;
    if ( t == "error" ) return LogLevel::Error;
    return std::nullopt;
  }

namespace internal {

  // Quote a string as a JSON string literal
  inline std::string json_quote( const std::string& s ) {
    std::ostringstream oss;
    oss << '"';
    for ( char c : s ) {
      switch ( c ) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
          if ( static_cast< unsigned char >(c) < 0x20 ) {
            oss << "\\u00" << std::hex << std::setw( 2 ) << std::setfill( '0' )
              << static_cast< int >( c ) << std::dec;
          }
          else oss << c;
      }
    }
    oss << '"';
    return oss.str();
  }

} // namespace distill::internal

  // Process-wide logger used by the library components
  inline Logger& diag() {
    static Logger instance;
    return instance;
  }

} // namespace distill

inline void distill::Logger::open_file( const std::string& path ) {
  auto f = std::make_unique< std::ofstream >( path, std::ios::app );
  if ( !f->is_open() ) {
    throw std::runtime_error( "Failed to open log file: " + path );
  }
  owned_ = std::move( f );
  out_ = owned_.get();
}

inline void distill::Logger::write( LogLevel lvl, const std::string& msg ) {
  if ( !enabled(lvl) ) return;
  if ( format_ == LogFormat::Json ) {
    ( *out_ ) << "{\"logger\": \"distill\", \"level\": "
      << internal::json_quote( to_string(lvl) ) << ", \"message\": "
      << internal::json_quote( msg ) << "}\n";
    return;
  }
  ( *out_ ) << "[distill] " << to_string( lvl ) << ": " << msg << '\n';
}
