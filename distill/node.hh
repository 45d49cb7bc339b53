// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace distill {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  // (registry "primary" selection and variant ordering depend on it)
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Constants defining the template syntax. This block provides a single
  // location for easy editing to allow for future changes.
  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string OPEN_PLACEHOLDER = "{{";
  inline const std::string CLOSE_PLACEHOLDER = "}}";

  // Reserved root name bound to the item scope of a per-item render call
  inline const std::string ITEM_SCOPE = "this";

  // Longest prefix of a template or intermediate result quoted in errors
  inline constexpr std::size_t SNIPPET_LIMIT = 200;

  // Divide a dotted path string by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& tok ) {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = tok.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( tok.substr(start) );
        break;
      }
      segs.push_back( tok.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Connects path segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) {
      std::ostringstream oss;
      oss << to_native_checked< double >( n );
      return oss.str();
    }
    if ( n.is_null() ) return "null";

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Strip surrounding blanks, e.g. the padding inside "{{ name }}"
  inline std::string trim( const std::string& s ) {
    const char* ws = " \t\r\n";
    const size_t b = s.find_first_not_of( ws );
    if ( b == std::string::npos ) return std::string();
    const size_t e = s.find_last_not_of( ws );
    return s.substr( b, e - b + 1 );
  }

  // Mapping keys are usually strings, but YAML allows any scalar
  inline std::string key_string( const ordered_node& k ) {
    return to_string_any( k );
  }

  // Does the text contain the opening delimiter of a placeholder?
  inline bool contains_placeholder_open( const std::string& s ) {
    return s.find( OPEN_PLACEHOLDER ) != std::string::npos;
  }

  // Bounded prefix of a string for diagnostics
  inline std::string snippet( const std::string& s,
    std::size_t limit = SNIPPET_LIMIT )
  {
    if ( s.size() <= limit ) return s;
    return s.substr( 0, limit ) + "...";
  }

  // Sorted list of the top-level keys of a mapping (empty for non-mappings)
  inline std::vector< std::string > top_level_keys( const ordered_node& m ) {
    std::vector< std::string > keys;
    if ( !m.is_mapping() ) return keys;
    for ( const auto& [mk, mv] : m.map_items() ) {
      keys.push_back( key_string(mk) );
    }
    std::sort( keys.begin(), keys.end() );
    return keys;
  }

} // namespace distill::internal

} // namespace distill
