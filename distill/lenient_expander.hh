// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "distill/diagnostics.hh"
#include "distill/errors.hh"
#include "distill/node.hh"
#include "distill/path_resolver.hh"

namespace distill {

namespace internal {

  // Upper bounds for one top-level expand call. A self-feeding value such as
  // a: "x{{ a }}" would otherwise grow exponentially with the depth.
  constexpr size_t MAX_EXPANDED_SIZE = 64 * 1024;  // 64 KiB
  constexpr size_t MAX_PLACEHOLDERS = 128;

  // Shared by every nested expansion started from one expand call
  struct ExpansionState {
    std::unordered_set< std::string > warned;
    size_t substitutions = 0;
    std::string limit_exceeded;  // "placeholder_limit" | "expansion_overflow"
  };

  inline const std::regex& lenient_placeholder_pattern() {
    static const std::regex ph( R"(\{\{\s*([^}]+?)\s*\}\})" );
    return ph;
  }

} // namespace distill::internal

  // Best-effort "{{ dotted.path }}" substitution used for previewing build
  // commands. Unresolvable placeholders are left verbatim and reported as
  // warnings; nothing here throws for a missing name.
  class LenientExpander {
  public:
    static constexpr int DEFAULT_MAX_DEPTH = 10;

    inline explicit LenientExpander( int max_depth = DEFAULT_MAX_DEPTH,
      Logger& log = diag() )
      : max_depth_( max_depth ), log_( &log ) {}

    int max_depth() const { return max_depth_; }

    std::string expand( const std::string& text,
      const ordered_node& context ) const
    {
      return expand( text, context, max_depth_ );
    }

    // Repeat whole-string passes until no placeholder is left, a pass
    // changes nothing, or max_depth passes have been spent
    std::string expand( const std::string& text, const ordered_node& context,
      int max_depth ) const;

    // Expand every string leaf of a tree; shape and key order are unchanged
    ordered_node expand_tree( const ordered_node& node,
      const ordered_node& context ) const;

  private:
    std::string expand_with( const std::string& text,
      const ordered_node& context, int budget,
      internal::ExpansionState& state ) const;

    // One left-to-right pass. Literal spans and substituted values are
    // appended to a fresh buffer, so match offsets are never invalidated.
    // Nested template values get the budget left after this pass.
    std::string substitute_once( const std::string& text,
      const ordered_node& context, int budget, bool& found,
      internal::ExpansionState& state ) const;

    int max_depth_;
    Logger* log_;
  };

} // namespace distill

inline std::string distill::LenientExpander::expand( const std::string& text,
  const ordered_node& context, int max_depth ) const
{
  internal::ExpansionState state;
  std::string result = expand_with( text, context, max_depth, state );
  if ( !state.limit_exceeded.empty() ) {
    std::string snippet = text.substr( 0, 60 );
    if ( snippet.size() < text.size() ) snippet += "...";
    if ( state.limit_exceeded == "placeholder_limit" ) {
      log_->warning( "Expansion of '" + snippet + "' stopped after "
        + std::to_string(internal::MAX_PLACEHOLDERS)
        + " placeholder substitutions; result left partially expanded" );
    }
    else {
      log_->warning( "Expansion of '" + snippet + "' exceeds "
        + std::to_string(internal::MAX_EXPANDED_SIZE)
        + " bytes; result left partially expanded" );
    }
  }
  return result;
}

inline std::string distill::LenientExpander::expand_with(
  const std::string& text, const ordered_node& context, int budget,
  internal::ExpansionState& state ) const
{
  std::string current = text;
  for ( int pass = 0; pass < budget; ++pass ) {
    bool found = false;
    std::string next = substitute_once( current, context, budget - pass - 1,
      found, state );
    // An unfinished pass is dropped; the last complete one is kept
    if ( !state.limit_exceeded.empty() ) break;
    if ( !found || next == current ) break;
    current = std::move( next );
  }
  return current;
}

inline std::string distill::LenientExpander::substitute_once(
  const std::string& text, const ordered_node& context, int budget,
  bool& found, internal::ExpansionState& state ) const
{
  const std::regex& ph = internal::lenient_placeholder_pattern();

  std::string out;
  out.reserve( text.size() );
  auto literal_begin = text.cbegin();

  for ( std::sregex_iterator it( text.cbegin(), text.cend(), ph ), end;
    it != end; ++it )
  {
    const std::smatch& m = *it;
    found = true;
    out.append( literal_begin, m[0].first );
    literal_begin = m[0].second;

    const std::string var_path = internal::trim( m[1].str() );
    LookupFailure failure;
    const ordered_node* value = lookup( var_path, context, &failure );
    if ( !value ) {
      // Leave the placeholder for a later, richer context
      if ( state.warned.insert(var_path).second ) {
        log_->warning( "Unable to resolve placeholder '" + m[0].str() + "': "
          + failure.describe() );
      }
      out.append( m[0].first, m[0].second );
      continue;
    }

    if ( ++state.substitutions > internal::MAX_PLACEHOLDERS ) {
      state.limit_exceeded = "placeholder_limit";
      return text;
    }

    std::string replacement = internal::to_string_any( *value );

    // The value is itself a template: expand it with the remaining budget
    if ( value->is_string() && internal::contains_placeholder_open(replacement) )
    {
      replacement = expand_with( replacement, context, budget, state );
      if ( !state.limit_exceeded.empty() ) return text;
    }
    out += replacement;
    if ( out.size() > internal::MAX_EXPANDED_SIZE ) {
      state.limit_exceeded = "expansion_overflow";
      return text;
    }
  }
  out.append( literal_begin, text.cend() );
  if ( out.size() > internal::MAX_EXPANDED_SIZE ) {
    state.limit_exceeded = "expansion_overflow";
    return text;
  }
  return out;
}

inline distill::ordered_node distill::LenientExpander::expand_tree(
  const ordered_node& node, const ordered_node& context ) const
{
  if ( node.is_string() ) {
    const std::string s = internal::to_native_checked< std::string >( node );
    if ( !internal::contains_placeholder_open(s) ) return node;
    return internal::make_node_from( expand(s, context) );
  }
  if ( node.is_mapping() ) {
    ordered_node out = ordered_node::mapping();
    for ( const auto& [mk, mv] : node.map_items() ) {
      out[ mk ] = expand_tree( mv, context );
    }
    return out;
  }
  if ( node.is_sequence() ) {
    std::vector< ordered_node > out;
    out.reserve( node.size() );
    for ( size_t i = 0; i < node.size(); ++i ) {
      out.push_back( expand_tree(node.at(i), context) );
    }
    return internal::make_node_from( out );
  }
  // Non-string scalars and null: nothing to do
  return node;
}
