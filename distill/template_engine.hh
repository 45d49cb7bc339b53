// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "distill/errors.hh"
#include "distill/node.hh"
#include "distill/path_resolver.hh"

namespace distill {

  // Strict multi-pass renderer for "{{ expr }}" templates used by the
  // configuration pipeline. Each pass evaluates every expression in the
  // string; values that are themselves templates are picked up by the next
  // pass. Rendering stops at the first pass with nothing left to evaluate.
  //
  // Expressions are paths: a root name followed by ".segment", ".0" or
  // "[index]" / "['key']" steps. The reserved root "this" addresses the
  // optional item scope of a single render call.
  class TemplateEngine {
  public:
    // Default maximum number of passes for a single render
    static constexpr int DEFAULT_MAX_PASSES = 5;

    inline explicit TemplateEngine( int max_passes = DEFAULT_MAX_PASSES )
      : max_passes_( max_passes )
    {
      if ( max_passes_ < 1 ) {
        throw std::invalid_argument( "template_engine: max_passes must be"
          " at least 1, got " + std::to_string(max_passes) );
      }
    }

    int max_passes() const { return max_passes_; }

    // Render until convergence. passes_out, if given, receives the number of
    // passes spent (including the final pass that found nothing to do).
    std::string render( const std::string& tmpl, const ordered_node& context,
      const ordered_node* item_scope = nullptr, int* passes_out = nullptr ) const;

    // Structure-preserving renders: every string leaf is rendered, mappings
    // and sequences are rebuilt with the same keys, order and length
    ordered_node render_node( const ordered_node& node,
      const ordered_node& context,
      const ordered_node* item_scope = nullptr ) const;

    ordered_node render_mapping( const ordered_node& mapping,
      const ordered_node& context,
      const ordered_node* item_scope = nullptr ) const;

    ordered_node render_sequence( const ordered_node& sequence,
      const ordered_node& context,
      const ordered_node* item_scope = nullptr ) const;

    // Cheap pre-check: is there a "{{ ... }}" span in the text?
    static bool has_template_vars( const std::string& text );

  private:

    // Shared state of one render() call, used to build error details
    struct RenderCall {
      const std::string& original;
      const ordered_node& context;
      const ordered_node* item_scope;
    };

    std::string render_pass( const std::string& text, const RenderCall& call,
      int pass, size_t& expressions ) const;

    std::string evaluate( const std::string& expr, const std::string& text,
      const RenderCall& call, int pass ) const;

    [[noreturn]] void throw_error( TemplateError::Kind what, int pass,
      const std::string& msg, const std::string& last,
      const RenderCall& call, const std::string& undefined_path = "",
      const std::string& undefined_root = "" ) const;

    int max_passes_;
  };

namespace internal {

  inline bool is_ident_start( char c ) {
    return std::isalpha( static_cast< unsigned char >(c) ) || c == '_';
  }

  inline bool is_ident_char( char c ) {
    return std::isalnum( static_cast< unsigned char >(c) )
      || c == '_' || c == '-';
  }

  // Split an expression such as "a.b[0]['c d'].e" into path segments.
  // Returns false and sets error on malformed input.
  inline bool parse_expression( const std::string& expr,
    std::vector< std::string >& segs, std::string& error )
  {
    segs.clear();
    size_t i = 0;
    const size_t n = expr.size();

    // A name or a run of digits (index after a dot)
    auto read_segment = [&]( bool root ) -> bool {
      const size_t start = i;
      if ( i < n && std::isdigit(static_cast< unsigned char >(expr[i])) ) {
        if ( root ) {
          error = "expression must start with a name";
          return false;
        }
        while ( i < n && std::isdigit(static_cast< unsigned char >(expr[i])) ) {
          ++i;
        }
      }
      else {
        if ( i >= n || !is_ident_start(expr[i]) ) {
          error = "expected a name at offset " + std::to_string( i );
          return false;
        }
        while ( i < n && is_ident_char(expr[i]) ) ++i;
      }
      segs.push_back( expr.substr(start, i - start) );
      return true;
    };

    if ( !read_segment(true) ) return false;

    while ( i < n ) {
      const char c = expr[ i ];
      if ( c == PATH_DELIMITER ) {
        ++i;
        if ( !read_segment(false) ) return false;
      }
      else if ( c == '[' ) {
        ++i;
        while ( i < n && expr[i] == ' ' ) ++i;
        if ( i < n && ( expr[i] == '\'' || expr[i] == '"' ) ) {
          const char quote = expr[ i++ ];
          const size_t close = expr.find( quote, i );
          if ( close == std::string::npos ) {
            error = "unterminated string in subscript";
            return false;
          }
          segs.push_back( expr.substr(i, close - i) );
          i = close + 1;
        }
        else {
          const size_t start = i;
          while ( i < n && std::isdigit(static_cast< unsigned char >(expr[i])) ) {
            ++i;
          }
          if ( i == start ) {
            error = "subscript must be an integer or a quoted key";
            return false;
          }
          segs.push_back( expr.substr(start, i - start) );
        }
        while ( i < n && expr[i] == ' ' ) ++i;
        if ( i >= n || expr[i] != ']' ) {
          error = "missing ']' in subscript";
          return false;
        }
        ++i;
      }
      else {
        error = std::string( "unexpected character '" ) + c
          + "' at offset " + std::to_string( i );
        return false;
      }
    }
    return true;
  }

} // namespace distill::internal

} // namespace distill

inline std::string distill::TemplateEngine::render( const std::string& tmpl,
  const ordered_node& context, const ordered_node* item_scope,
  int* passes_out ) const
{
  const RenderCall call{ tmpl, context, item_scope };

  std::string current = tmpl;
  for ( int pass = 1; pass <= max_passes_; ++pass ) {
    size_t expressions = 0;
    std::string next = render_pass( current, call, pass, expressions );

    // A pass with nothing left to evaluate reproduces its input byte for
    // byte. A pass that evaluated expressions and still produced the same
    // text (e.g. self: "{{ self }}") is a cycle, not convergence.
    if ( expressions == 0 && next == current ) {
      if ( passes_out ) *passes_out = pass;
      return next;
    }
    current = std::move( next );
  }

  throw_error( TemplateError::Kind::NonConvergence, max_passes_,
    "did not converge after " + std::to_string(max_passes_) + " passes",
    current, call );
}

inline std::string distill::TemplateEngine::render_pass(
  const std::string& text, const RenderCall& call, int pass,
  size_t& expressions ) const
{
  using internal::OPEN_PLACEHOLDER;
  using internal::CLOSE_PLACEHOLDER;

  std::string out;
  out.reserve( text.size() );
  size_t pos = 0;
  while ( true ) {
    const size_t open = text.find( OPEN_PLACEHOLDER, pos );
    if ( open == std::string::npos ) {
      out.append( text, pos, std::string::npos );
      break;
    }
    const size_t close = text.find( CLOSE_PLACEHOLDER,
      open + OPEN_PLACEHOLDER.size() );
    if ( close == std::string::npos ) {
      throw_error( TemplateError::Kind::Syntax, pass,
        "unterminated placeholder starting at offset " + std::to_string(open),
        text, call );
    }

    out.append( text, pos, open - pos );
    const std::string expr = internal::trim( text.substr(
      open + OPEN_PLACEHOLDER.size(),
      close - open - OPEN_PLACEHOLDER.size()) );
    out += evaluate( expr, text, call, pass );
    ++expressions;
    pos = close + CLOSE_PLACEHOLDER.size();
  }
  return out;
}

inline std::string distill::TemplateEngine::evaluate( const std::string& expr,
  const std::string& text, const RenderCall& call, int pass ) const
{
  if ( expr.empty() ) {
    throw_error( TemplateError::Kind::Syntax, pass, "empty expression",
      text, call );
  }

  std::vector< std::string > segs;
  std::string parse_error;
  if ( !internal::parse_expression(expr, segs, parse_error) ) {
    throw_error( TemplateError::Kind::Syntax, pass,
      "malformed expression '" + expr + "': " + parse_error, text, call );
  }

  LookupFailure failure;
  const ordered_node* value = nullptr;

  if ( segs.front() == internal::ITEM_SCOPE ) {
    // "this" never falls back to the global context
    if ( !call.item_scope ) {
      throw_error( TemplateError::Kind::UndefinedVariable, pass,
        "'" + expr + "' is undefined ('" + internal::ITEM_SCOPE
        + "' is only bound during a per-item render)",
        text, call, internal::join_path(segs), internal::ITEM_SCOPE );
    }
    const std::vector< std::string > rest( segs.begin() + 1, segs.end() );
    value = lookup( rest, *call.item_scope, &failure );
  }
  else {
    value = lookup( segs, call.context, &failure );
  }

  if ( !value ) {
    throw_error( TemplateError::Kind::UndefinedVariable, pass,
      "'" + expr + "' is undefined: " + failure.describe(), text, call,
      internal::join_path(segs), segs.front() );
  }
  return internal::to_string_any( *value );
}

[[noreturn]] inline void distill::TemplateEngine::throw_error(
  TemplateError::Kind what, int pass, const std::string& msg,
  const std::string& last, const RenderCall& call,
  const std::string& undefined_path, const std::string& undefined_root ) const
{
  TemplateError::Details d;
  d.what = what;
  d.pass = pass;
  d.message = msg;
  d.template_snippet = internal::snippet( call.original );
  d.last_result = internal::snippet( last );
  d.available_keys = internal::top_level_keys( call.context );
  if ( call.item_scope ) {
    d.available_keys.push_back( internal::ITEM_SCOPE );
    std::sort( d.available_keys.begin(), d.available_keys.end() );
  }
  d.undefined_path = undefined_path;
  d.undefined_root = undefined_root;
  throw TemplateError( std::move(d) );
}

inline bool distill::TemplateEngine::has_template_vars(
  const std::string& text )
{
  const size_t open = text.find( internal::OPEN_PLACEHOLDER );
  if ( open == std::string::npos ) return false;
  return text.find( internal::CLOSE_PLACEHOLDER,
    open + internal::OPEN_PLACEHOLDER.size() ) != std::string::npos;
}

inline distill::ordered_node distill::TemplateEngine::render_node(
  const ordered_node& node, const ordered_node& context,
  const ordered_node* item_scope ) const
{
  if ( node.is_string() ) {
    return internal::make_node_from( render(
      internal::to_native_checked< std::string >(node), context, item_scope) );
  }
  if ( node.is_mapping() ) return render_mapping( node, context, item_scope );
  if ( node.is_sequence() ) return render_sequence( node, context, item_scope );
  return node;
}

inline distill::ordered_node distill::TemplateEngine::render_mapping(
  const ordered_node& mapping, const ordered_node& context,
  const ordered_node* item_scope ) const
{
  if ( !mapping.is_mapping() ) {
    throw std::invalid_argument( "render_mapping: node is not a mapping" );
  }
  ordered_node out = ordered_node::mapping();
  for ( const auto& [mk, mv] : mapping.map_items() ) {
    out[ mk ] = render_node( mv, context, item_scope );
  }
  return out;
}

inline distill::ordered_node distill::TemplateEngine::render_sequence(
  const ordered_node& sequence, const ordered_node& context,
  const ordered_node* item_scope ) const
{
  if ( !sequence.is_sequence() ) {
    throw std::invalid_argument( "render_sequence: node is not a sequence" );
  }
  std::vector< ordered_node > out;
  out.reserve( sequence.size() );
  for ( size_t i = 0; i < sequence.size(); ++i ) {
    out.push_back( render_node(sequence.at(i), context, item_scope) );
  }
  return internal::make_node_from( out );
}
