// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cctype>
#include <string>
#include <vector>

#include "distill/errors.hh"
#include "distill/node.hh"

namespace distill {

namespace internal {

  // A segment made only of decimal digits addresses a sequence element
  inline bool is_index_segment( const std::string& seg ) {
    if ( seg.empty() || seg.size() > 18 ) return false;
    for ( char c : seg ) {
      if ( !std::isdigit( static_cast< unsigned char >(c) ) ) return false;
    }
    return true;
  }

  // Resolve one segment below the current node. Returns nullptr and sets
  // the reason when the segment cannot be followed.
  inline const ordered_node* step( const ordered_node& cur,
    const std::string& seg, std::string& reason )
  {
    if ( seg.empty() ) {
      reason = "empty path segment";
      return nullptr;
    }
    if ( cur.is_mapping() ) {
      if ( !cur.contains(seg) ) {
        reason = "no such key";
        return nullptr;
      }
      return &cur.at( seg );
    }
    if ( cur.is_sequence() ) {
      if ( !is_index_segment(seg) ) {
        reason = "sequence index must be a non-negative integer";
        return nullptr;
      }
      const size_t idx = static_cast< size_t >( std::stoull(seg) );
      if ( idx >= cur.size() ) {
        reason = "sequence index out of range (size "
          + std::to_string( cur.size() ) + ")";
        return nullptr;
      }
      return &cur.at( idx );
    }
    reason = "cannot index into a scalar value";
    return nullptr;
  }

} // namespace distill::internal

  // Navigate pre-split path segments through a nested mapping/sequence tree.
  // On failure returns nullptr and, if requested, fills failure_out with the
  // full path and the first segment that could not be followed.
  inline const ordered_node* lookup( const std::vector< std::string >& segs,
    const ordered_node& root, LookupFailure* failure_out = nullptr )
  {
    const ordered_node* cur = &root;
    for ( const auto& seg : segs ) {
      std::string reason;
      const ordered_node* next = internal::step( *cur, seg, reason );
      if ( !next ) {
        if ( failure_out ) {
          failure_out->path = internal::join_path( segs );
          failure_out->segment = seg;
          failure_out->reason = reason;
        }
        return nullptr;
      }
      cur = next;
    }
    return cur;
  }

  // Dotted-path form, e.g. lookup( "build.type.container", ctx )
  inline const ordered_node* lookup( const std::string& path,
    const ordered_node& root, LookupFailure* failure_out = nullptr )
  {
    return lookup( internal::split_segments(path), root, failure_out );
  }

} // namespace distill
