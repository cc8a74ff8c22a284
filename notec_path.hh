//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "notec_common.hh"

namespace notec {

  // A parsed unit of a dotted output/target path.
  //   "plan.homework[].text" -> plan, homework[] (wildcard), text
  //   "diagnoses[2]"         -> diagnoses[2] (indexed)
  struct PathSegment {
    std::string name;
    bool is_array = false;
    std::optional< std::size_t > index;

    bool operator==( const PathSegment& o ) const {
      return name == o.name && is_array == o.is_array && index == o.index;
    }
  };

  class InvalidPath : public Error {
  public:
    InvalidPath( const std::string& path, const std::string& msg )
      : Error( "Invalid path \"" + path + "\": " + msg ), path( path ) {}
    const std::string path;
  };

  std::vector< PathSegment > parse_path( const std::string& path );
  std::string join_segments( const std::vector< PathSegment >& segs );
  std::string leaf_name( const std::string& path );
  std::optional< std::string > parent_path( const std::string& path );
  bool has_array_segments( const std::string& path );
  bool validate_path( const std::string& path );

  // Strict read. Indexed segments index into arrays, wildcard segments
  // yield the array itself. Returns nullopt when any step is absent.
  std::optional< ordered_node > get_by_path( const ordered_node& doc,
    const std::string& path );

  // Lenient read used for dependency checks: array markers are ignored and
  // arrays are descended transparently through their first element that
  // holds the next key.
  std::optional< ordered_node > resolve_loose( const ordered_node& doc,
    const std::string& path );

  // Write value at path, creating intermediate objects and arrays on
  // demand. Throws Error when an existing scalar blocks the path.
  void set_by_path( ordered_node& doc, const std::string& path,
    const ordered_node& value );

namespace internal {

  inline bool is_identifier( const std::string& s ) {
    if ( s.empty() ) return false;
    unsigned char c0 = static_cast< unsigned char >( s[0] );
    if ( !std::isalpha(c0) && s[0] != '_' ) return false;
    for ( char ch : s ) {
      unsigned char c = static_cast< unsigned char >( ch );
      if ( !std::isalnum(c) && ch != '_' && ch != '-' ) return false;
    }
    return true;
  }

  // Decimal array index. nullopt for anything that is not all digits or
  // does not fit in size_t.
  inline std::optional< std::size_t > parse_index( const std::string& s ) {
    if ( s.empty() ) return std::nullopt;
    for ( char ch : s ) {
      if ( !std::isdigit(static_cast< unsigned char >(ch)) ) {
        return std::nullopt;
      }
    }
    std::size_t value = 0;
    const char* end = s.data() + s.size();
    const std::from_chars_result res = std::from_chars( s.data(), end, value );
    if ( res.ec != std::errc() || res.ptr != end ) return std::nullopt;
    return value;
  }

  // Path with indices normalized to wildcards ("a[2].b" -> "a[].b")
  inline std::string wildcard_path( const std::vector< PathSegment >& segs,
    std::size_t count )
  {
    std::string s;
    for ( std::size_t i = 0; i < count && i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[i].name;
      if ( segs[i].is_array ) s += ARRAY_MARKER;
    }
    return s;
  }

  // Rebuild a sequence node with one element replaced, growing with nulls
  inline void put_sequence_element( ordered_node& seq, std::size_t index,
    const ordered_node& value )
  {
    std::vector< ordered_node > out;
    if ( seq.is_sequence() ) {
      out.reserve( seq.size() );
      for ( std::size_t i = 0; i < seq.size(); ++i ) out.push_back( seq.at(i) );
    }
    if ( out.size() <= index ) out.resize( index + 1 );
    out[ index ] = value;
    seq = make_node_from( out );
  }

  inline void set_recursive( ordered_node& cur,
    const std::vector< PathSegment >& segs, std::size_t i,
    const ordered_node& value, const std::string& full_path )
  {
    const PathSegment& seg = segs[ i ];
    const bool last = ( i + 1 == segs.size() );

    if ( cur.is_null() ) cur = ordered_node::mapping();
    if ( !cur.is_mapping() ) {
      std::ostringstream oss;
      oss << "cannot set '" << full_path << "': '"
        << wildcard_path( segs, i ) << "' is not an object";
      throw Error( oss.str() );
    }

    if ( !seg.is_array ) {
      if ( last ) {
        cur[ seg.name ] = value;
        return;
      }
      ordered_node child = cur.contains( seg.name )
        ? cur.at( seg.name ) : ordered_node();
      set_recursive( child, segs, i + 1, value, full_path );
      cur[ seg.name ] = child;
      return;
    }

    // Array segment
    ordered_node arr = cur.contains( seg.name )
      ? cur.at( seg.name ) : ordered_node();
    if ( arr.is_null() ) arr = ordered_node::sequence();
    if ( !arr.is_sequence() ) {
      std::ostringstream oss;
      oss << "cannot set '" << full_path << "': '"
        << wildcard_path( segs, i ) << "' is not an array";
      throw Error( oss.str() );
    }

    if ( last && !seg.index ) {
      // Wildcard leaf: the value becomes the array contents
      if ( value.is_sequence() ) {
        cur[ seg.name ] = value;
      } else {
        std::vector< ordered_node > single{ value };
        cur[ seg.name ] = make_node_from( single );
      }
      return;
    }

    // Wildcard intermediates write into the first element
    const std::size_t idx = seg.index ? *seg.index : 0;
    if ( last ) {
      put_sequence_element( arr, idx, value );
    } else {
      ordered_node elem = ( idx < arr.size() ) ? arr.at( idx ) : ordered_node();
      set_recursive( elem, segs, i + 1, value, full_path );
      put_sequence_element( arr, idx, elem );
    }
    cur[ seg.name ] = arr;
  }

} // namespace notec::internal

} // namespace notec

// Parse "a.b[].c" / "a[3]" into segments. Every piece must be a name
// matching [A-Za-z_][A-Za-z0-9_-]*, optionally followed by "[]" or "[N]".
inline std::vector< notec::PathSegment >
  notec::parse_path( const std::string& path )
{
  if ( path.empty() ) {
    throw InvalidPath( path, "path must be a non-empty string" );
  }

  std::vector< PathSegment > out;
  for ( const std::string& piece : internal::split_segments(path) ) {
    if ( piece.empty() ) {
      throw InvalidPath( path, "empty segment" );
    }

    PathSegment seg;
    std::string name = piece;
    const std::size_t open = piece.find( '[' );
    if ( open != std::string::npos ) {
      if ( piece.back() != ']' ) {
        throw InvalidPath( path, "unterminated array marker in \""
          + piece + "\"" );
      }
      name = piece.substr( 0, open );
      const std::string inner = piece.substr( open + 1,
        piece.size() - open - 2 );
      seg.is_array = true;
      if ( !inner.empty() ) {
        seg.index = internal::parse_index( inner );
        if ( !seg.index ) {
          throw InvalidPath( path, "array index must be a non-negative "
            "integer in \"" + piece + "\"" );
        }
      }
      if ( name.empty() ) {
        throw InvalidPath( path, "array marker without name in \""
          + piece + "\"" );
      }
    }

    if ( !internal::is_identifier(name) ) {
      throw InvalidPath( path, "segment \"" + piece + "\" must start with a "
        "letter or underscore, followed by letters, numbers, underscores, "
        "or hyphens" );
    }
    seg.name = name;
    out.push_back( seg );
  }
  return out;
}

inline std::string notec::join_segments(
  const std::vector< PathSegment >& segs )
{
  std::string s;
  for ( std::size_t i = 0; i < segs.size(); ++i ) {
    if ( i ) s += internal::PATH_DELIMITER;
    s += segs[i].name;
    if ( segs[i].is_array ) {
      s += '[';
      if ( segs[i].index ) s += std::to_string( *segs[i].index );
      s += ']';
    }
  }
  return s;
}

inline std::string notec::leaf_name( const std::string& path ) {
  return parse_path( path ).back().name;
}

// "plan.homework[].text" -> "plan.homework[]"; single segment -> nullopt
inline std::optional< std::string >
  notec::parent_path( const std::string& path )
{
  std::vector< PathSegment > segs = parse_path( path );
  if ( segs.size() == 1 ) return std::nullopt;
  segs.pop_back();
  return join_segments( segs );
}

inline bool notec::has_array_segments( const std::string& path ) {
  for ( const PathSegment& s : parse_path(path) ) {
    if ( s.is_array ) return true;
  }
  return false;
}

inline bool notec::validate_path( const std::string& path ) {
  parse_path( path );
  return true;
}

inline std::optional< notec::ordered_node > notec::get_by_path(
  const ordered_node& doc, const std::string& path )
{
  if ( path.empty() ) return std::nullopt;

  // Source-data paths are not restricted to the identifier grammar, so
  // pieces are split lexically here rather than through parse_path.
  const ordered_node* cur = &doc;
  for ( const std::string& piece : internal::split_segments(path) ) {
    if ( piece.empty() ) return std::nullopt;

    std::string key = piece;
    std::optional< std::size_t > index;
    bool wildcard = false;
    const std::size_t open = piece.find( '[' );
    if ( open != std::string::npos && piece.back() == ']' ) {
      const std::string inner = piece.substr( open + 1,
        piece.size() - open - 2 );
      key = piece.substr( 0, open );
      if ( inner.empty() ) {
        wildcard = true;
      } else {
        index = internal::parse_index( inner );
        if ( !index ) return std::nullopt;
      }
    }

    if ( !cur->is_mapping() || !cur->contains(key) ) return std::nullopt;
    cur = &cur->at( key );

    if ( index ) {
      if ( !cur->is_sequence() || *index >= cur->size() ) return std::nullopt;
      cur = &cur->at( *index );
    } else if ( wildcard && !cur->is_sequence() ) {
      return std::nullopt;
    }
  }
  return *cur;
}

inline std::optional< notec::ordered_node > notec::resolve_loose(
  const ordered_node& doc, const std::string& path )
{
  if ( path.empty() ) return std::nullopt;

  ordered_node cur = doc;
  for ( const std::string& piece : internal::split_segments(path) ) {
    std::string key = piece;
    std::optional< std::size_t > index;
    const std::size_t open = piece.find( '[' );
    if ( open != std::string::npos && piece.back() == ']' ) {
      const std::string inner = piece.substr( open + 1,
        piece.size() - open - 2 );
      key = piece.substr( 0, open );
      if ( !inner.empty() ) {
        index = internal::parse_index( inner );
        if ( !index ) return std::nullopt;
      }
    }

    if ( cur.is_sequence() ) {
      std::optional< ordered_node > next;
      for ( std::size_t i = 0; i < cur.size(); ++i ) {
        const ordered_node& el = cur.at( i );
        if ( el.is_mapping() && el.contains(key) ) {
          next = el.at( key );
          break;
        }
      }
      if ( !next ) return std::nullopt;
      cur = *next;
    } else {
      if ( !cur.is_mapping() || !cur.contains(key) ) return std::nullopt;
      ordered_node next = cur.at( key );
      cur = next;
    }

    if ( index ) {
      if ( !cur.is_sequence() || *index >= cur.size() ) return std::nullopt;
      ordered_node next = cur.at( *index );
      cur = next;
    }
  }
  return cur;
}

inline void notec::set_by_path( ordered_node& doc, const std::string& path,
  const ordered_node& value )
{
  const std::vector< PathSegment > segs = parse_path( path );
  internal::set_recursive( doc, segs, 0, value, path );
}
