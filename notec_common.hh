//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// JSON for Modern C++
// https://github.com/nlohmann/json
#include <nlohmann/json.hpp>

namespace notec {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of templates, source
  // data and emitted schemas.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Base class for every fatal error raised by the compiler pipeline
  class Error : public std::runtime_error {
  public:
    explicit Error( const std::string& msg ) : std::runtime_error( msg ) {}
  };

  // Malformed template input (missing ids, unknown slot kinds, ...)
  class TemplateError : public Error {
  public:
    TemplateError( const std::string& location, const std::string& msg )
      : Error( location + ": " + msg ), location( location ) {}
    const std::string location;
  };

  // Malformed configuration document
  class ConfigError : public Error {
  public:
    explicit ConfigError( const std::string& msg ) : Error( msg ) {}
  };

  // Severity of a non-fatal diagnostic
  enum class Severity { Info, Warning, Error };

  inline const char* severity_name( Severity s ) {
    switch ( s ) {
      case Severity::Info: return "info";
      case Severity::Warning: return "warning";
      case Severity::Error: return "error";
    }
    return "unknown";
  }

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline constexpr const char* ARRAY_MARKER = "[]";

  inline const std::string JSON_SCHEMA_DRAFT
    = "https://json-schema.org/draft/2020-12/schema";
  inline const std::string DEFAULT_SCHEMA_ID_BASE = "https://notec/generated";

  // Divide a string by PATH_DELIMITER instances (empty pieces are kept)
  inline std::vector< std::string > split_segments( const std::string& tok ) {
    std::vector< std::string > segs;
    std::size_t start = 0;
    while ( true ) {
      std::size_t pos = tok.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( tok.substr(start) );
        break;
      }
      segs.push_back( tok.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Connects segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( std::size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  inline bool starts_with( const std::string& s, const std::string& prefix ) {
    return s.rfind( prefix, 0 ) == 0;
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

  inline ordered_node make_string_node( const std::string& s ) {
    return make_node_from< std::string >( s );
  }

  inline bool is_number( const ordered_node& n ) {
    return n.is_integer() || n.is_float_number();
  }

  inline double number_of( const ordered_node& n ) {
    if ( n.is_integer() ) {
      return static_cast< double >( to_native_checked< std::int64_t >(n) );
    }
    return to_native_checked< double >( n );
  }

  // Integral doubles become integer nodes so that 21 - 6 serializes as 15
  inline ordered_node make_number_node( double v ) {
    if ( std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15 ) {
      return make_node_from< std::int64_t >( static_cast< std::int64_t >(v) );
    }
    return make_node_from< double >( v );
  }

  // Shortest round-trip rendering of a number ("15", "0.25", "1e+21")
  inline std::string format_number( double v ) {
    if ( std::isnan(v) ) return "NaN";
    if ( std::isinf(v) ) return v < 0 ? "-Infinity" : "Infinity";
    if ( std::floor(v) == v && std::fabs(v) < 9.0e15 ) {
      return std::to_string( static_cast< std::int64_t >(v) );
    }
    char buf[ 64 ];
    auto res = std::to_chars( buf, buf + sizeof(buf), v );
    return std::string( buf, res.ptr );
  }

  inline std::string to_string_any( const ordered_node& n );

  // Read an optional string field from a mapping
  inline std::optional< std::string > string_field( const ordered_node& m,
    const std::string& key )
  {
    if ( !m.is_mapping() || !m.contains(key) ) return std::nullopt;
    const ordered_node& v = m.at( key );
    if ( v.is_null() ) return std::nullopt;
    if ( !v.is_string() ) return to_string_any( v );
    return to_native_checked< std::string >( v );
  }

  // Copy a mapping's keys in their stored order
  inline std::vector< std::string > mapping_keys( const ordered_node& m ) {
    std::vector< std::string > keys;
    if ( !m.is_mapping() ) return keys;
    for ( const auto& [mk, mv] : m.map_items() ) {
      keys.push_back( mk.get_value< std::string >() );
    }
    return keys;
  }

  // Deep merge of an overlay node onto a base node. Executes simple
  // replacement for scalars and sequences. An explicit null overlay clears
  // the corresponding base node. For an overlay and base that are both
  // mappings, deep merge the contents with an "overlay wins" policy.
  inline ordered_node deep_merge( const ordered_node& base,
    const ordered_node& overlay )
  {
    if ( overlay.is_null() ) return ordered_node();
    if ( !overlay.is_mapping() ) return overlay;
    if ( !base.is_mapping() ) return overlay;

    ordered_node result = base;
    for ( const auto& [mk, mv] : overlay.map_items() ) {
      const std::string k = mk.get_value< std::string >();
      if ( result.contains(k) ) {
        result[ k ] = deep_merge( result.at(k), mv );
      } else {
        result[ k ] = mv;
      }
    }
    return result;
  }

  // JSON emission goes through nlohmann::json: fkYAML serializes YAML
  // only. nlohmann::ordered_json keeps authored key order for schemas and
  // bundles; nlohmann::json sorts keys recursively for prompt context.
  template < typename Json >
  Json to_json_value( const ordered_node& n ) {
    if ( n.is_mapping() ) {
      Json obj = Json::object();
      for ( const auto& [mk, mv] : n.map_items() ) {
        obj[ mk.get_value< std::string >() ] = to_json_value< Json >( mv );
      }
      return obj;
    }
    if ( n.is_sequence() ) {
      Json arr = Json::array();
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        arr.push_back( to_json_value< Json >(n.at(i)) );
      }
      return arr;
    }
    if ( n.is_null() ) return Json();
    if ( n.is_boolean() ) return Json( n.get_value< bool >() );
    if ( n.is_integer() ) {
      return Json( to_native_checked< std::int64_t >(n) );
    }
    if ( n.is_float_number() ) {
      const double v = to_native_checked< double >( n );
      // JSON has no NaN/Infinity
      if ( !std::isfinite(v) ) return Json();
      if ( std::floor(v) == v && std::fabs(v) < 9.0e15 ) {
        return Json( static_cast< std::int64_t >(v) );
      }
      return Json( v );
    }
    return Json( to_native_checked< std::string >(n) );
  }

  // indent <= 0 gives the compact form. Invalid UTF-8 in strings is
  // replaced with U+FFFD.
  inline std::string to_json( const ordered_node& n, bool sort_keys = false,
    int indent = 2 )
  {
    const int width = indent > 0 ? indent : -1;
    const auto handler = nlohmann::json::error_handler_t::replace;
    if ( sort_keys ) {
      return to_json_value< nlohmann::json >( n ).dump( width, ' ', false,
        handler );
    }
    return to_json_value< nlohmann::ordered_json >( n ).dump( width, ' ',
      false, handler );
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_number(
      to_native_checked< double >( n )
    );
    if ( n.is_null() ) return "null";

    // We did not match any of the scalar types, so fall back to JSON
    return to_json( n, false, 0 );
  }

  // Helpers for rejection of YAML anchors/aliases in raw text input

  inline bool is_anchor_alias_name_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '_' || c == '-';
  }

  // Characters that can precede the start of a YAML value token.
  inline bool is_boundary_left_char( char ch ) {
    switch ( ch ) {
      case ' ': case '\t': case '-': case ':':
      case '[': case '{': case ',':
        return true;
      default: return false;
    }
  }

  // Characters that can follow the end of an alias/anchor token.
  inline bool is_boundary_right_char( char ch ) {
    switch ( ch ) {
      case ' ': case '\t': case '\r': case '\n':
      case ',': case ']': case '}': case '#': case ':':
        return true;
      default: return false;
    }
  }

  // True when text[i] begins a value rather than continuing a plain scalar
  inline bool at_value_start( const std::string& text, std::size_t i ) {
    std::size_t p = i;
    while ( p > 0 && (text[p - 1] == ' ' || text[p - 1] == '\t') ) --p;
    return p == 0 || text[p - 1] == '\n'
      || is_boundary_left_char( text[p - 1] );
  }

  // Name of the anchor or alias token starting at text[i] ('&' or '*'), or
  // an empty string when the character is part of a plain scalar.
  inline std::string anchor_alias_token( const std::string& text,
    std::size_t i )
  {
    std::size_t k = i + 1;
    while ( k < text.size() && is_anchor_alias_name_char(text[k]) ) ++k;
    if ( k == i + 1 || !at_value_start(text, i) ) return std::string();

    // "&base value" and "*ref," both end the token
    if ( k < text.size() && text[k] != '\r'
      && !is_boundary_right_char(text[k]) ) return std::string();

    return text.substr( i + 1, k - i - 1 );
  }

  // Reject anchor/alias tokens (&/*) in raw YAML or JSON input. Comments and
  // quoted scalars are skipped: double-quoted scalars honour backslash
  // escapes, single-quoted scalars the doubled '' quote. Templates carry
  // provenance per field, so aliased subtrees are not allowed.
  inline void preflight_reject_anchors_aliases( const std::string& text ) {
    enum class Scan { Plain, SingleQuoted, DoubleQuoted, Comment };
    Scan state = Scan::Plain;
    std::size_t line = 1, col = 0;

    for ( std::size_t i = 0; i < text.size(); ++i ) {
      const char c = text[ i ];
      ++col;
      if ( c == '\n' ) {
        ++line;
        col = 0;
        if ( state == Scan::Comment ) state = Scan::Plain;
        continue;
      }

      switch ( state ) {
        case Scan::Comment:
          continue;
        case Scan::DoubleQuoted:
          if ( c == '\\' && i + 1 < text.size() && text[i + 1] != '\n' ) {
            ++i;
            ++col;
          } else if ( c == '"' ) {
            state = Scan::Plain;
          }
          continue;
        case Scan::SingleQuoted:
          if ( c == '\'' ) {
            if ( i + 1 < text.size() && text[i + 1] == '\'' ) {
              ++i;
              ++col;
            } else {
              state = Scan::Plain;
            }
          }
          continue;
        case Scan::Plain:
          break;
      }

      // "a#b" and "don't" stay plain scalars
      if ( c == '#'
        && ( i == 0 || text[i - 1] == ' ' || text[i - 1] == '\t' ) )
      {
        state = Scan::Comment;
        continue;
      }
      if ( ( c == '"' || c == '\'' ) && at_value_start(text, i) ) {
        state = c == '"' ? Scan::DoubleQuoted : Scan::SingleQuoted;
        continue;
      }
      if ( c != '&' && c != '*' ) continue;

      const std::string name = anchor_alias_token( text, i );
      if ( name.empty() ) continue;
      std::ostringstream oss;
      oss << "YAML " << ( c == '&' ? "anchors" : "aliases" )
        << " are not allowed in notec documents (found '" << c << name
        << "' at line " << line << ", column " << col << ").";
      throw Error( oss.str() );
    }
  }

  // DOM-level detection of anchors/aliases, just in case
  inline void detect_anchors_or_throw( const ordered_node& node,
    const std::vector< std::string >& path )
  {
    if ( node.is_anchor() || node.is_alias() ) {
      std::ostringstream oss;
      oss << join_path( path ) << ": YAML ";
      oss << ( node.is_anchor() ? "anchors" : "aliases" );
      oss << " are not allowed in notec documents";
      throw Error( oss.str() );
    }

    if ( node.is_mapping() ) {
      for ( const auto& [mk, mv] : node.map_items() ) {
        std::vector< std::string > p2 = path;
        p2.push_back( mk.get_value< std::string >() );
        detect_anchors_or_throw( mv, p2 );
      }
    }
    else if ( node.is_sequence() ) {
      for ( std::size_t i = 0; i < node.size(); ++i ) {
        std::vector< std::string > p2 = path;
        p2.back() += '[' + std::to_string( i ) + ']';
        detect_anchors_or_throw( node.at(i), p2 );
      }
    }
  }

} // namespace notec::internal

  // Parse YAML or JSON text into a document, rejecting anchors/aliases
  inline ordered_node parse_document( const std::string& text,
    const std::string& label = "document" )
  {
    internal::preflight_reject_anchors_aliases( text );
    ordered_node dom = ordered_node::deserialize( text );
    internal::detect_anchors_or_throw( dom, { label } );
    return dom;
  }

  inline ordered_node parse_document( std::istream& in,
    const std::string& label = "document" )
  {
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_document( ss.str(), label );
  }

} // namespace notec
