//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "notec_derive.hh"

namespace notec {

  class TypeConflict : public Error {
  public:
    TypeConflict( const std::string& path, SchemaType a, SchemaType b )
      : Error( "Type conflict at path \"" + path + "\": one schema says \""
          + schema_type_name(a) + "\", other says \"" + schema_type_name(b)
          + "\"" ),
        path( path ), type_a( a ), type_b( b ) {}
    const std::string path;
    const SchemaType type_a;
    const SchemaType type_b;
  };

  class EnumConflict : public Error {
  public:
    explicit EnumConflict( const std::string& path )
      : Error( "Enum conflict at path \"" + path
          + "\": enumerations have no common value" ),
        path( path ) {}
    const std::string path;
  };

  class PatternConflict : public Error {
  public:
    PatternConflict( const std::string& path, const std::string& a,
      const std::string& b )
      : Error( "Pattern conflict at path \"" + path + "\": \"" + a
          + "\" vs \"" + b + "\"" ),
        path( path ), pattern_a( a ), pattern_b( b ) {}
    const std::string path;
    const std::string pattern_a;
    const std::string pattern_b;
  };

  class ConstraintConflict : public Error {
  public:
    ConstraintConflict( const std::string& path, const std::string& lower_kw,
      const std::string& upper_kw, const std::string& lower,
      const std::string& upper )
      : Error( "Constraint conflict at path \"" + path + "\": " + lower_kw
          + " " + lower + " exceeds " + upper_kw + " " + upper ),
        path( path ), keyword( lower_kw ) {}
    const std::string path;
    const std::string keyword;
  };

  // Merge two nodes describing the same payload location. Never mutates
  // its inputs; the result is a fresh subtree. Throws TypeConflict,
  // EnumConflict, PatternConflict or ConstraintConflict.
  SchemaNode merge_nodes( const SchemaNode& a, const SchemaNode& b,
    const std::string& path );

  // Assemble the render payload schema from the model and non-model halves
  DerivedSchema merge_schemas( const DerivedSchema& model,
    const DerivedSchema& non_model, const std::string& template_id,
    const std::string& template_name, const std::string& template_version,
    const std::string& id_base = internal::DEFAULT_SCHEMA_ID_BASE );

  // Dry run of merge_schemas: throws the error a full merge would throw
  bool validate_mergeable( const DerivedSchema& a, const DerivedSchema& b );

namespace internal {

  // Lower bounds keep the larger value, upper bounds the smaller one
  template < typename T >
  inline std::optional< T > stricter_lower( const std::optional< T >& a,
    const std::optional< T >& b )
  {
    if ( a && b ) return std::max( *a, *b );
    return a ? a : b;
  }

  template < typename T >
  inline std::optional< T > stricter_upper( const std::optional< T >& a,
    const std::optional< T >& b )
  {
    if ( a && b ) return std::min( *a, *b );
    return a ? a : b;
  }

  template < typename T >
  inline void check_bounds( const std::string& path,
    const std::optional< T >& lower, const std::optional< T >& upper,
    const std::string& lower_kw, const std::string& upper_kw )
  {
    if ( lower && upper && *lower > *upper ) {
      std::ostringstream lo, hi;
      lo << *lower;
      hi << *upper;
      throw ConstraintConflict( path, lower_kw, upper_kw, lo.str(), hi.str() );
    }
  }

  inline std::vector< std::string > union_names(
    const std::vector< std::string >& a, const std::vector< std::string >& b )
  {
    std::vector< std::string > out = a;
    for ( const std::string& n : b ) {
      if ( std::find(out.begin(), out.end(), n) == out.end() ) {
        out.push_back( n );
      }
    }
    return out;
  }

  inline void merge_object_properties( SchemaNode& out, const SchemaNode& a,
    const SchemaNode& b, const std::string& path )
  {
    for ( const auto& [name, child] : a.properties ) {
      const std::string child_path = path.empty() ? name : path + "." + name;
      const SchemaNode* other = b.property( name );
      out.properties.emplace_back( name, std::make_unique< SchemaNode >(
        other ? merge_nodes( *child, *other, child_path ) : *child ) );
    }
    for ( const auto& [name, child] : b.properties ) {
      if ( a.property(name) ) continue;
      out.properties.emplace_back( name,
        std::make_unique< SchemaNode >( *child ) );
    }
    out.required = union_names( a.required, b.required );
  }

} // namespace notec::internal

} // namespace notec

inline notec::SchemaNode notec::merge_nodes( const SchemaNode& a,
  const SchemaNode& b, const std::string& path )
{
  if ( a.type != b.type ) throw TypeConflict( path, a.type, b.type );

  SchemaNode out( a.type );

  switch ( a.type ) {
    case SchemaType::Object:
      internal::merge_object_properties( out, a, b, path );
      // Closed wins
      out.additional_properties = a.additional_properties
        && b.additional_properties;
      break;

    case SchemaType::Array:
      if ( a.items && b.items ) {
        out.items = std::make_unique< SchemaNode >(
          merge_nodes( *a.items, *b.items, path + internal::ARRAY_MARKER ) );
      } else if ( a.items || b.items ) {
        out.items = std::make_unique< SchemaNode >(
          a.items ? *a.items : *b.items );
      }
      break;

    case SchemaType::String: {
      if ( a.enum_values && b.enum_values ) {
        std::vector< std::string > common;
        for ( const std::string& v : *a.enum_values ) {
          const bool in_b = std::find( b.enum_values->begin(),
            b.enum_values->end(), v ) != b.enum_values->end();
          const bool seen = std::find( common.begin(), common.end(), v )
            != common.end();
          if ( in_b && !seen ) common.push_back( v );
        }
        if ( common.empty() ) throw EnumConflict( path );
        out.enum_values = common;
      } else {
        out.enum_values = a.enum_values ? a.enum_values : b.enum_values;
      }

      if ( a.pattern && b.pattern && *a.pattern != *b.pattern ) {
        throw PatternConflict( path, *a.pattern, *b.pattern );
      }
      out.pattern = a.pattern ? a.pattern : b.pattern;

      out.min_words = internal::stricter_lower( a.min_words, b.min_words );
      out.max_words = internal::stricter_upper( a.max_words, b.max_words );
      out.min_sentences = internal::stricter_lower( a.min_sentences,
        b.min_sentences );
      out.max_sentences = internal::stricter_upper( a.max_sentences,
        b.max_sentences );
      internal::check_bounds( path, out.min_words, out.max_words,
        X_MIN_WORDS, X_MAX_WORDS );
      internal::check_bounds( path, out.min_sentences, out.max_sentences,
        X_MIN_SENTENCES, X_MAX_SENTENCES );
      break;
    }

    case SchemaType::Number:
      out.minimum = internal::stricter_lower( a.minimum, b.minimum );
      out.maximum = internal::stricter_upper( a.maximum, b.maximum );
      internal::check_bounds( path, out.minimum, out.maximum,
        std::string( "minimum" ), std::string( "maximum" ) );
      break;

    case SchemaType::Boolean:
      break;
  }
  return out;
}

inline notec::DerivedSchema notec::merge_schemas( const DerivedSchema& model,
  const DerivedSchema& non_model, const std::string& template_id,
  const std::string& template_name, const std::string& template_version,
  const std::string& id_base )
{
  DerivedSchema out;
  out.id = internal::schema_id( id_base, "render", template_id,
    template_version );
  out.title = "Render Payload - " + template_name + " v" + template_version;
  out.description = "Final payload schema (model fields and non-model "
    "fields) for " + template_name;

  // The top level is an object merge whose additionalProperties is always
  // closed
  internal::merge_object_properties( out.root, model.root, non_model.root,
    "" );
  out.root.additional_properties = false;
  return out;
}

inline bool notec::validate_mergeable( const DerivedSchema& a,
  const DerivedSchema& b )
{
  for ( const auto& [name, child] : a.root.properties ) {
    if ( const SchemaNode* other = b.root.property(name) ) {
      merge_nodes( *child, *other, name );
    }
  }
  return true;
}
