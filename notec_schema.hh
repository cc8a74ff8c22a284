//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include <memory>

#include "notec_path.hh"
#include "notec_template.hh"

namespace notec {

  enum class SchemaType { Object, Array, String, Number, Boolean };

  inline const char* schema_type_name( SchemaType t ) {
    switch ( t ) {
      case SchemaType::Object: return "object";
      case SchemaType::Array: return "array";
      case SchemaType::String: return "string";
      case SchemaType::Number: return "number";
      case SchemaType::Boolean: return "boolean";
    }
    return "unknown";
  }

  // Custom string keywords carried on string nodes
  inline const std::string X_MIN_WORDS = "x-minWords";
  inline const std::string X_MAX_WORDS = "x-maxWords";
  inline const std::string X_MIN_SENTENCES = "x-minSentences";
  inline const std::string X_MAX_SENTENCES = "x-maxSentences";

  // One JSON Schema node. Exactly one shape is meaningful per type:
  //   object  -> properties, required, additional_properties
  //   array   -> items
  //   string  -> enum_values, pattern, word/sentence bounds
  //   number  -> minimum, maximum
  // Nodes own their children; copying a node deep-copies the subtree.
  struct SchemaNode {
    SchemaType type = SchemaType::String;

    std::vector< std::pair< std::string,
      std::unique_ptr< SchemaNode > > > properties;
    std::vector< std::string > required;
    bool additional_properties = false;

    std::unique_ptr< SchemaNode > items;

    std::optional< std::vector< std::string > > enum_values;
    std::optional< std::string > pattern;
    std::optional< std::int64_t > min_words;
    std::optional< std::int64_t > max_words;
    std::optional< std::int64_t > min_sentences;
    std::optional< std::int64_t > max_sentences;

    std::optional< double > minimum;
    std::optional< double > maximum;

    SchemaNode() = default;
    explicit SchemaNode( SchemaType t ) : type( t ) {}
    SchemaNode( const SchemaNode& other );
    SchemaNode& operator=( const SchemaNode& other );
    SchemaNode( SchemaNode&& ) = default;
    SchemaNode& operator=( SchemaNode&& ) = default;

    const SchemaNode* property( const std::string& name ) const;
    SchemaNode* property( const std::string& name );
    bool is_required( const std::string& name ) const;

    ordered_node to_node() const;
  };

  // Options attached to add_property; path and source_id only feed
  // diagnostics.
  struct PropertyOptions {
    bool required = false;
    std::string path;
    std::string source_id;
  };

  class DuplicatePath : public Error {
  public:
    DuplicatePath( const std::string& path, const std::string& source_id,
      const std::string& property_name )
      : Error( "Duplicate schema path \"" + path + "\" (property '"
          + property_name + "'" + ( source_id.empty() ? std::string()
            : ", declared by '" + source_id + "'" ) + ")" ),
        path( path ), source_id( source_id ), property_name( property_name )
    {}
    const std::string path;
    const std::string source_id;
    const std::string property_name;
  };

  SchemaNode object_node( bool additional_properties = false );
  SchemaNode array_node( SchemaNode items );
  SchemaNode string_node( const std::optional< Constraints >& c = std::nullopt );
  SchemaNode number_node( const std::optional< Constraints >& c = std::nullopt );
  SchemaNode boolean_node();

  // Attach child under name. Throws DuplicatePath if the object already
  // declares the property. Returns the stored child.
  SchemaNode& add_property( SchemaNode& object, const std::string& name,
    SchemaNode child, const PropertyOptions& opts = {} );

  // A JSON Schema draft 2020-12 document wrapping an object root
  struct DerivedSchema {
    std::string id;
    std::string schema = internal::JSON_SCHEMA_DRAFT;
    std::string title;
    std::string description;
    SchemaNode root = object_node();

    ordered_node to_node() const;
  };

  // Find the node at a dotted path, descending transparently into array
  // items. Array markers on segments are ignored. nullptr if absent.
  const SchemaNode* schema_node_at( const DerivedSchema& schema,
    const std::string& path );

} // namespace notec

inline notec::SchemaNode::SchemaNode( const SchemaNode& other )
  : type( other.type ),
    required( other.required ),
    additional_properties( other.additional_properties ),
    enum_values( other.enum_values ),
    pattern( other.pattern ),
    min_words( other.min_words ),
    max_words( other.max_words ),
    min_sentences( other.min_sentences ),
    max_sentences( other.max_sentences ),
    minimum( other.minimum ),
    maximum( other.maximum )
{
  properties.reserve( other.properties.size() );
  for ( const auto& [name, child] : other.properties ) {
    properties.emplace_back( name, std::make_unique< SchemaNode >(*child) );
  }
  if ( other.items ) items = std::make_unique< SchemaNode >( *other.items );
}

inline notec::SchemaNode& notec::SchemaNode::operator=(
  const SchemaNode& other )
{
  if ( this != &other ) {
    SchemaNode copy( other );
    *this = std::move( copy );
  }
  return *this;
}

inline const notec::SchemaNode* notec::SchemaNode::property(
  const std::string& name ) const
{
  for ( const auto& p : properties ) {
    if ( p.first == name ) return p.second.get();
  }
  return nullptr;
}

inline notec::SchemaNode* notec::SchemaNode::property(
  const std::string& name )
{
  for ( auto& p : properties ) {
    if ( p.first == name ) return p.second.get();
  }
  return nullptr;
}

inline bool notec::SchemaNode::is_required( const std::string& name ) const {
  return std::find( required.begin(), required.end(), name )
    != required.end();
}

inline notec::ordered_node notec::SchemaNode::to_node() const {
  using internal::make_node_from;
  using internal::make_string_node;

  ordered_node n = ordered_node::mapping();
  n[ "type" ] = make_string_node( schema_type_name(type) );

  switch ( type ) {
    case SchemaType::Object: {
      ordered_node props = ordered_node::mapping();
      for ( const auto& [name, child] : properties ) {
        props[ name ] = child->to_node();
      }
      n[ "properties" ] = props;
      if ( !required.empty() ) n[ "required" ] = make_node_from( required );
      n[ "additionalProperties" ] = make_node_from( additional_properties );
      break;
    }
    case SchemaType::Array:
      if ( items ) n[ "items" ] = items->to_node();
      break;
    case SchemaType::String:
      if ( enum_values ) n[ "enum" ] = make_node_from( *enum_values );
      if ( pattern ) n[ "pattern" ] = make_string_node( *pattern );
      if ( min_words ) n[ X_MIN_WORDS ] = make_node_from( *min_words );
      if ( max_words ) n[ X_MAX_WORDS ] = make_node_from( *max_words );
      if ( min_sentences ) {
        n[ X_MIN_SENTENCES ] = make_node_from( *min_sentences );
      }
      if ( max_sentences ) {
        n[ X_MAX_SENTENCES ] = make_node_from( *max_sentences );
      }
      break;
    case SchemaType::Number:
      if ( minimum ) n[ "minimum" ] = internal::make_number_node( *minimum );
      if ( maximum ) n[ "maximum" ] = internal::make_number_node( *maximum );
      break;
    case SchemaType::Boolean:
      break;
  }
  return n;
}

inline notec::SchemaNode notec::object_node( bool additional_properties ) {
  SchemaNode n( SchemaType::Object );
  n.additional_properties = additional_properties;
  return n;
}

inline notec::SchemaNode notec::array_node( SchemaNode items ) {
  SchemaNode n( SchemaType::Array );
  n.items = std::make_unique< SchemaNode >( std::move(items) );
  return n;
}

// Template constraints map 1:1 onto string keywords
inline notec::SchemaNode notec::string_node(
  const std::optional< Constraints >& c )
{
  SchemaNode n( SchemaType::String );
  if ( !c ) return n;
  n.enum_values = c->enum_values;
  n.pattern = c->pattern;
  n.min_words = c->min_words;
  n.max_words = c->max_words;
  n.min_sentences = c->min_sentences;
  n.max_sentences = c->max_sentences;
  return n;
}

inline notec::SchemaNode notec::number_node(
  const std::optional< Constraints >& c )
{
  SchemaNode n( SchemaType::Number );
  if ( !c ) return n;
  n.minimum = c->minimum;
  n.maximum = c->maximum;
  return n;
}

inline notec::SchemaNode notec::boolean_node() {
  return SchemaNode( SchemaType::Boolean );
}

inline notec::SchemaNode& notec::add_property( SchemaNode& object,
  const std::string& name, SchemaNode child, const PropertyOptions& opts )
{
  if ( object.type != SchemaType::Object ) {
    throw Error( "Can only add properties to object nodes (property '"
      + name + "' at \"" + opts.path + "\")" );
  }
  if ( object.property(name) ) {
    throw DuplicatePath( opts.path.empty() ? name : opts.path,
      opts.source_id, name );
  }
  object.properties.emplace_back( name,
    std::make_unique< SchemaNode >(std::move(child)) );
  if ( opts.required && !object.is_required(name) ) {
    object.required.push_back( name );
  }
  return *object.properties.back().second;
}

inline notec::ordered_node notec::DerivedSchema::to_node() const {
  using internal::make_node_from;
  using internal::make_string_node;

  ordered_node n = ordered_node::mapping();
  n[ "$id" ] = make_string_node( id );
  n[ "$schema" ] = make_string_node( schema );
  n[ "title" ] = make_string_node( title );
  if ( !description.empty() ) {
    n[ "description" ] = make_string_node( description );
  }
  n[ "type" ] = make_string_node( "object" );

  ordered_node props = ordered_node::mapping();
  for ( const auto& [name, child] : root.properties ) {
    props[ name ] = child->to_node();
  }
  n[ "properties" ] = props;
  if ( !root.required.empty() ) {
    n[ "required" ] = make_node_from( root.required );
  }
  n[ "additionalProperties" ] = make_node_from( false );
  return n;
}

inline const notec::SchemaNode* notec::schema_node_at(
  const DerivedSchema& schema, const std::string& path )
{
  if ( path.empty() ) return nullptr;

  const SchemaNode* cur = &schema.root;
  for ( const std::string& piece : internal::split_segments(path) ) {
    std::string key = piece;
    const std::size_t open = piece.find( '[' );
    if ( open != std::string::npos ) key = piece.substr( 0, open );

    // Array items are transparent
    while ( cur->type == SchemaType::Array && cur->items ) {
      cur = cur->items.get();
    }
    if ( cur->type != SchemaType::Object ) return nullptr;
    cur = cur->property( key );
    if ( !cur ) return nullptr;
  }
  return cur;
}
