//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "notec_schema.hh"

namespace notec {

  class SequentialIndexViolation : public Error {
  public:
    SequentialIndexViolation( const std::string& path, std::size_t found,
      std::size_t expected )
      : Error( "listItems array indices must be sequential starting from 0 "
          "at \"" + path + "\": found index " + std::to_string(found)
          + " but expected " + std::to_string(expected) ),
        path( path ), found( found ), expected( expected ) {}
    const std::string path;
    const std::size_t found;
    const std::size_t expected;
  };

  // Walks a template and builds the schema for one half of the output:
  // model-generated leaves (outputPath) or non-model leaves (targetPath).
  class SchemaDeriver {
  public:
    enum class Half { Model, NonModel };

    explicit SchemaDeriver( Half half,
      std::string id_base = internal::DEFAULT_SCHEMA_ID_BASE )
      : half_( half ), id_base_( std::move(id_base) ) {}

    DerivedSchema derive( const NoteTemplate& tmpl ) const;

    // True when the item belongs to this deriver's half
    bool selects( const ContentItem& item ) const {
      return ( half_ == Half::Model ) == ( item.slot == SlotKind::Model );
    }

  private:
    Half half_;
    std::string id_base_;

    // Per-derivation state. Nodes are cached by wildcard-normalized path
    // ("plan", "plan.homework[]") so repeated prefixes reuse one node.
    struct BuildState {
      SchemaNode root = object_node();
      std::unordered_map< std::string, SchemaNode* > nodes;
      std::unordered_set< std::string > indexed_leaves;
    };

    void place_item( BuildState& st, const ContentItem& item ) const;
    SchemaNode leaf_for( const ContentItem& item ) const;
    void check_sequential_indices( const ContentItem& item ) const;
  };

  inline DerivedSchema derive_model_schema( const NoteTemplate& tmpl,
    const std::string& id_base = internal::DEFAULT_SCHEMA_ID_BASE )
  {
    return SchemaDeriver( SchemaDeriver::Half::Model, id_base ).derive( tmpl );
  }

  inline DerivedSchema derive_non_model_schema( const NoteTemplate& tmpl,
    const std::string& id_base = internal::DEFAULT_SCHEMA_ID_BASE )
  {
    return SchemaDeriver( SchemaDeriver::Half::NonModel, id_base )
      .derive( tmpl );
  }

namespace internal {

  inline std::string schema_id( const std::string& base,
    const std::string& kind, const std::string& template_id,
    const std::string& version )
  {
    return base + "/" + kind + "/" + template_id + "@" + version + ".json";
  }

} // namespace notec::internal

} // namespace notec

inline notec::DerivedSchema notec::SchemaDeriver::derive(
  const NoteTemplate& tmpl ) const
{
  BuildState st;
  st.nodes[ "" ] = &st.root;

  walk_items( tmpl, [&]( const Component&, const ContentItem& item,
    const ContentItem* )
  {
    if ( !item.list_items.empty() ) check_sequential_indices( item );
    if ( selects(item) ) place_item( st, item );
  } );

  DerivedSchema out;
  if ( half_ == Half::Model ) {
    out.id = internal::schema_id( id_base_, "structured-output", tmpl.id,
      tmpl.version );
    out.title = "Structured Output - " + tmpl.name + " v" + tmpl.version;
    out.description = "Model-generated fields for " + tmpl.name;
  } else {
    out.id = internal::schema_id( id_base_, "non-model-output", tmpl.id,
      tmpl.version );
    out.title = "Non-Model Output - " + tmpl.name + " v" + tmpl.version;
    out.description = "Non-model fields (lookup/computed/static/verbatim) for "
      + tmpl.name;
  }
  out.root = std::move( st.root );
  return out;
}

inline void notec::SchemaDeriver::place_item( BuildState& st,
  const ContentItem& item ) const
{
  const std::optional< std::string >& path = item.declared_path();
  if ( !path || path->empty() ) {
    if ( half_ == Half::Model ) {
      throw TemplateError( item.id, "model content item is missing "
        "outputPath" );
    }
    // Display-only static text has nowhere to go in the payload
    return;
  }

  const std::vector< PathSegment > segs = parse_path( *path );

  SchemaNode* current = &st.root;
  std::string current_path;

  for ( std::size_t i = 0; i < segs.size(); ++i ) {
    const PathSegment& seg = segs[ i ];
    const bool last = ( i + 1 == segs.size() );
    const std::string seg_path = current_path.empty()
      ? seg.name : current_path + internal::PATH_DELIMITER + seg.name;
    const std::string array_key = seg_path + internal::ARRAY_MARKER;

    PropertyOptions opts;
    opts.path = join_segments(
      std::vector< PathSegment >( segs.begin(), segs.begin() + i + 1 ) );
    opts.source_id = item.id;

    if ( last ) {
      opts.required = item.is_required();
      opts.path = *path;
      SchemaNode leaf = leaf_for( item );

      if ( !seg.is_array ) {
        add_property( *current, seg.name, std::move(leaf), opts );
      }
      else if ( !seg.index ) {
        add_property( *current, seg.name, array_node(std::move(leaf)), opts );
      }
      else {
        // Indexed leaves ("x[0]", "x[1]") share one array property
        const std::string indexed = seg_path + "["
          + std::to_string( *seg.index ) + "]";
        if ( st.indexed_leaves.count(indexed) ) {
          throw DuplicatePath( *path, item.id, seg.name );
        }
        auto it = st.nodes.find( array_key );
        if ( it == st.nodes.end() ) {
          SchemaNode& arr = add_property( *current, seg.name,
            array_node(std::move(leaf)), opts );
          st.nodes[ array_key ] = &arr;
        } else {
          // The array may already hold object items from "x[].field"
          const SchemaNode* arr = it->second;
          if ( arr->type != SchemaType::Array || !arr->items
            || arr->items->type != leaf.type )
          {
            throw DuplicatePath( *path, item.id, seg.name );
          }
          if ( opts.required && !current->is_required(seg.name) ) {
            current->required.push_back( seg.name );
          }
        }
        st.indexed_leaves.insert( indexed );
      }
      return;
    }

    if ( seg.is_array ) {
      auto it = st.nodes.find( array_key );
      if ( it == st.nodes.end() ) {
        SchemaNode& arr = add_property( *current, seg.name,
          array_node(object_node()), opts );
        st.nodes[ array_key ] = &arr;
        current = arr.items.get();
      } else {
        SchemaNode* arr = it->second;
        if ( arr->type != SchemaType::Array || !arr->items
          || arr->items->type != SchemaType::Object )
        {
          throw DuplicatePath( opts.path, item.id, seg.name );
        }
        current = arr->items.get();
      }
      current_path = array_key;
    }
    else {
      auto it = st.nodes.find( seg_path );
      if ( it == st.nodes.end() ) {
        SchemaNode& obj = add_property( *current, seg.name, object_node(),
          opts );
        st.nodes[ seg_path ] = &obj;
        current = &obj;
      } else {
        current = it->second;
      }
      current_path = seg_path;
    }
  }
}

inline notec::SchemaNode notec::SchemaDeriver::leaf_for(
  const ContentItem& item ) const
{
  if ( item.slot == SlotKind::Model ) return string_node( item.constraints );

  if ( item.slot == SlotKind::Computed ) {
    switch ( item.result_type ) {
      case ResultType::Number: return number_node( item.constraints );
      case ResultType::String: return string_node( item.constraints );
      case ResultType::Boolean: return boolean_node();
      // Escape hatch: formulas may yield arbitrary objects
      case ResultType::Object: return object_node( true );
      case ResultType::Array: return array_node( string_node() );
      case ResultType::Unspecified: break;
    }
  }

  if ( item.slot == SlotKind::Verbatim ) {
    SchemaNode quote = object_node();
    add_property( quote, "text", string_node(), { true, "text", item.id } );
    add_property( quote, "ref", string_node(), { true, "ref", item.id } );
    return quote;
  }

  return string_node( item.constraints );
}

inline void notec::SchemaDeriver::check_sequential_indices(
  const ContentItem& item ) const
{
  std::vector< std::size_t > indices;
  for ( const ContentItem& li : item.list_items ) {
    if ( !selects(li) ) continue;
    const std::optional< std::string >& p = li.declared_path();
    if ( !p || p->empty() ) continue;
    const std::vector< PathSegment > segs = parse_path( *p );
    if ( segs.back().index ) indices.push_back( *segs.back().index );
  }
  if ( indices.empty() ) return;

  std::sort( indices.begin(), indices.end() );
  for ( std::size_t i = 0; i < indices.size(); ++i ) {
    if ( indices[i] != i ) {
      const std::optional< std::string >& own = item.declared_path();
      throw SequentialIndexViolation( own ? *own : item.id, indices[i], i );
    }
  }
}
