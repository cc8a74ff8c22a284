//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include <functional>

#include "notec_common.hh"

namespace notec {

  // Production strategy tag of a template leaf
  enum class SlotKind { Static, Model, Lookup, Computed, Verbatim };

  enum class ResultType { Unspecified, Number, String, Boolean, Object, Array };

  enum class FormatHint { Plain, DeltaScore, Percent };

  inline const char* slot_kind_name( SlotKind k ) {
    switch ( k ) {
      case SlotKind::Static: return "static";
      case SlotKind::Model: return "model";
      case SlotKind::Lookup: return "lookup";
      case SlotKind::Computed: return "computed";
      case SlotKind::Verbatim: return "verbatim";
    }
    return "unknown";
  }

  // Authoring constraints of a content item. Closed set of keys; anything
  // else found in a template is reported and dropped by the loader.
  struct Constraints {
    std::optional< bool > required;
    std::optional< std::vector< std::string > > enum_values;
    std::optional< std::string > pattern;
    std::optional< std::int64_t > min_words;
    std::optional< std::int64_t > max_words;
    std::optional< std::int64_t > min_sentences;
    std::optional< std::int64_t > max_sentences;
    std::optional< double > minimum;
    std::optional< double > maximum;

    bool is_required() const { return required.value_or( false ); }
  };

  struct TableCellStyle {
    std::optional< std::string > role;
    std::optional< std::int64_t > column_index;
    std::optional< bool > muted;
    std::optional< bool > italic;
    std::optional< bool > bold;
    std::optional< std::string > emphasis;
  };

  struct StyleHints {
    std::optional< std::string > tone;
    std::optional< TableCellStyle > table_cell;

    // Keys the loader removed ("unexpected", "tableCell.unknown")
    std::vector< std::string > dropped_keys;

    bool empty() const { return !tone && !table_cell; }
  };

  struct ContentItem {
    std::string id;
    SlotKind slot = SlotKind::Static;
    std::optional< std::string > output_path;
    std::optional< std::string > target_path;
    std::optional< std::string > description;
    std::vector< std::string > source;
    std::vector< std::string > guidance;
    std::vector< std::string > ai_deps;
    std::optional< StyleHints > style;
    std::optional< Constraints > constraints;
    std::vector< ContentItem > list_items;
    std::vector< std::pair< std::string, ContentItem > > table_map;
    std::optional< std::string > lookup;
    std::optional< std::string > formula;
    ResultType result_type = ResultType::Unspecified;
    std::optional< FormatHint > format;
    std::optional< std::string > text;
    std::optional< std::string > verbatim_ref;

    bool is_required() const {
      return constraints && constraints->is_required();
    }

    // The path this item writes: outputPath for model slots, targetPath
    // for every other slot
    const std::optional< std::string >& declared_path() const {
      return slot == SlotKind::Model ? output_path : target_path;
    }
  };

  struct Component {
    std::string id;
    std::string type;
    std::optional< std::string > title;
    std::vector< ContentItem > content;
    std::vector< Component > children;
  };

  struct PromptConfig {
    std::optional< std::string > system;
    std::optional< std::string > main;
    std::vector< std::string > rules;
  };

  struct NoteTemplate {
    std::string id;
    std::string name;
    std::string version;
    std::optional< PromptConfig > prompt;
    std::vector< Component > layout;
  };

  // Build the typed template from a parsed document. Unknown constraint,
  // style and config keys are dropped; a description of each is appended to
  // warnings_out when it is non-null.
  NoteTemplate load_template( const ordered_node& doc,
    std::vector< std::string >* warnings_out = nullptr );

  // Visit every content item in layout order: the item, its listItems
  // (recursively), its tableMap values (recursively), then the component's
  // child components. parent is the enclosing content item for nested
  // items and nullptr for top-level content.
  using ItemVisitor = std::function< void( const Component& component,
    const ContentItem& item, const ContentItem* parent ) >;

  void walk_items( const NoteTemplate& tmpl, const ItemVisitor& visit );
  void walk_items( const std::vector< Component >& layout,
    const ItemVisitor& visit );

namespace internal {

  class TemplateLoader {
  public:
    explicit TemplateLoader( std::vector< std::string >* warnings )
      : warnings_( warnings ) {}

    NoteTemplate load( const ordered_node& doc );

  private:
    std::vector< std::string >* warnings_;

    // Location stack for diagnostics, e.g. ["layout[0]", "content[2]"]
    std::vector< std::string > where_;

    std::string here() const {
      return where_.empty() ? std::string( "template" ) : join_path( where_ );
    }

    void warn( const std::string& msg ) {
      if ( warnings_ ) warnings_->push_back( here() + ": " + msg );
    }

    [[noreturn]] void fail( const std::string& msg ) const {
      throw TemplateError( here(), msg );
    }

    Component load_component( const ordered_node& n );
    ContentItem load_item( const ordered_node& n );
    Constraints load_constraints( const ordered_node& n );
    StyleHints load_style( const ordered_node& n );
    PromptConfig load_prompt( const ordered_node& n );

    std::string required_string( const ordered_node& m,
      const std::string& key );
    std::vector< std::string > string_list( const ordered_node& m,
      const std::string& key );
    std::optional< std::int64_t > integer_field( const ordered_node& m,
      const std::string& key );
  };

  inline SlotKind parse_slot_kind( const std::string& s, bool& ok ) {
    ok = true;
    if ( s == "static" ) return SlotKind::Static;
    if ( s == "model" || s == "ai" ) return SlotKind::Model;
    if ( s == "lookup" ) return SlotKind::Lookup;
    if ( s == "computed" ) return SlotKind::Computed;
    if ( s == "verbatim" ) return SlotKind::Verbatim;
    ok = false;
    return SlotKind::Static;
  }

  inline void walk_item( const Component& comp, const ContentItem& item,
    const ContentItem* parent, const ItemVisitor& visit )
  {
    visit( comp, item, parent );
    for ( const ContentItem& li : item.list_items ) {
      walk_item( comp, li, &item, visit );
    }
    for ( const auto& cell : item.table_map ) {
      walk_item( comp, cell.second, &item, visit );
    }
  }

} // namespace notec::internal

} // namespace notec

inline void notec::walk_items( const std::vector< Component >& layout,
  const ItemVisitor& visit )
{
  for ( const Component& comp : layout ) {
    for ( const ContentItem& item : comp.content ) {
      internal::walk_item( comp, item, nullptr, visit );
    }
    walk_items( comp.children, visit );
  }
}

inline void notec::walk_items( const NoteTemplate& tmpl,
  const ItemVisitor& visit )
{
  walk_items( tmpl.layout, visit );
}

inline notec::NoteTemplate notec::load_template( const ordered_node& doc,
  std::vector< std::string >* warnings_out )
{
  internal::TemplateLoader loader( warnings_out );
  return loader.load( doc );
}

inline std::string notec::internal::TemplateLoader::required_string(
  const ordered_node& m, const std::string& key )
{
  std::optional< std::string > v = string_field( m, key );
  if ( !v || v->empty() ) fail( "missing required string '" + key + "'" );
  return *v;
}

inline std::vector< std::string >
  notec::internal::TemplateLoader::string_list( const ordered_node& m,
    const std::string& key )
{
  std::vector< std::string > out;
  if ( !m.contains(key) || m.at(key).is_null() ) return out;
  const ordered_node& seq = m.at( key );
  if ( !seq.is_sequence() ) fail( "'" + key + "' must be a list of strings" );
  for ( std::size_t i = 0; i < seq.size(); ++i ) {
    const ordered_node& el = seq.at( i );
    if ( !el.is_scalar() || el.is_null() ) {
      fail( "'" + key + "' must be a list of strings" );
    }
    out.push_back( to_string_any(el) );
  }
  return out;
}

inline std::optional< std::int64_t >
  notec::internal::TemplateLoader::integer_field( const ordered_node& m,
    const std::string& key )
{
  if ( !m.contains(key) || m.at(key).is_null() ) return std::nullopt;
  const ordered_node& v = m.at( key );
  if ( v.is_integer() ) return to_native_checked< std::int64_t >( v );
  if ( v.is_float_number() ) {
    double d = to_native_checked< double >( v );
    if ( std::floor(d) == d ) return static_cast< std::int64_t >( d );
  }
  warn( "'" + key + "' must be an integer; ignored" );
  return std::nullopt;
}

inline notec::NoteTemplate notec::internal::TemplateLoader::load(
  const ordered_node& doc )
{
  if ( !doc.is_mapping() ) fail( "template document must be a mapping" );

  NoteTemplate t;
  t.id = required_string( doc, "id" );
  t.name = string_field( doc, "name" ).value_or( t.id );
  t.version = required_string( doc, "version" );

  if ( doc.contains("prompt") && doc.at("prompt").is_mapping() ) {
    where_.push_back( "prompt" );
    t.prompt = load_prompt( doc.at("prompt") );
    where_.pop_back();
  }

  if ( !doc.contains("layout") || !doc.at("layout").is_sequence() ) {
    fail( "template requires a 'layout' list" );
  }
  const ordered_node& layout = doc.at( "layout" );
  for ( std::size_t i = 0; i < layout.size(); ++i ) {
    where_.push_back( "layout[" + std::to_string(i) + "]" );
    t.layout.push_back( load_component(layout.at(i)) );
    where_.pop_back();
  }
  return t;
}

inline notec::PromptConfig notec::internal::TemplateLoader::load_prompt(
  const ordered_node& n )
{
  PromptConfig p;
  p.system = string_field( n, "system" );
  p.main = string_field( n, "main" );
  p.rules = string_list( n, "rules" );
  return p;
}

inline notec::Component notec::internal::TemplateLoader::load_component(
  const ordered_node& n )
{
  if ( !n.is_mapping() ) fail( "component must be a mapping" );

  Component c;
  c.id = required_string( n, "id" );
  c.type = string_field( n, "type" ).value_or( "section" );
  c.title = string_field( n, "title" );

  if ( n.contains("content") && n.at("content").is_sequence() ) {
    const ordered_node& content = n.at( "content" );
    for ( std::size_t i = 0; i < content.size(); ++i ) {
      where_.push_back( "content[" + std::to_string(i) + "]" );
      c.content.push_back( load_item(content.at(i)) );
      where_.pop_back();
    }
  }
  if ( n.contains("children") && n.at("children").is_sequence() ) {
    const ordered_node& children = n.at( "children" );
    for ( std::size_t i = 0; i < children.size(); ++i ) {
      where_.push_back( "children[" + std::to_string(i) + "]" );
      c.children.push_back( load_component(children.at(i)) );
      where_.pop_back();
    }
  }
  return c;
}

inline notec::ContentItem notec::internal::TemplateLoader::load_item(
  const ordered_node& n )
{
  if ( !n.is_mapping() ) fail( "content item must be a mapping" );

  ContentItem item;
  item.id = required_string( n, "id" );

  bool ok = false;
  const std::string slot = required_string( n, "slot" );
  item.slot = parse_slot_kind( slot, ok );
  if ( !ok ) fail( "unknown slot kind '" + slot + "'" );

  item.output_path = string_field( n, "outputPath" );
  item.target_path = string_field( n, "targetPath" );
  item.description = string_field( n, "description" );
  item.source = string_list( n, "source" );
  item.guidance = string_list( n, "guidance" );
  item.ai_deps = string_list( n, "aiDeps" );
  item.lookup = string_field( n, "lookup" );
  item.formula = string_field( n, "formula" );
  item.text = string_field( n, "text" );
  item.verbatim_ref = string_field( n, "verbatimRef" );

  if ( auto rt = string_field(n, "resultType") ) {
    if ( *rt == "number" ) item.result_type = ResultType::Number;
    else if ( *rt == "string" ) item.result_type = ResultType::String;
    else if ( *rt == "boolean" ) item.result_type = ResultType::Boolean;
    else if ( *rt == "object" ) item.result_type = ResultType::Object;
    else if ( *rt == "array" ) item.result_type = ResultType::Array;
    else warn( "unknown resultType '" + *rt + "'; treated as string" );
  }

  if ( auto fmt = string_field(n, "format") ) {
    if ( *fmt == "plain" ) item.format = FormatHint::Plain;
    else if ( *fmt == "deltaScore" ) item.format = FormatHint::DeltaScore;
    else if ( *fmt == "percent" ) item.format = FormatHint::Percent;
    else {
      warn( "unknown format '" + *fmt + "'; treated as plain" );
      item.format = FormatHint::Plain;
    }
  }

  if ( n.contains("constraints") && n.at("constraints").is_mapping() ) {
    where_.push_back( "constraints" );
    item.constraints = load_constraints( n.at("constraints") );
    where_.pop_back();
  }

  if ( n.contains("styleHints") && n.at("styleHints").is_mapping() ) {
    item.style = load_style( n.at("styleHints") );
  }

  if ( n.contains("listItems") && n.at("listItems").is_sequence() ) {
    const ordered_node& list = n.at( "listItems" );
    for ( std::size_t i = 0; i < list.size(); ++i ) {
      where_.push_back( "listItems[" + std::to_string(i) + "]" );
      item.list_items.push_back( load_item(list.at(i)) );
      where_.pop_back();
    }
  }

  if ( n.contains("tableMap") ) {
    const ordered_node& table = n.at( "tableMap" );
    if ( table.is_mapping() ) {
      for ( const auto& [mk, mv] : table.map_items() ) {
        const std::string column = mk.get_value< std::string >();
        where_.push_back( "tableMap." + column );
        item.table_map.emplace_back( column, load_item(mv) );
        where_.pop_back();
      }
    } else if ( table.is_sequence() ) {
      for ( std::size_t i = 0; i < table.size(); ++i ) {
        where_.push_back( "tableMap[" + std::to_string(i) + "]" );
        item.table_map.emplace_back( std::to_string(i),
          load_item(table.at(i)) );
        where_.pop_back();
      }
    }
  }

  return item;
}

inline notec::Constraints notec::internal::TemplateLoader::load_constraints(
  const ordered_node& n )
{
  Constraints c;
  for ( const auto& [mk, mv] : n.map_items() ) {
    const std::string key = mk.get_value< std::string >();
    if ( key == "required" ) {
      if ( mv.is_boolean() ) c.required = mv.get_value< bool >();
      else warn( "constraint 'required' must be a boolean; ignored" );
    }
    else if ( key == "enum" ) {
      c.enum_values = string_list( n, key );
    }
    else if ( key == "pattern" ) {
      c.pattern = string_field( n, key );
    }
    else if ( key == "minWords" ) c.min_words = integer_field( n, key );
    else if ( key == "maxWords" ) c.max_words = integer_field( n, key );
    else if ( key == "minSentences" ) c.min_sentences = integer_field( n, key );
    else if ( key == "maxSentences" ) c.max_sentences = integer_field( n, key );
    else if ( key == "minimum" || key == "maximum" ) {
      if ( !is_number(mv) ) {
        warn( "constraint '" + key + "' must be a number; ignored" );
        continue;
      }
      if ( key == "minimum" ) c.minimum = number_of( mv );
      else c.maximum = number_of( mv );
    }
    else {
      warn( "unknown constraint '" + key + "' dropped" );
    }
  }
  return c;
}

inline notec::StyleHints notec::internal::TemplateLoader::load_style(
  const ordered_node& n )
{
  StyleHints s;
  for ( const auto& [mk, mv] : n.map_items() ) {
    const std::string key = mk.get_value< std::string >();
    if ( key == "tone" && mv.is_string() ) {
      s.tone = to_native_checked< std::string >( mv );
    }
    else if ( key == "tableCell" && mv.is_mapping() ) {
      TableCellStyle cell;
      for ( const auto& [ck, cv] : mv.map_items() ) {
        const std::string ckey = ck.get_value< std::string >();
        if ( ckey == "role" && cv.is_string() ) {
          cell.role = to_native_checked< std::string >( cv );
        } else if ( ckey == "columnIndex" && cv.is_integer() ) {
          cell.column_index = to_native_checked< std::int64_t >( cv );
        } else if ( ckey == "muted" && cv.is_boolean() ) {
          cell.muted = cv.get_value< bool >();
        } else if ( ckey == "italic" && cv.is_boolean() ) {
          cell.italic = cv.get_value< bool >();
        } else if ( ckey == "bold" && cv.is_boolean() ) {
          cell.bold = cv.get_value< bool >();
        } else if ( ckey == "emphasis" && cv.is_string() ) {
          cell.emphasis = to_native_checked< std::string >( cv );
        } else {
          s.dropped_keys.push_back( "tableCell." + ckey );
        }
      }
      s.table_cell = cell;
    }
    else {
      s.dropped_keys.push_back( key );
    }
  }
  return s;
}
