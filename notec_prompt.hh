//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "notec_path.hh"
#include "notec_schema.hh"

namespace notec {

  // Where a model field's input lives: the resolved non-model snapshot, or
  // the caller-supplied fact pack ("source.*" paths)
  enum class DependencyScope { Nas, Source };

  inline const char* dependency_scope_name( DependencyScope s ) {
    return s == DependencyScope::Source ? "source" : "nas";
  }

  struct FieldDependency {
    DependencyScope scope = DependencyScope::Nas;
    std::string path;

    bool operator==( const FieldDependency& o ) const {
      return scope == o.scope && path == o.path;
    }
  };

  // "source", "source.x" and "source:x" are fact-pack paths. The match is
  // on a whole leading segment, so "sourceNotes.x" stays in the snapshot.
  FieldDependency classify_dependency( const std::string& path );

  // The part of a source-scoped path that addresses the fact pack
  std::string fact_pack_path( const FieldDependency& dep );

  // A diagnostic produced by composition or linting
  struct LintIssue {
    Severity severity = Severity::Warning;
    std::string check;
    std::string message;
    std::optional< std::string > path;

    ordered_node to_node() const;
  };

  // Instructions for one model-generated field
  struct FieldGuideEntry {
    std::string path;
    std::optional< std::string > description;
    std::vector< std::string > guidance;
    std::vector< FieldDependency > dependencies;
    std::optional< Constraints > constraints;
    std::optional< StyleHints > style;

    // Constraints as JSON Schema keywords (enum, pattern, x-minWords, ...)
    ordered_node constraints_node() const;
    ordered_node style_node() const;
    ordered_node to_node() const;
  };

  struct FieldGuide {
    std::vector< FieldGuideEntry > entries;
    std::vector< LintIssue > issues;
  };

  // One entry per model leaf in layout order, nested list and table leaves
  // included
  FieldGuide build_field_guide( const NoteTemplate& tmpl );

  struct ContextSlice {
    ordered_node nas_slices = ordered_node::mapping();
    std::vector< LintIssue > issues;
  };

  // Copy out the top-level snapshot keys that nas-scoped dependencies
  // reach
  ContextSlice slice_context( const ordered_node& snapshot,
    const std::vector< FieldGuideEntry >& guide );

  struct Message {
    std::string role;
    std::string content;
  };

  // Exactly two messages: system, then user
  std::vector< Message > build_messages( const NoteTemplate& tmpl,
    const std::vector< FieldGuideEntry >& guide,
    const std::optional< ordered_node >& fact_pack,
    const ordered_node& nas_slices );

  struct PromptBundle {
    std::string id;
    std::string template_id;
    std::string template_version;
    std::vector< Message > messages;
    DerivedSchema json_schema;
    std::vector< FieldGuideEntry > field_guide;
    std::optional< ordered_node > fact_pack;
    ordered_node nas_slices = ordered_node::mapping();

    ordered_node to_node() const;
  };

namespace internal {

  inline const std::string RESPONSE_CONTRACT = "Return a single JSON object "
    "that EXACTLY matches the provided JSON Schema.";

  inline const std::vector< std::string > SYSTEM_CONSTRAINTS = {
    "- Return ONLY JSON that conforms to the provided JSON Schema.",
    "- Do not invent facts beyond supplied context.",
    "- Prefer data already present in the non-AI snapshot for derived "
      "values; only compose requested AI fields."
  };

  // Recursively key-sorted, two-space indented JSON
  inline std::string stringify_deterministic( const ordered_node& n ) {
    return to_json( n, true, 2 );
  }

  inline std::string format_field_guide_entry( const FieldGuideEntry& e ) {
    std::vector< std::string > lines;
    lines.push_back( "- path: " + e.path );
    if ( e.description && !e.description->empty() ) {
      lines.push_back( "  description: " + *e.description );
    }
    if ( !e.guidance.empty() ) {
      lines.push_back( "  guidance:" );
      for ( const std::string& g : e.guidance ) lines.push_back( "    - " + g );
    }
    if ( !e.dependencies.empty() ) {
      lines.push_back( "  deps:" );
      for ( const FieldDependency& d : e.dependencies ) {
        lines.push_back( "    - " + d.path );
      }
    }
    const ordered_node c = e.constraints_node();
    if ( c.size() > 0 ) {
      lines.push_back( "  constraints: " + stringify_deterministic(c) );
    }
    const ordered_node s = e.style_node();
    if ( s.size() > 0 ) {
      lines.push_back( "  style: " + stringify_deterministic(s) );
    }

    std::string out;
    for ( std::size_t i = 0; i < lines.size(); ++i ) {
      if ( i ) out += '\n';
      out += lines[ i ];
    }
    return out;
  }

  inline std::string join_lines( const std::vector< std::string >& parts ) {
    std::string out;
    for ( std::size_t i = 0; i < parts.size(); ++i ) {
      if ( i ) out += '\n';
      out += parts[ i ];
    }
    return out;
  }

  // Top-level key addressed by a dependency path ("plan.items[].x" -> plan)
  inline std::string top_level_key( const std::string& path ) {
    std::string first = split_segments( path ).front();
    const std::size_t open = first.find( '[' );
    if ( open != std::string::npos ) first.erase( open );
    return first;
  }

} // namespace notec::internal

} // namespace notec

inline notec::FieldDependency notec::classify_dependency(
  const std::string& path )
{
  const bool source = path == "source"
    || internal::starts_with( path, "source." )
    || internal::starts_with( path, "source:" );
  return FieldDependency{ source ? DependencyScope::Source
    : DependencyScope::Nas, path };
}

inline std::string notec::fact_pack_path( const FieldDependency& dep ) {
  if ( dep.scope != DependencyScope::Source ) return dep.path;
  if ( dep.path == "source" ) return std::string();
  return dep.path.substr( std::string( "source." ).size() );
}

inline notec::ordered_node notec::LintIssue::to_node() const {
  using internal::make_string_node;
  ordered_node n = ordered_node::mapping();
  n[ "severity" ] = make_string_node( severity_name(severity) );
  n[ "check" ] = make_string_node( check );
  n[ "message" ] = make_string_node( message );
  if ( path ) n[ "path" ] = make_string_node( *path );
  return n;
}

inline notec::ordered_node notec::FieldGuideEntry::constraints_node() const {
  using internal::make_node_from;
  ordered_node n = ordered_node::mapping();
  if ( !constraints ) return n;
  const Constraints& c = *constraints;
  if ( c.enum_values ) n[ "enum" ] = make_node_from( *c.enum_values );
  if ( c.pattern ) n[ "pattern" ] = internal::make_string_node( *c.pattern );
  if ( c.min_words ) n[ X_MIN_WORDS ] = make_node_from( *c.min_words );
  if ( c.max_words ) n[ X_MAX_WORDS ] = make_node_from( *c.max_words );
  if ( c.min_sentences ) {
    n[ X_MIN_SENTENCES ] = make_node_from( *c.min_sentences );
  }
  if ( c.max_sentences ) {
    n[ X_MAX_SENTENCES ] = make_node_from( *c.max_sentences );
  }
  return n;
}

inline notec::ordered_node notec::FieldGuideEntry::style_node() const {
  using internal::make_node_from;
  using internal::make_string_node;
  ordered_node n = ordered_node::mapping();
  if ( !style ) return n;
  if ( style->tone ) n[ "tone" ] = make_string_node( *style->tone );
  if ( style->table_cell ) {
    const TableCellStyle& tc = *style->table_cell;
    ordered_node cell = ordered_node::mapping();
    if ( tc.role ) cell[ "role" ] = make_string_node( *tc.role );
    if ( tc.column_index ) {
      cell[ "columnIndex" ] = make_node_from( *tc.column_index );
    }
    if ( tc.muted ) cell[ "muted" ] = make_node_from( *tc.muted );
    if ( tc.italic ) cell[ "italic" ] = make_node_from( *tc.italic );
    if ( tc.bold ) cell[ "bold" ] = make_node_from( *tc.bold );
    if ( tc.emphasis ) cell[ "emphasis" ] = make_string_node( *tc.emphasis );
    n[ "tableCell" ] = cell;
  }
  return n;
}

inline notec::ordered_node notec::FieldGuideEntry::to_node() const {
  using internal::make_node_from;
  using internal::make_string_node;
  ordered_node n = ordered_node::mapping();
  n[ "path" ] = make_string_node( path );
  if ( description ) n[ "description" ] = make_string_node( *description );
  if ( !guidance.empty() ) n[ "guidance" ] = make_node_from( guidance );

  std::vector< ordered_node > deps;
  for ( const FieldDependency& d : dependencies ) {
    ordered_node dn = ordered_node::mapping();
    dn[ "path" ] = make_string_node( d.path );
    dn[ "scope" ] = make_string_node( dependency_scope_name(d.scope) );
    deps.push_back( dn );
  }
  n[ "dependencies" ] = make_node_from( deps );

  const ordered_node c = constraints_node();
  if ( c.size() > 0 ) n[ "constraints" ] = c;
  const ordered_node s = style_node();
  if ( s.size() > 0 ) n[ "style" ] = s;
  return n;
}

inline notec::FieldGuide notec::build_field_guide( const NoteTemplate& tmpl ) {
  FieldGuide out;

  walk_items( tmpl, [&]( const Component&, const ContentItem& item,
    const ContentItem* )
  {
    if ( item.slot != SlotKind::Model ) return;

    FieldGuideEntry e;
    e.path = item.output_path.value_or( std::string() );
    e.description = item.description;
    e.guidance = item.guidance;
    e.constraints = item.constraints;

    const std::vector< std::string >& raw = item.ai_deps.empty()
      ? item.source : item.ai_deps;
    for ( const std::string& p : raw ) {
      if ( p.empty() ) continue;
      FieldDependency d = classify_dependency( p );
      if ( std::find(e.dependencies.begin(), e.dependencies.end(), d)
        == e.dependencies.end() )
      {
        e.dependencies.push_back( d );
      }
    }
    if ( e.dependencies.empty() ) {
      out.issues.push_back( LintIssue{ Severity::Error,
        "field-guide.dependencies", "Model field " + e.path + " (item '"
          + item.id + "') declares no dependencies; add aiDeps or source",
        e.path } );
    }

    if ( item.style ) {
      for ( const std::string& key : item.style->dropped_keys ) {
        out.issues.push_back( LintIssue{ Severity::Warning,
          "field-guide.style", "Unsupported style hint '" + key
            + "' dropped from " + e.path, e.path } );
      }
      if ( !item.style->empty() ) e.style = item.style;
    }

    out.entries.push_back( std::move(e) );
  } );

  return out;
}

inline notec::ContextSlice notec::slice_context( const ordered_node& snapshot,
  const std::vector< FieldGuideEntry >& guide )
{
  ContextSlice out;
  std::vector< std::string > seen;
  bool requested = false;

  for ( const FieldGuideEntry& e : guide ) {
    for ( const FieldDependency& d : e.dependencies ) {
      if ( d.scope != DependencyScope::Nas ) continue;
      requested = true;
      if ( std::find(seen.begin(), seen.end(), d.path) != seen.end() ) {
        continue;
      }
      seen.push_back( d.path );

      if ( !resolve_loose(snapshot, d.path) ) {
        out.issues.push_back( LintIssue{ Severity::Warning,
          "context-slice.missing", "Dependency " + d.path
            + " is not present in the non-model snapshot (needed by "
            + e.path + ")", e.path } );
        continue;
      }
      const std::string top = internal::top_level_key( d.path );
      if ( !out.nas_slices.contains(top) ) {
        out.nas_slices[ top ] = snapshot.at( top );
      }
    }
  }

  if ( requested && out.nas_slices.size() == 0 ) {
    out.issues.push_back( LintIssue{ Severity::Error, "context-slice.empty",
      "No non-model context could be sliced for the requested dependencies",
      std::nullopt } );
  }
  return out;
}

inline std::vector< notec::Message > notec::build_messages(
  const NoteTemplate& tmpl, const std::vector< FieldGuideEntry >& guide,
  const std::optional< ordered_node >& fact_pack,
  const ordered_node& nas_slices )
{
  using internal::stringify_deterministic;

  std::vector< std::string > sys;
  if ( tmpl.prompt && tmpl.prompt->system ) sys.push_back( *tmpl.prompt->system );
  sys.push_back( "" );
  sys.push_back( "CRITICAL CONSTRAINTS:" );
  for ( const std::string& c : internal::SYSTEM_CONSTRAINTS ) {
    sys.push_back( c );
  }

  std::vector< std::string > user;
  user.push_back( "PURPOSE" );
  user.push_back( tmpl.prompt && tmpl.prompt->main ? *tmpl.prompt->main
    : std::string() );
  user.push_back( "" );

  if ( tmpl.prompt && !tmpl.prompt->rules.empty() ) {
    user.push_back( "HARD RULES" );
    for ( const std::string& r : tmpl.prompt->rules ) {
      user.push_back( "- " + r );
    }
    user.push_back( "" );
  }

  user.push_back( "RESPONSE CONTRACT" );
  user.push_back( internal::RESPONSE_CONTRACT );
  user.push_back( "" );

  user.push_back( "CONTEXT" );
  if ( fact_pack ) {
    user.push_back( "FACT PACK:" );
    user.push_back( stringify_deterministic(*fact_pack) );
    user.push_back( "" );
  }
  user.push_back( "NON-AI SNAPSHOT (sliced):" );
  user.push_back( stringify_deterministic(nas_slices) );
  user.push_back( "" );

  user.push_back( "FIELD GUIDE" );
  for ( const FieldGuideEntry& e : guide ) {
    user.push_back( internal::format_field_guide_entry(e) );
  }

  return { Message{ "system", internal::join_lines(sys) },
    Message{ "user", internal::join_lines(user) } };
}

inline notec::ordered_node notec::PromptBundle::to_node() const {
  using internal::make_node_from;
  using internal::make_string_node;

  ordered_node n = ordered_node::mapping();
  n[ "id" ] = make_string_node( id );
  n[ "templateId" ] = make_string_node( template_id );
  n[ "templateVersion" ] = make_string_node( template_version );

  std::vector< ordered_node > msgs;
  for ( const Message& m : messages ) {
    ordered_node mn = ordered_node::mapping();
    mn[ "role" ] = make_string_node( m.role );
    mn[ "content" ] = make_string_node( m.content );
    msgs.push_back( mn );
  }
  n[ "messages" ] = make_node_from( msgs );
  n[ "jsonSchema" ] = json_schema.to_node();

  std::vector< ordered_node > guide;
  for ( const FieldGuideEntry& e : field_guide ) guide.push_back( e.to_node() );
  n[ "fieldGuide" ] = make_node_from( guide );

  ordered_node ctx = ordered_node::mapping();
  if ( fact_pack ) ctx[ "factPack" ] = *fact_pack;
  ctx[ "nasSlices" ] = nas_slices;
  n[ "context" ] = ctx;
  return n;
}
