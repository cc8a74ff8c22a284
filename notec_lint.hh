//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "notec_prompt.hh"

namespace notec {

  struct LintResult {
    bool ok = true;
    std::vector< LintIssue > issues;
    std::vector< LintIssue > errors;
    std::vector< LintIssue > warnings;

    ordered_node to_node() const;
  };

  // Independent checks over an assembled bundle. Never throws; ok is true
  // iff no error-severity issue was found.
  //   coverage           one guide entry per model leaf of the template
  //   path-validity      every guide path exists in the model schema
  //   constraint-harmony guide pattern/enum agree with the schema node
  //   dependencies       every dependency resolves in the bundle context
  //   message-roles      system message first, user message second
  //   response-contract  user message carries the JSON contract directive
  LintResult lint_prompt_bundle( const PromptBundle& bundle,
    const NoteTemplate& tmpl );

namespace internal {

  inline std::size_t count_model_items( const NoteTemplate& tmpl ) {
    std::size_t n = 0;
    walk_items( tmpl, [&]( const Component&, const ContentItem& item,
      const ContentItem* )
    {
      if ( item.slot == SlotKind::Model ) ++n;
    } );
    return n;
  }

  inline bool same_value_set( const std::vector< std::string >& a,
    const std::vector< std::string >& b )
  {
    std::unordered_set< std::string > sa( a.begin(), a.end() );
    std::unordered_set< std::string > sb( b.begin(), b.end() );
    return sa == sb;
  }

  inline bool dependency_resolvable( const FieldDependency& dep,
    const PromptBundle& bundle )
  {
    if ( dep.scope == DependencyScope::Nas ) {
      return resolve_loose( bundle.nas_slices, dep.path ).has_value();
    }
    if ( !bundle.fact_pack ) return false;
    const std::string p = fact_pack_path( dep );
    if ( p.empty() ) return true;
    return resolve_loose( *bundle.fact_pack, p ).has_value();
  }

} // namespace notec::internal

} // namespace notec

inline notec::ordered_node notec::LintResult::to_node() const {
  ordered_node n = ordered_node::mapping();
  n[ "ok" ] = internal::make_node_from( ok );
  std::vector< ordered_node > all;
  for ( const LintIssue& i : issues ) all.push_back( i.to_node() );
  n[ "issues" ] = internal::make_node_from( all );
  n[ "errorCount" ] = internal::make_node_from(
    static_cast< std::int64_t >( errors.size() ) );
  n[ "warningCount" ] = internal::make_node_from(
    static_cast< std::int64_t >( warnings.size() ) );
  return n;
}

inline notec::LintResult notec::lint_prompt_bundle( const PromptBundle& bundle,
  const NoteTemplate& tmpl )
{
  LintResult res;
  std::vector< LintIssue >& issues = res.issues;

  auto add = [&]( Severity sev, const std::string& check,
    const std::string& msg, std::optional< std::string > path )
  {
    issues.push_back( LintIssue{ sev, check, msg, std::move(path) } );
  };

  const std::size_t model_items = internal::count_model_items( tmpl );
  if ( bundle.field_guide.size() != model_items ) {
    std::ostringstream oss;
    oss << "Field guide has " << bundle.field_guide.size()
      << " entries but template has " << model_items << " model items";
    add( Severity::Error, "coverage", oss.str(), std::nullopt );
  }

  for ( const FieldGuideEntry& fg : bundle.field_guide ) {
    const SchemaNode* node = schema_node_at( bundle.json_schema, fg.path );
    if ( !node ) {
      add( Severity::Error, "path-validity", "Field guide path not in the "
        "model schema: " + fg.path, fg.path );
      continue;
    }
    if ( !fg.constraints ) continue;

    const Constraints& c = *fg.constraints;
    if ( c.pattern && node->pattern && *c.pattern != *node->pattern ) {
      add( Severity::Warning, "constraint-harmony", "Pattern mismatch at "
        + fg.path + ": field guide has \"" + *c.pattern
        + "\", schema has \"" + *node->pattern + "\"", fg.path );
    }
    if ( c.enum_values && node->enum_values
      && !internal::same_value_set(*c.enum_values, *node->enum_values) )
    {
      add( Severity::Warning, "constraint-harmony", "Enum mismatch at "
        + fg.path, fg.path );
    }
  }

  for ( const FieldGuideEntry& fg : bundle.field_guide ) {
    if ( fg.dependencies.empty() ) {
      add( Severity::Error, "dependencies", "Model field " + fg.path
        + " is missing dependency metadata", fg.path );
      continue;
    }
    for ( const FieldDependency& dep : fg.dependencies ) {
      if ( internal::dependency_resolvable(dep, bundle) ) continue;
      add( Severity::Warning, "dependencies", "Dependency not present in "
        "context (" + std::string( dependency_scope_name(dep.scope) ) + "): "
        + dep.path + " (required by " + fg.path + ")", fg.path );
    }
  }

  if ( bundle.messages.size() < 2 ) {
    add( Severity::Error, "message-roles", "Bundle must have at least 2 "
      "messages (system and user)", std::nullopt );
  } else {
    if ( bundle.messages[0].role != "system" ) {
      add( Severity::Error, "message-roles", "First message must be system "
        "role, got: " + bundle.messages[0].role, std::nullopt );
    }
    if ( bundle.messages[1].role != "user" ) {
      add( Severity::Error, "message-roles", "Second message must be user "
        "role, got: " + bundle.messages[1].role, std::nullopt );
    }
    if ( bundle.messages[1].content.find("Return a single JSON object")
      == std::string::npos )
    {
      add( Severity::Error, "response-contract", "User message must include "
        "the JSON response contract directive", std::nullopt );
    }
  }

  for ( const LintIssue& i : issues ) {
    if ( i.severity == Severity::Error ) res.errors.push_back( i );
    else if ( i.severity == Severity::Warning ) res.warnings.push_back( i );
  }
  res.ok = res.errors.empty();
  return res;
}
