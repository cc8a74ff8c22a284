//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>

#include "notec_lint.hh"

namespace notec {

  // Source of the generation timestamp embedded in bundle ids, as an
  // ISO-8601 UTC string with milliseconds ("2026-03-01T09:30:00.000Z")
  using Clock = std::function< std::string() >;

  std::string iso_timestamp( std::chrono::system_clock::time_point tp );

  inline std::string system_clock_now() {
    return iso_timestamp( std::chrono::system_clock::now() );
  }

  inline Clock fixed_clock( std::string timestamp ) {
    return [ts = std::move(timestamp)]() { return ts; };
  }

  struct CompositionResult {
    PromptBundle bundle;
    // Field guide and context slicing diagnostics
    std::vector< LintIssue > issues;
    LintResult lint;

    bool has_errors() const;
  };

  // field guide -> context slice -> messages -> assembly -> lint. Never
  // throws on lint or composition issues; the caller decides what blocks.
  CompositionResult compose_prompt( const NoteTemplate& tmpl,
    const DerivedSchema& model_schema, const ordered_node& snapshot,
    const std::optional< ordered_node >& fact_pack = std::nullopt,
    const Clock& clock = system_clock_now );

} // namespace notec

inline std::string notec::iso_timestamp(
  std::chrono::system_clock::time_point tp )
{
  using namespace std::chrono;
  const auto ms = duration_cast< milliseconds >( tp.time_since_epoch() );
  const std::time_t secs = static_cast< std::time_t >(
    duration_cast< seconds >( ms ).count() );
  long frac = static_cast< long >( ms.count() % 1000 );
  std::time_t whole = secs;
  if ( frac < 0 ) { frac += 1000; whole -= 1; }

  std::tm utc{};
  gmtime_r( &whole, &utc );
  char buf[ 32 ];
  std::strftime( buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc );
  char out[ 48 ];
  std::snprintf( out, sizeof(out), "%s.%03ldZ", buf, frac );
  return out;
}

inline bool notec::CompositionResult::has_errors() const {
  if ( !lint.ok ) return true;
  for ( const LintIssue& i : issues ) {
    if ( i.severity == Severity::Error ) return true;
  }
  return false;
}

inline notec::CompositionResult notec::compose_prompt( const NoteTemplate& tmpl,
  const DerivedSchema& model_schema, const ordered_node& snapshot,
  const std::optional< ordered_node >& fact_pack, const Clock& clock )
{
  CompositionResult out;

  FieldGuide guide = build_field_guide( tmpl );
  ContextSlice slice = slice_context( snapshot, guide.entries );
  out.issues = std::move( guide.issues );
  out.issues.insert( out.issues.end(), slice.issues.begin(),
    slice.issues.end() );

  PromptBundle& b = out.bundle;
  b.messages = build_messages( tmpl, guide.entries, fact_pack,
    slice.nas_slices );
  b.id = tmpl.id + "@" + tmpl.version + "_" + clock();
  b.template_id = tmpl.id;
  b.template_version = tmpl.version;
  b.json_schema = model_schema;
  b.field_guide = std::move( guide.entries );
  b.fact_pack = fact_pack;
  b.nas_slices = std::move( slice.nas_slices );

  out.lint = lint_prompt_bundle( b, tmpl );
  return out;
}
