//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#include "fixtures.hh"

using check::json;
using notec::Severity;

struct Fixture {
  notec::NoteTemplate tmpl;
  notec::PromptBundle bundle;
};

static Fixture compose( const notec::NoteTemplate& t,
  const notec::ordered_node& snapshot,
  const std::optional< notec::ordered_node >& fact_pack = std::nullopt )
{
  const notec::CompositionResult r = notec::compose_prompt( t,
    notec::derive_model_schema(t), snapshot, fact_pack,
    notec::fixed_clock(fixtures::FIXED_TIME) );
  return Fixture{ t, r.bundle };
}

static Fixture soap() {
  return compose( fixtures::soap_template(), fixtures::soap_snapshot() );
}

static std::size_t count_check( const notec::LintResult& r,
  const std::string& name, Severity sev )
{
  std::size_t n = 0;
  for ( const notec::LintIssue& i : r.issues ) {
    if ( i.check == name && i.severity == sev ) ++n;
  }
  return n;
}

static void test_clean_bundle() {
  const Fixture f = soap();
  const notec::LintResult r = notec::lint_prompt_bundle( f.bundle, f.tmpl );
  CHECK( r.ok );
  CHECK( r.errors.empty() );
  CHECK_EQ( r.warnings.size(), 1u );
  CHECK_EQ( r.warnings[0].message, std::string( "Dependency not present in "
    "context (nas): assessments.phq9 (required by assessment.severity)" ) );

  const notec::ordered_node n = r.to_node();
  CHECK( n.at("ok").get_value< bool >() );
  CHECK_EQ( notec::internal::to_string_any(n.at("errorCount")),
    std::string("0") );
  CHECK_EQ( notec::internal::to_string_any(n.at("warningCount")),
    std::string("1") );
}

static void test_coverage() {
  Fixture f = soap();
  f.bundle.field_guide.pop_back();
  const notec::LintResult r = notec::lint_prompt_bundle( f.bundle, f.tmpl );
  CHECK( !r.ok );
  CHECK_EQ( count_check(r, "coverage", Severity::Error), 1u );
  CHECK_EQ( r.errors[0].message, std::string(
    "Field guide has 4 entries but template has 5 model items") );
}

static void test_path_validity() {
  Fixture f = soap();
  f.bundle.field_guide[0].path = "assessment.nothing";
  const notec::LintResult r = notec::lint_prompt_bundle( f.bundle, f.tmpl );
  CHECK( !r.ok );
  CHECK_EQ( count_check(r, "path-validity", Severity::Error), 1u );
  CHECK( r.errors[0].path == std::optional< std::string >(
    "assessment.nothing") );
}

static void test_constraint_harmony() {
  const notec::NoteTemplate t = notec::load_template( json( R"({
    "id": "h", "version": "1",
    "layout": [{"id": "s", "type": "section", "content": [
      {"id": "code", "slot": "model", "outputPath": "dx.code",
       "aiDeps": ["source.dx"], "constraints": {"pattern": "^[A-Z]"}},
      {"id": "level", "slot": "model", "outputPath": "dx.level",
       "aiDeps": ["source.dx"], "constraints": {"enum": ["low", "high"]}}
    ]}]
  })" ) );
  Fixture f = compose( t, json("{}"), json(R"({"dx": {"code": "F32"}})") );

  const notec::LintResult clean = notec::lint_prompt_bundle( f.bundle, t );
  CHECK( clean.ok );
  CHECK( clean.issues.empty() );

  // Same values in another order still agree
  f.bundle.field_guide[1].constraints->enum_values =
    std::vector< std::string >{ "high", "low" };
  CHECK( notec::lint_prompt_bundle(f.bundle, t).issues.empty() );

  f.bundle.field_guide[0].constraints->pattern = "^[0-9]";
  f.bundle.field_guide[1].constraints->enum_values =
    std::vector< std::string >{ "low" };
  const notec::LintResult r = notec::lint_prompt_bundle( f.bundle, t );
  CHECK( r.ok );
  CHECK_EQ( count_check(r, "constraint-harmony", Severity::Warning), 2u );
  CHECK_EQ( r.warnings[0].message, std::string( "Pattern mismatch at dx.code: "
    "field guide has \"^[0-9]\", schema has \"^[A-Z]\"" ) );
}

static void test_dependencies() {
  const notec::NoteTemplate t = notec::load_template( json( R"({
    "id": "d", "version": "1",
    "layout": [{"id": "s", "type": "section", "content": [
      {"id": "age", "slot": "model", "outputPath": "summary.age",
       "aiDeps": ["source.patient.age", "source"]}
    ]}]
  })" ) );

  // Without a fact pack nothing source-scoped resolves
  const Fixture bare = compose( t, json("{}") );
  const notec::LintResult r1 = notec::lint_prompt_bundle( bare.bundle, t );
  CHECK( r1.ok );
  CHECK_EQ( count_check(r1, "dependencies", Severity::Warning), 2u );
  CHECK_EQ( r1.warnings[0].message, std::string( "Dependency not present in "
    "context (source): source.patient.age (required by summary.age)" ) );

  const Fixture packed = compose( t, json("{}"),
    json(R"({"patient": {"age": 40}})") );
  CHECK( notec::lint_prompt_bundle(packed.bundle, t).issues.empty() );

  Fixture stripped = packed;
  stripped.bundle.field_guide[0].dependencies.clear();
  const notec::LintResult r2 = notec::lint_prompt_bundle( stripped.bundle, t );
  CHECK( !r2.ok );
  CHECK_EQ( count_check(r2, "dependencies", Severity::Error), 1u );
}

static void test_message_roles() {
  Fixture swapped = soap();
  std::swap( swapped.bundle.messages[0].role,
    swapped.bundle.messages[1].role );
  const notec::LintResult r1 = notec::lint_prompt_bundle( swapped.bundle,
    swapped.tmpl );
  CHECK_EQ( count_check(r1, "message-roles", Severity::Error), 2u );

  Fixture single = soap();
  single.bundle.messages.pop_back();
  const notec::LintResult r2 = notec::lint_prompt_bundle( single.bundle,
    single.tmpl );
  CHECK_EQ( count_check(r2, "message-roles", Severity::Error), 1u );
  CHECK_EQ( count_check(r2, "response-contract", Severity::Error), 0u );
}

static void test_response_contract() {
  Fixture f = soap();
  f.bundle.messages[1].content = "PURPOSE\nWrite something.";
  const notec::LintResult r = notec::lint_prompt_bundle( f.bundle, f.tmpl );
  CHECK( !r.ok );
  CHECK_EQ( count_check(r, "response-contract", Severity::Error), 1u );
  CHECK_EQ( r.errors.size(), 1u );
}

int main() {
  test_clean_bundle();
  test_coverage();
  test_path_validity();
  test_constraint_harmony();
  test_dependencies();
  test_message_roles();
  test_response_contract();
  return check::report( "test_lint" );
}
