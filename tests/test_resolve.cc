//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#include "fixtures.hh"

using check::json;
using check::dump;
using notec::WarningReason;
using notec::Severity;

static notec::ResolutionResult resolve( const notec::NoteTemplate& t,
  const notec::ordered_node& source )
{
  const notec::DerivedSchema nas = notec::derive_non_model_schema( t );
  const notec::ResolutionEngine engine( notec::default_resolvers() );
  return engine.build( t, source, nas );
}

static void test_lookup_scenario() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "mood", "slot": "lookup", "lookup": "subjective.mood",
     "targetPath": "assessment.summary"}
  )" );

  const notec::ResolutionResult ok = resolve( t,
    json(R"({"subjective": {"mood": "stable"}})") );
  CHECK_EQ( dump(ok.snapshot),
    std::string("{\"assessment\":{\"summary\":\"stable\"}}") );
  CHECK( ok.warnings.empty() );
  CHECK_EQ( ok.resolved.size(), 1u );
  CHECK_EQ( ok.resolved[0].path, std::string("assessment.summary") );
  CHECK( ok.resolved[0].slot == notec::SlotKind::Lookup );

  const notec::ResolutionResult missing = resolve( t, json("{}") );
  CHECK_EQ( dump(missing.snapshot), std::string("{}") );
  CHECK_EQ( missing.warnings.size(), 1u );
  CHECK( missing.warnings[0].reason == WarningReason::MissingSource );
  CHECK( missing.warnings[0].severity == Severity::Warning );
  CHECK_EQ( missing.warnings[0].component_id, std::string("s") );
  CHECK_EQ( missing.warnings[0].slot_id, std::string("mood") );
}

static void test_verbatim_time_range() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "quote", "slot": "verbatim",
     "verbatimRef": "transcript:visit_123#t=40-55",
     "targetPath": "subjective.quote"}
  )" );
  const notec::ResolutionResult r = resolve( t,
    json(fixtures::SOAP_SOURCE) );

  CHECK( r.warnings.empty() );
  CHECK_EQ( dump(r.snapshot), std::string( "{\"subjective\":{\"quote\":{"
    "\"ref\":\"transcript:visit_123#t=40-55\","
    "\"text\":\"I have been sleeping better.\"}}}" ) );
}

static void test_verbatim_locators() {
  const notec::ordered_node source = json( R"({
    "transcript": {"raw": {"text": "0123456789abcdefghijklmnopqrstuvwxyz"}},
    "documents": {
      "intake": {"pages": [{"text": "first page"}, {"text": "second page"}]},
      "letter": {"content": "Dear colleague"}
    }
  })" );
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "a", "slot": "verbatim", "verbatimRef": "documents:intake#p=2",
     "targetPath": "quotes.page"},
    {"id": "b", "slot": "verbatim", "verbatimRef": "documents:letter",
     "targetPath": "quotes.letter"},
    {"id": "c", "slot": "verbatim", "verbatimRef": "transcript:raw#t=1-2",
     "targetPath": "quotes.approx"},
    {"id": "d", "slot": "verbatim", "verbatimRef": "documents:intake#p=9",
     "targetPath": "quotes.nopage"},
    {"id": "e", "slot": "verbatim", "verbatimRef": "not a reference",
     "targetPath": "quotes.bad"}
  )" );
  const notec::ResolutionResult r = resolve( t, source );

  auto text_at = [&]( const std::string& path ) {
    auto v = notec::get_by_path( r.snapshot, path + ".text" );
    return v ? notec::internal::to_string_any( *v ) : std::string( "<none>" );
  };
  CHECK_EQ( text_at("quotes.page"), std::string("second page") );
  CHECK_EQ( text_at("quotes.letter"), std::string("Dear colleague") );
  CHECK_EQ( text_at("quotes.approx"), std::string("fghijklmnopqrst") );

  CHECK_EQ( r.warnings.size(), 2u );
  for ( const notec::ResolutionWarning& w : r.warnings ) {
    CHECK( w.reason == WarningReason::InvalidRef );
  }
}

static void test_oversized_indices() {
  const notec::ordered_node source = json( R"({
    "scores": [1, 2],
    "transcript": {"raw": {"text": "0123456789abcdefghijklmnopqrstuvwxyz"}}
  })" );
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "a", "slot": "lookup", "lookup": "scores[99999999999999999999]",
     "targetPath": "big.lookup"},
    {"id": "b", "slot": "computed",
     "formula": "scores[99999999999999999999] + 1",
     "targetPath": "big.computed"},
    {"id": "c", "slot": "verbatim",
     "verbatimRef": "transcript:raw#t=99999999999999999999-1",
     "targetPath": "big.quote"},
    {"id": "d", "slot": "verbatim",
     "verbatimRef": "transcript:raw#p=99999999999999999999",
     "targetPath": "big.page"},
    {"id": "e", "slot": "verbatim",
     "verbatimRef": "transcript:raw#t=1-1229782938247303442",
     "targetPath": "big.tail"}
  )" );
  const notec::ResolutionResult r = resolve( t, source );

  CHECK_EQ( r.warnings.size(), 4u );
  CHECK( r.warnings[0].reason == WarningReason::MissingSource );
  CHECK( r.warnings[1].reason == WarningReason::FormulaError );
  CHECK( r.warnings[2].reason == WarningReason::InvalidRef );
  CHECK( r.warnings[3].reason == WarningReason::InvalidRef );

  // An end offset that overflows clamps to the end of the text
  auto tail = notec::get_by_path( r.snapshot, "big.tail.text" );
  CHECK( tail && notec::internal::to_string_any(*tail)
    == "fghijklmnopqrstuvwxyz" );
}

static void test_full_template() {
  const notec::NoteTemplate t = fixtures::soap_template();
  const notec::ResolutionResult r = resolve( t,
    json(fixtures::SOAP_SOURCE) );

  CHECK( r.warnings.empty() );
  CHECK_EQ( dump(r.snapshot), std::string(
    "{\"medications\":[{\"name\":\"sertraline\"},{\"name\":\"melatonin\"}],"
    "\"scores\":{\"phq9Delta\":15},\"subjective\":{\"mood\":\"stable\"}}" ) );

  // Traversal order: mood, delta, then the table lookup
  CHECK_EQ( r.resolved.size(), 3u );
  CHECK_EQ( r.resolved[0].path, std::string("subjective.mood") );
  CHECK_EQ( r.resolved[1].path, std::string("scores.phq9Delta") );
  CHECK_EQ( r.resolved[2].path, std::string("medications") );
}

static void test_computed_sees_earlier_results() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "base", "slot": "static", "text": "Ada",
     "targetPath": "header.name"},
    {"id": "total", "slot": "computed", "formula": "a + b",
     "resultType": "number", "targetPath": "scores.total"},
    {"id": "label", "slot": "computed",
     "formula": "'Patient ' + header.name + ' scored ' + scores.total",
     "targetPath": "header.label"},
    {"id": "pct", "slot": "computed", "formula": "a / 40", "format": "percent",
     "targetPath": "scores.pct"},
    {"id": "delta", "slot": "computed", "formula": "a - 25",
     "format": "deltaScore", "targetPath": "scores.delta"}
  )" );
  const notec::ResolutionResult r = resolve( t, json(R"({"a": 21, "b": 4})") );

  CHECK( r.warnings.empty() );
  CHECK_EQ( notec::internal::to_string_any(
    *notec::get_by_path(r.snapshot, "header.label")),
    std::string("Patient Ada scored 25") );
  CHECK_EQ( notec::internal::to_string_any(
    *notec::get_by_path(r.snapshot, "scores.pct")), std::string("52.5%") );
  CHECK_EQ( notec::internal::to_string_any(
    *notec::get_by_path(r.snapshot, "scores.delta")), std::string("-4") );
}

static void test_failures_and_required_promotion() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "bad-formula", "slot": "computed", "formula": "1 +",
     "targetPath": "x.a"},
    {"id": "missing-ref", "slot": "computed", "formula": "nope * 2",
     "targetPath": "x.b", "constraints": {"required": true}},
    {"id": "no-data", "slot": "lookup", "lookup": "gone",
     "targetPath": "x.c", "constraints": {"required": true}},
    {"id": "no-text", "slot": "static", "targetPath": "x.d"},
    {"id": "model", "slot": "model", "outputPath": "x.e", "aiDeps": ["q"]}
  )" );
  const notec::ResolutionResult r = resolve( t, json("{}") );

  CHECK_EQ( r.warnings.size(), 4u );
  CHECK( r.warnings[0].reason == WarningReason::FormulaError );
  CHECK( r.warnings[0].severity == Severity::Warning );
  CHECK( r.warnings[1].reason == WarningReason::FormulaError );
  CHECK( r.warnings[1].severity == Severity::Error );
  CHECK( r.warnings[2].reason == WarningReason::MissingSource );
  CHECK( r.warnings[2].severity == Severity::Error );
  CHECK( r.warnings[3].reason == WarningReason::MissingSource );
  CHECK_EQ( r.warnings[3].path, std::string("x.d") );
  CHECK( r.has_errors() );
  CHECK_EQ( dump(r.snapshot), std::string("{}") );
}

static void test_type_mismatch() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "flat", "slot": "static", "text": "plain", "targetPath": "a"},
    {"id": "deep", "slot": "static", "text": "nested", "targetPath": "a.b"}
  )" );
  // Derivation rejects the clash, so resolve against an empty target
  const notec::ResolutionEngine engine( notec::default_resolvers() );
  const notec::DerivedSchema empty{};
  const notec::ResolutionResult r = engine.build( t, json("{}"), empty );

  CHECK_EQ( r.warnings.size(), 1u );
  CHECK( r.warnings[0].reason == WarningReason::TypeMismatch );
  CHECK( r.warnings[0].severity == Severity::Error );
  CHECK_EQ( dump(r.snapshot), std::string("{\"a\":\"plain\"}") );
}

// Answers every static slot at a fixed wrong path
class MisroutingResolver : public notec::SlotResolver {
public:
  bool can_resolve( notec::SlotKind slot ) const override {
    return slot == notec::SlotKind::Static;
  }
  std::optional< notec::ResolvedField > resolve( const notec::ContentItem&,
    const notec::ResolutionContext& ) const override
  {
    return notec::ResolvedField{ "elsewhere",
      notec::internal::make_string_node("x"), notec::SlotKind::Static };
  }
};

static void test_unresolved_slot_guard() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "s1", "slot": "static", "text": "hello", "targetPath": "greeting",
     "constraints": {"required": true}},
    {"id": "l1", "slot": "lookup", "lookup": "x", "targetPath": "y"}
  )" );
  std::vector< std::unique_ptr< notec::SlotResolver > > resolvers;
  resolvers.push_back( std::make_unique< MisroutingResolver >() );
  const notec::ResolutionEngine engine( std::move(resolvers) );
  const notec::ResolutionResult r = engine.build( t, json(R"({"x": 1})"),
    notec::derive_non_model_schema(t) );

  CHECK_EQ( dump(r.snapshot), std::string("{}") );
  CHECK_EQ( r.warnings.size(), 2u );
  CHECK( r.warnings[0].reason == WarningReason::UnresolvedSlot );
  CHECK( r.warnings[0].severity == Severity::Warning );
  // No resolver registered for lookup slots
  CHECK( r.warnings[1].reason == WarningReason::MissingSource );
}

static void test_wildcard_projection() {
  const notec::NoteTemplate t = fixtures::single_section( R"(
    {"id": "codes", "slot": "lookup", "lookup": "diagnoses[].code",
     "targetPath": "problems[].code"},
    {"id": "names", "slot": "lookup", "lookup": "diagnoses[]",
     "targetPath": "raw[]"}
  )" );
  const notec::ResolutionResult r = resolve( t, json( R"({
    "diagnoses": [{"code": "F32.1", "label": "MDD"}, {"label": "GAD"}]
  })" ) );

  CHECK( r.warnings.empty() );
  CHECK_EQ( r.resolved[0].path, std::string("problems") );
  CHECK_EQ( dump(*notec::get_by_path(r.snapshot, "problems")),
    std::string("[{\"code\":\"F32.1\"},{}]") );
  CHECK_EQ( notec::get_by_path(r.snapshot, "raw")->size(), 2u );
}

static void test_determinism() {
  const notec::NoteTemplate t = fixtures::soap_template();
  const notec::ordered_node source = json( R"({"subjective": {}})" );
  const notec::ResolutionResult a = resolve( t, source );
  const notec::ResolutionResult b = resolve( t, source );

  CHECK_EQ( notec::internal::to_json(a.snapshot),
    notec::internal::to_json(b.snapshot) );
  CHECK_EQ( a.warnings.size(), b.warnings.size() );
  for ( std::size_t i = 0; i < a.warnings.size() && i < b.warnings.size();
    ++i )
  {
    CHECK_EQ( notec::internal::to_json(a.warnings[i].to_node()),
      notec::internal::to_json(b.warnings[i].to_node()) );
  }
  CHECK_EQ( a.warnings.size(), 3u );
}

int main() {
  test_lookup_scenario();
  test_verbatim_time_range();
  test_verbatim_locators();
  test_oversized_indices();
  test_full_template();
  test_computed_sees_earlier_results();
  test_failures_and_required_promotion();
  test_type_mismatch();
  test_unresolved_slot_guard();
  test_wildcard_projection();
  test_determinism();
  return check::report( "test_resolve" );
}
