//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#include <thread>

#include "fixtures.hh"

using check::json;
using notec::FormulaEvaluator;
using notec::FormatHint;

static const char* SCOPE = R"({
  "assessments": {"phq9": {"score": 21, "baseline": 6},
                  "gad7": {"score": 4.5}},
  "patient": {"name": "Ada", "age": 40, "active": true},
  "scores": [3, 7, 11],
  "empty": ""
})";

static std::string eval_text( const FormulaEvaluator& ev,
  const std::string& f, const notec::ordered_node& scope )
{
  return notec::internal::to_string_any( ev.evaluate(f, scope) );
}

static void test_arithmetic() {
  FormulaEvaluator ev;
  const notec::ordered_node scope = json( SCOPE );

  const notec::ordered_node v = ev.evaluate( "assessments.phq9.score - 6",
    scope );
  CHECK( v.is_integer() );
  CHECK_EQ( notec::internal::number_of(v), 15.0 );

  CHECK_EQ( eval_text(ev, "1 + 2 * 3", scope), std::string("7") );
  CHECK_EQ( eval_text(ev, "(1 + 2) * 3", scope), std::string("9") );
  CHECK_EQ( eval_text(ev, "10 / 4", scope), std::string("2.5") );
  CHECK_EQ( eval_text(ev, "-assessments.phq9.baseline + 1", scope),
    std::string("-5") );
  CHECK_EQ( eval_text(ev, "8 - 2 - 1", scope), std::string("5") );
  CHECK_EQ( eval_text(ev, "assessments.gad7.score * 2", scope),
    std::string("9") );
  CHECK_EQ( eval_text(ev, "scores[2] - scores[0]", scope), std::string("8") );
}

static void test_strings_and_ternary() {
  FormulaEvaluator ev;
  const notec::ordered_node scope = json( SCOPE );

  CHECK_EQ( eval_text(ev, "'Patient: ' + patient.name", scope),
    std::string("Patient: Ada") );
  CHECK_EQ( eval_text(ev, "\"age \" + patient.age", scope),
    std::string("age 40") );
  CHECK_EQ( eval_text(ev, "'it\\'s'", scope), std::string("it's") );

  CHECK_EQ( eval_text(ev,
    "assessments.phq9.score >= 20 ? 'severe' : 'moderate'", scope),
    std::string("severe") );
  CHECK_EQ( eval_text(ev,
    "assessments.phq9.score < 10 ? 'mild' : assessments.phq9.score < 20 "
    "? 'moderate' : 'severe'", scope), std::string("severe") );
  CHECK_EQ( eval_text(ev, "patient.active && patient.age > 18 ? 1 : 0",
    scope), std::string("1") );

  // Missing references are falsy in conditions
  CHECK_EQ( eval_text(ev, "patient.nickname ? patient.nickname : 'none'",
    scope), std::string("none") );
  CHECK_EQ( eval_text(ev, "patient.nickname || patient.name", scope),
    std::string("Ada") );
  CHECK_EQ( eval_text(ev, "empty == '' ? 'blank' : 'set'", scope),
    std::string("blank") );
  CHECK( ev.evaluate("!patient.active", scope).is_boolean() );
  CHECK( ev.evaluate("null", scope).is_null() );
}

static void test_errors() {
  FormulaEvaluator ev;
  const notec::ordered_node scope = json( SCOPE );

  for ( const char* bad : { "1 +", "(1 + 2", "1 2", "2 * * 3", "a ? b",
    "'open", "3abc", "1 # 2", ")", "", "a..b", "x[y]" } )
  {
    CHECK_THROWS( notec::FormulaError, ev.evaluate(bad, scope) );
  }

  CHECK_THROWS( notec::FormulaError, ev.evaluate("10 / 0", scope) );
  CHECK_THROWS( notec::FormulaError,
    ev.evaluate("assessments.phq9.missing - 1", scope) );
  CHECK_THROWS( notec::FormulaError,
    ev.evaluate("patient.nickname", scope) );
  CHECK_THROWS( notec::FormulaError, ev.evaluate("patient.name * 2", scope) );
  CHECK_THROWS( notec::FormulaError,
    ev.evaluate("'x' + assessments", scope) );

  try {
    ev.evaluate( "1 + (2 * 3", scope );
    check::fail( __FILE__, __LINE__, "expected FormulaError" );
  } catch ( const notec::FormulaError& e ) {
    CHECK_EQ( e.formula, std::string("1 + (2 * 3") );
    CHECK_EQ( e.position, 10u );
  }
}

static void test_nesting_limit() {
  FormulaEvaluator ev;
  const notec::ordered_node scope = json( SCOPE );

  CHECK_EQ( eval_text(ev, std::string(100, '(') + "1" + std::string(100, ')'),
    scope), std::string("1") );
  CHECK_EQ( eval_text(ev, std::string(100, '-') + "1", scope),
    std::string("1") );

  const std::size_t deep = 200000;
  CHECK_THROWS( notec::FormulaError,
    ev.evaluate(std::string(deep, '(') + "1" + std::string(deep, ')'), scope) );
  CHECK_THROWS( notec::FormulaError,
    ev.evaluate(std::string(deep, '-') + "1", scope) );
  CHECK_THROWS( notec::FormulaError, ev.evaluate(std::string(deep, '!'),
    scope) );

  // Long flat chains build deep trees too
  std::string chain = "1";
  for ( std::size_t i = 0; i < 1000; ++i ) chain += " + 1";
  CHECK_THROWS( notec::FormulaError, ev.evaluate(chain, scope) );
}

static void test_format() {
  using notec::internal::make_number_node;
  using notec::internal::to_string_any;

  CHECK_EQ( to_string_any(FormulaEvaluator::format(make_number_node(15),
    FormatHint::Plain)), std::string("15") );
  CHECK_EQ( to_string_any(FormulaEvaluator::format(make_number_node(15),
    FormatHint::DeltaScore)), std::string("+15") );
  CHECK_EQ( to_string_any(FormulaEvaluator::format(make_number_node(0),
    FormatHint::DeltaScore)), std::string("+0") );
  CHECK_EQ( to_string_any(FormulaEvaluator::format(make_number_node(-3),
    FormatHint::DeltaScore)), std::string("-3") );
  CHECK_EQ( to_string_any(FormulaEvaluator::format(make_number_node(0.256),
    FormatHint::Percent)), std::string("25.6%") );
  CHECK_EQ( to_string_any(FormulaEvaluator::format(
    notec::internal::make_string_node("n/a"), FormatHint::Percent)),
    std::string("n/a") );
  CHECK( FormulaEvaluator::format(make_number_node(1), FormatHint::Plain)
    .is_string() );
}

static void test_cache() {
  auto cache = std::make_shared< notec::FormulaCache >();
  FormulaEvaluator a( cache );
  FormulaEvaluator b( cache );
  const notec::ordered_node scope = json( SCOPE );

  a.evaluate( "1 + 1", scope );
  b.evaluate( "1 + 1", scope );
  b.evaluate( "2 + 2", scope );
  CHECK_EQ( cache->size(), 2u );
  CHECK( a.compile("1 + 1") == b.compile("1 + 1") );

  // Isolated evaluators do not share entries
  FormulaEvaluator c;
  c.evaluate( "1 + 1", scope );
  CHECK_EQ( c.cache()->size(), 1u );
  CHECK_EQ( cache->size(), 2u );

  // A malformed formula is never cached
  CHECK_THROWS( notec::FormulaError, a.evaluate("1 +", scope) );
  CHECK_EQ( cache->size(), 2u );

  // First insert wins
  auto first = std::make_shared< notec::Expression >();
  auto second = std::make_shared< notec::Expression >();
  notec::FormulaCache direct;
  CHECK( direct.insert("k", first) == first );
  CHECK( direct.insert("k", second) == first );
  CHECK( direct.find("k") == first );
  CHECK( !direct.find("missing") );
}

static void test_concurrent_cache() {
  auto cache = std::make_shared< notec::FormulaCache >();
  const notec::ordered_node scope = json( SCOPE );
  std::vector< std::string > results( 8 );

  std::vector< std::thread > workers;
  for ( std::size_t i = 0; i < results.size(); ++i ) {
    workers.emplace_back( [&, i]() {
      FormulaEvaluator ev( cache );
      for ( int k = 0; k < 50; ++k ) {
        ev.evaluate( "assessments.phq9.score - " + std::to_string(k % 5),
          scope );
      }
      results[ i ] = notec::internal::to_string_any(
        ev.evaluate("assessments.phq9.score - 6", scope) );
    } );
  }
  for ( std::thread& w : workers ) w.join();

  for ( const std::string& r : results ) CHECK_EQ( r, std::string("15") );
  CHECK_EQ( cache->size(), 6u );
}

int main() {
  test_arithmetic();
  test_strings_and_ternary();
  test_errors();
  test_nesting_limit();
  test_format();
  test_cache();
  test_concurrent_cache();
  return check::report( "test_formula" );
}
