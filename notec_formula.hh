//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "notec_path.hh"
#include "notec_template.hh"

namespace notec {

  class FormulaError : public Error {
  public:
    FormulaError( const std::string& formula, std::size_t position,
      const std::string& msg )
      : Error( "Formula \"" + formula + "\" at position "
          + std::to_string(position) + ": " + msg ),
        formula( formula ), position( position ) {}
    const std::string formula;
    const std::size_t position;
  };

  // Runtime value of a formula sub-expression. Undefined marks a path that
  // did not resolve; Node holds a mapping or sequence taken from the scope.
  struct FormulaValue {
    enum class Kind { Undefined, Null, Number, String, Boolean, Node };

    Kind kind = Kind::Undefined;
    double number = 0.0;
    std::string text;
    bool boolean = false;
    ordered_node node;

    static FormulaValue of_number( double v ) {
      FormulaValue f; f.kind = Kind::Number; f.number = v; return f;
    }
    static FormulaValue of_string( std::string s ) {
      FormulaValue f; f.kind = Kind::String; f.text = std::move( s ); return f;
    }
    static FormulaValue of_boolean( bool b ) {
      FormulaValue f; f.kind = Kind::Boolean; f.boolean = b; return f;
    }
    static FormulaValue null() {
      FormulaValue f; f.kind = Kind::Null; return f;
    }
    static FormulaValue from_node( const ordered_node& n );

    bool truthy() const;
    ordered_node to_node() const;
  };

  // Compiled formula: an exhaustive tagged tree
  struct Expression {
    enum class Kind { Literal, PathRef, Unary, Binary, Ternary };

    Kind kind = Kind::Literal;
    std::size_t position = 0;
    FormulaValue literal;
    std::string path;
    std::string op;
    std::unique_ptr< const Expression > lhs;
    std::unique_ptr< const Expression > rhs;
    std::unique_ptr< const Expression > alt;
    // Height of the subtree rooted here
    std::size_t depth = 1;
  };

  // Compiled expressions keyed by exact formula text. Safe for concurrent
  // readers and writers; entries are immutable once inserted and a second
  // insert of the same key keeps the first.
  class FormulaCache {
  public:
    std::shared_ptr< const Expression > find( const std::string& formula ) const;

    std::shared_ptr< const Expression > insert( const std::string& formula,
      std::shared_ptr< const Expression > expr );

    std::size_t size() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map< std::string,
      std::shared_ptr< const Expression > > entries_;
  };

  // Evaluates template formulas with an explicit recursive-descent parser.
  // Grammar:
  //   expression := logical_or ( '?' expression ':' expression )?
  //   logical_or := logical_and ( '||' logical_and )*
  //   logical_and := equality ( '&&' equality )*
  //   equality := comparison ( ( '==' | '!=' ) comparison )*
  //   comparison := additive ( ( '<' | '<=' | '>' | '>=' ) additive )*
  //   additive := term ( ( '+' | '-' ) term )*
  //   term := factor ( ( '*' | '/' ) factor )*
  //   factor := ( '-' | '+' | '!' ) factor | NUMBER | STRING | true | false
  //           | null | PATH | '(' expression ')'
  class FormulaEvaluator {
  public:
    explicit FormulaEvaluator( std::shared_ptr< FormulaCache > cache
      = std::make_shared< FormulaCache >() )
      : cache_( std::move(cache) ) {}

    // Evaluate formula against scope. Throws FormulaError on malformed
    // input, unresolved references used as operands, type errors and
    // division by zero.
    ordered_node evaluate( const std::string& formula,
      const ordered_node& scope ) const;

    // Parse (or fetch from the cache) the compiled form of formula
    std::shared_ptr< const Expression > compile(
      const std::string& formula ) const;

    // Render a value according to a format hint:
    //   plain -> "15", deltaScore -> "+15", percent (0.256) -> "25.6%"
    static ordered_node format( const ordered_node& value, FormatHint hint );

    const std::shared_ptr< FormulaCache >& cache() const { return cache_; }

  private:
    std::shared_ptr< FormulaCache > cache_;
  };

namespace internal {

  // Bound on parser nesting and on expression tree height
  const std::size_t MAX_FORMULA_DEPTH = 256;

  struct FormulaToken {
    enum class Kind { Number, String, Path, Keyword, Punct, End };
    Kind kind = Kind::End;
    std::string text;
    double number = 0.0;
    std::size_t position = 0;
  };

  class FormulaLexer {
  public:
    explicit FormulaLexer( const std::string& src ) : src_( src ) {}
    std::vector< FormulaToken > tokenize();

  private:
    const std::string& src_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail( const std::string& msg ) const {
      throw FormulaError( src_, pos_, msg );
    }
    FormulaToken lex_number();
    FormulaToken lex_string();
    FormulaToken lex_path();
  };

  class FormulaParser {
    using Node = std::unique_ptr< const Expression >;

  public:
    FormulaParser( const std::string& src, std::vector< FormulaToken > toks )
      : src_( src ), toks_( std::move(toks) ) {}

    std::unique_ptr< const Expression > parse();

  private:
    const std::string& src_;
    std::vector< FormulaToken > toks_;
    std::size_t at_ = 0;
    std::size_t nesting_ = 0;

    struct NestingGuard {
      std::size_t& nesting;
      ~NestingGuard() { --nesting; }
    };
    NestingGuard descend() {
      if ( ++nesting_ > MAX_FORMULA_DEPTH ) {
        --nesting_;
        fail( "formula is nested too deeply" );
      }
      return NestingGuard{ nesting_ };
    }
    Node finish( std::unique_ptr< Expression > e );

    const FormulaToken& peek() const { return toks_[ at_ ]; }
    bool is_punct( const char* p ) const {
      return peek().kind == FormulaToken::Kind::Punct && peek().text == p;
    }
    bool accept( const char* p ) {
      if ( !is_punct(p) ) return false;
      ++at_;
      return true;
    }
    [[noreturn]] void fail( const std::string& msg ) const {
      throw FormulaError( src_, peek().position, msg );
    }

    Node binary( const std::string& op, std::size_t position, Node l, Node r );
    Node expression();
    Node logical_or();
    Node logical_and();
    Node equality();
    Node comparison();
    Node additive();
    Node term();
    Node factor();
  };

  class FormulaInterpreter {
  public:
    FormulaInterpreter( const std::string& src, const ordered_node& scope )
      : src_( src ), scope_( scope ) {}

    FormulaValue eval( const Expression& e ) const;

  private:
    const std::string& src_;
    const ordered_node& scope_;

    [[noreturn]] void fail( const Expression& e, const std::string& msg ) const {
      throw FormulaError( src_, e.position, msg );
    }
    double require_number( const Expression& at, const FormulaValue& v,
      const std::string& op ) const;
    std::string concat_text( const Expression& at,
      const FormulaValue& v ) const;
    FormulaValue eval_binary( const Expression& e ) const;
  };

  inline bool is_path_start( char c ) {
    return std::isalpha( static_cast< unsigned char >(c) ) || c == '_';
  }

  inline bool is_path_char( char c ) {
    return std::isalnum( static_cast< unsigned char >(c) ) || c == '_';
  }

} // namespace notec::internal

} // namespace notec

// FormulaValue

inline notec::FormulaValue notec::FormulaValue::from_node(
  const ordered_node& n )
{
  if ( n.is_null() ) return null();
  if ( internal::is_number(n) ) return of_number( internal::number_of(n) );
  if ( n.is_boolean() ) return of_boolean( n.get_value< bool >() );
  if ( n.is_string() ) {
    return of_string( internal::to_native_checked< std::string >(n) );
  }
  FormulaValue f;
  f.kind = Kind::Node;
  f.node = n;
  return f;
}

inline bool notec::FormulaValue::truthy() const {
  switch ( kind ) {
    case Kind::Undefined: case Kind::Null: return false;
    case Kind::Number: return number != 0.0 && !std::isnan( number );
    case Kind::String: return !text.empty();
    case Kind::Boolean: return boolean;
    case Kind::Node: return true;
  }
  return false;
}

inline notec::ordered_node notec::FormulaValue::to_node() const {
  switch ( kind ) {
    case Kind::Number: return internal::make_number_node( number );
    case Kind::String: return internal::make_string_node( text );
    case Kind::Boolean: return internal::make_node_from( boolean );
    case Kind::Node: return node;
    case Kind::Undefined: case Kind::Null: break;
  }
  return ordered_node();
}

// FormulaCache

inline std::shared_ptr< const notec::Expression > notec::FormulaCache::find(
  const std::string& formula ) const
{
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  auto it = entries_.find( formula );
  if ( it == entries_.end() ) return nullptr;
  return it->second;
}

inline std::shared_ptr< const notec::Expression > notec::FormulaCache::insert(
  const std::string& formula, std::shared_ptr< const Expression > expr )
{
  std::unique_lock< std::shared_mutex > lock( mutex_ );
  auto res = entries_.try_emplace( formula, std::move(expr) );
  return res.first->second;
}

inline std::size_t notec::FormulaCache::size() const {
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  return entries_.size();
}

// Lexer

inline std::vector< notec::internal::FormulaToken >
  notec::internal::FormulaLexer::tokenize()
{
  std::vector< FormulaToken > out;
  while ( pos_ < src_.size() ) {
    const char c = src_[ pos_ ];
    if ( std::isspace(static_cast< unsigned char >(c)) ) { ++pos_; continue; }

    if ( std::isdigit(static_cast< unsigned char >(c))
      || ( c == '.' && pos_ + 1 < src_.size()
        && std::isdigit(static_cast< unsigned char >(src_[pos_ + 1])) ) )
    {
      out.push_back( lex_number() );
      continue;
    }
    if ( c == '\'' || c == '"' ) {
      out.push_back( lex_string() );
      continue;
    }
    if ( is_path_start(c) ) {
      out.push_back( lex_path() );
      continue;
    }

    FormulaToken t;
    t.kind = FormulaToken::Kind::Punct;
    t.position = pos_;
    const std::string two = src_.substr( pos_, 2 );
    if ( two == "==" || two == "!=" || two == "<=" || two == ">="
      || two == "&&" || two == "||" )
    {
      t.text = two;
      pos_ += 2;
    } else if ( std::string( "+-*/()?:<>!" ).find(c) != std::string::npos ) {
      t.text = std::string( 1, c );
      ++pos_;
    } else {
      fail( std::string( "unexpected character '" ) + c + "'" );
    }
    out.push_back( t );
  }

  FormulaToken end;
  end.kind = FormulaToken::Kind::End;
  end.position = src_.size();
  out.push_back( end );
  return out;
}

inline notec::internal::FormulaToken
  notec::internal::FormulaLexer::lex_number()
{
  FormulaToken t;
  t.kind = FormulaToken::Kind::Number;
  t.position = pos_;
  const char* begin = src_.c_str() + pos_;
  char* end = nullptr;
  t.number = std::strtod( begin, &end );
  if ( end == begin ) fail( "malformed number" );
  t.text = std::string( begin, end );
  pos_ += static_cast< std::size_t >( end - begin );
  // "3abc" must not silently split into 3 and abc
  if ( pos_ < src_.size() && is_path_char(src_[pos_]) ) {
    fail( "malformed number" );
  }
  return t;
}

inline notec::internal::FormulaToken
  notec::internal::FormulaLexer::lex_string()
{
  FormulaToken t;
  t.kind = FormulaToken::Kind::String;
  t.position = pos_;
  const char quote = src_[ pos_++ ];
  while ( true ) {
    if ( pos_ >= src_.size() ) fail( "unterminated string literal" );
    const char c = src_[ pos_++ ];
    if ( c == quote ) break;
    if ( c == '\\' ) {
      if ( pos_ >= src_.size() ) fail( "unterminated string literal" );
      const char e = src_[ pos_++ ];
      switch ( e ) {
        case 'n': t.text += '\n'; break;
        case 't': t.text += '\t'; break;
        default: t.text += e; break;
      }
      continue;
    }
    t.text += c;
  }
  return t;
}

// Dotted reference with optional indices: a.b[2].c
inline notec::internal::FormulaToken
  notec::internal::FormulaLexer::lex_path()
{
  FormulaToken t;
  t.kind = FormulaToken::Kind::Path;
  t.position = pos_;
  while ( true ) {
    if ( pos_ >= src_.size() || !is_path_start(src_[pos_]) ) {
      fail( "expected identifier" );
    }
    while ( pos_ < src_.size() && is_path_char(src_[pos_]) ) {
      t.text += src_[ pos_++ ];
    }
    while ( pos_ < src_.size() && src_[pos_] == '[' ) {
      std::size_t close = src_.find( ']', pos_ );
      if ( close == std::string::npos ) fail( "unterminated index" );
      const std::string inner = src_.substr( pos_ + 1, close - pos_ - 1 );
      if ( !parse_index(inner) ) {
        fail( "index must be a non-negative integer" );
      }
      t.text += src_.substr( pos_, close - pos_ + 1 );
      pos_ = close + 1;
    }
    if ( pos_ < src_.size() && src_[pos_] == '.' ) {
      t.text += '.';
      ++pos_;
      continue;
    }
    break;
  }
  if ( t.text == "true" || t.text == "false" || t.text == "null" ) {
    t.kind = FormulaToken::Kind::Keyword;
  }
  return t;
}

// Parser

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::binary( const std::string& op,
    std::size_t position, Node l, Node r )
{
  auto e = std::make_unique< Expression >();
  e->kind = Expression::Kind::Binary;
  e->position = position;
  e->op = op;
  e->lhs = std::move( l );
  e->rhs = std::move( r );
  return finish( std::move(e) );
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::finish( std::unique_ptr< Expression > e )
{
  std::size_t child = 0;
  for ( const Expression* c : { e->lhs.get(), e->rhs.get(), e->alt.get() } ) {
    if ( c ) child = std::max( child, c->depth );
  }
  e->depth = child + 1;
  if ( e->depth > MAX_FORMULA_DEPTH ) {
    throw FormulaError( src_, e->position, "formula is nested too deeply" );
  }
  return e;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::parse()
{
  if ( peek().kind == FormulaToken::Kind::End ) fail( "empty formula" );
  Node root = expression();
  if ( peek().kind != FormulaToken::Kind::End ) {
    fail( "unexpected '" + peek().text + "'" );
  }
  return root;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::expression()
{
  const NestingGuard guard = descend();
  Node cond = logical_or();
  const std::size_t position = peek().position;
  if ( !accept("?") ) return cond;

  Node then_branch = expression();
  if ( !accept(":") ) fail( "expected ':' in conditional expression" );
  Node else_branch = expression();

  auto e = std::make_unique< Expression >();
  e->kind = Expression::Kind::Ternary;
  e->position = position;
  e->lhs = std::move( cond );
  e->rhs = std::move( then_branch );
  e->alt = std::move( else_branch );
  return finish( std::move(e) );
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::logical_or()
{
  Node l = logical_and();
  while ( is_punct("||") ) {
    const std::size_t p = peek().position;
    ++at_;
    l = binary( "||", p, std::move(l), logical_and() );
  }
  return l;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::logical_and()
{
  Node l = equality();
  while ( is_punct("&&") ) {
    const std::size_t p = peek().position;
    ++at_;
    l = binary( "&&", p, std::move(l), equality() );
  }
  return l;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::equality()
{
  Node l = comparison();
  while ( is_punct("==") || is_punct("!=") ) {
    const FormulaToken op = peek();
    ++at_;
    l = binary( op.text, op.position, std::move(l), comparison() );
  }
  return l;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::comparison()
{
  Node l = additive();
  while ( is_punct("<") || is_punct("<=") || is_punct(">")
    || is_punct(">=") )
  {
    const FormulaToken op = peek();
    ++at_;
    l = binary( op.text, op.position, std::move(l), additive() );
  }
  return l;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::additive()
{
  Node l = term();
  while ( is_punct("+") || is_punct("-") ) {
    const FormulaToken op = peek();
    ++at_;
    l = binary( op.text, op.position, std::move(l), term() );
  }
  return l;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::term()
{
  Node l = factor();
  while ( is_punct("*") || is_punct("/") ) {
    const FormulaToken op = peek();
    ++at_;
    l = binary( op.text, op.position, std::move(l), factor() );
  }
  return l;
}

inline notec::internal::FormulaParser::Node
  notec::internal::FormulaParser::factor()
{
  const FormulaToken tok = peek();
  auto e = std::make_unique< Expression >();
  e->position = tok.position;

  switch ( tok.kind ) {
    case FormulaToken::Kind::Number:
      ++at_;
      e->kind = Expression::Kind::Literal;
      e->literal = FormulaValue::of_number( tok.number );
      return e;
    case FormulaToken::Kind::String:
      ++at_;
      e->kind = Expression::Kind::Literal;
      e->literal = FormulaValue::of_string( tok.text );
      return e;
    case FormulaToken::Kind::Keyword:
      ++at_;
      e->kind = Expression::Kind::Literal;
      if ( tok.text == "null" ) e->literal = FormulaValue::null();
      else e->literal = FormulaValue::of_boolean( tok.text == "true" );
      return e;
    case FormulaToken::Kind::Path:
      ++at_;
      e->kind = Expression::Kind::PathRef;
      e->path = tok.text;
      return e;
    case FormulaToken::Kind::Punct:
      if ( tok.text == "(" ) {
        ++at_;
        Node inner = expression();
        if ( !accept(")") ) fail( "expected ')'" );
        return inner;
      }
      if ( tok.text == "-" || tok.text == "+" || tok.text == "!" ) {
        const NestingGuard guard = descend();
        ++at_;
        e->kind = Expression::Kind::Unary;
        e->op = tok.text;
        e->lhs = factor();
        return finish( std::move(e) );
      }
      fail( "unexpected '" + tok.text + "'" );
    case FormulaToken::Kind::End:
      fail( "unexpected end of formula" );
  }
  fail( "unexpected token" );
}

// Interpreter

inline double notec::internal::FormulaInterpreter::require_number(
  const Expression& at, const FormulaValue& v, const std::string& op ) const
{
  if ( v.kind == FormulaValue::Kind::Number ) return v.number;
  if ( v.kind == FormulaValue::Kind::Undefined ) {
    fail( at, "unresolved reference used with '" + op + "'" );
  }
  fail( at, "operator '" + op + "' requires numbers" );
}

inline std::string notec::internal::FormulaInterpreter::concat_text(
  const Expression& at, const FormulaValue& v ) const
{
  switch ( v.kind ) {
    case FormulaValue::Kind::String: return v.text;
    case FormulaValue::Kind::Number: return format_number( v.number );
    case FormulaValue::Kind::Boolean: return v.boolean ? "true" : "false";
    case FormulaValue::Kind::Null: return "null";
    case FormulaValue::Kind::Undefined:
      fail( at, "unresolved reference in string concatenation" );
    case FormulaValue::Kind::Node:
      fail( at, "cannot concatenate an object or array" );
  }
  return std::string();
}

inline notec::FormulaValue notec::internal::FormulaInterpreter::eval(
  const Expression& e ) const
{
  switch ( e.kind ) {
    case Expression::Kind::Literal:
      return e.literal;

    case Expression::Kind::PathRef: {
      std::optional< ordered_node > v = get_by_path( scope_, e.path );
      if ( !v ) return FormulaValue();
      return FormulaValue::from_node( *v );
    }

    case Expression::Kind::Unary: {
      const FormulaValue v = eval( *e.lhs );
      if ( e.op == "!" ) return FormulaValue::of_boolean( !v.truthy() );
      const double d = require_number( e, v, e.op );
      return FormulaValue::of_number( e.op == "-" ? -d : d );
    }

    case Expression::Kind::Binary:
      return eval_binary( e );

    case Expression::Kind::Ternary:
      return eval( *e.lhs ).truthy() ? eval( *e.rhs ) : eval( *e.alt );
  }
  fail( e, "unknown expression" );
}

inline notec::FormulaValue notec::internal::FormulaInterpreter::eval_binary(
  const Expression& e ) const
{
  using Kind = FormulaValue::Kind;

  // Short-circuit operators return one of their operands
  if ( e.op == "&&" ) {
    FormulaValue l = eval( *e.lhs );
    return l.truthy() ? eval( *e.rhs ) : l;
  }
  if ( e.op == "||" ) {
    FormulaValue l = eval( *e.lhs );
    return l.truthy() ? l : eval( *e.rhs );
  }

  const FormulaValue l = eval( *e.lhs );
  const FormulaValue r = eval( *e.rhs );

  if ( e.op == "+" ) {
    if ( l.kind == Kind::String || r.kind == Kind::String ) {
      return FormulaValue::of_string( concat_text(e, l) + concat_text(e, r) );
    }
    return FormulaValue::of_number( require_number(e, l, "+")
      + require_number(e, r, "+") );
  }
  if ( e.op == "-" ) {
    return FormulaValue::of_number( require_number(e, l, "-")
      - require_number(e, r, "-") );
  }
  if ( e.op == "*" ) {
    return FormulaValue::of_number( require_number(e, l, "*")
      * require_number(e, r, "*") );
  }
  if ( e.op == "/" ) {
    const double num = require_number( e, l, "/" );
    const double den = require_number( e, r, "/" );
    if ( den == 0.0 ) fail( e, "division by zero" );
    return FormulaValue::of_number( num / den );
  }

  if ( e.op == "==" || e.op == "!=" ) {
    bool eq = false;
    const bool l_nullish = l.kind == Kind::Undefined || l.kind == Kind::Null;
    const bool r_nullish = r.kind == Kind::Undefined || r.kind == Kind::Null;
    if ( l_nullish || r_nullish ) eq = l_nullish && r_nullish;
    else if ( l.kind != r.kind ) eq = false;
    else if ( l.kind == Kind::Number ) eq = l.number == r.number;
    else if ( l.kind == Kind::String ) eq = l.text == r.text;
    else if ( l.kind == Kind::Boolean ) eq = l.boolean == r.boolean;
    else eq = l.node == r.node;
    return FormulaValue::of_boolean( e.op == "==" ? eq : !eq );
  }

  // Ordering comparisons: numbers with numbers, strings with strings
  int cmp = 0;
  if ( l.kind == Kind::String && r.kind == Kind::String ) {
    cmp = l.text.compare( r.text );
  } else {
    const double a = require_number( e, l, e.op );
    const double b = require_number( e, r, e.op );
    cmp = ( a < b ) ? -1 : ( a > b ? 1 : 0 );
  }
  if ( e.op == "<" ) return FormulaValue::of_boolean( cmp < 0 );
  if ( e.op == "<=" ) return FormulaValue::of_boolean( cmp <= 0 );
  if ( e.op == ">" ) return FormulaValue::of_boolean( cmp > 0 );
  if ( e.op == ">=" ) return FormulaValue::of_boolean( cmp >= 0 );
  fail( e, "unknown operator '" + e.op + "'" );
}

// FormulaEvaluator

inline std::shared_ptr< const notec::Expression >
  notec::FormulaEvaluator::compile( const std::string& formula ) const
{
  if ( cache_ ) {
    if ( auto hit = cache_->find(formula) ) return hit;
  }

  // Compiling outside any lock; a racing compile of the same text is
  // harmless because insert keeps whichever landed first.
  internal::FormulaLexer lexer( formula );
  internal::FormulaParser parser( formula, lexer.tokenize() );
  std::shared_ptr< const Expression > expr = parser.parse();

  if ( !cache_ ) return expr;
  return cache_->insert( formula, std::move(expr) );
}

inline notec::ordered_node notec::FormulaEvaluator::evaluate(
  const std::string& formula, const ordered_node& scope ) const
{
  std::shared_ptr< const Expression > expr = compile( formula );
  internal::FormulaInterpreter interp( formula, scope );
  const FormulaValue v = interp.eval( *expr );
  if ( v.kind == FormulaValue::Kind::Undefined ) {
    throw FormulaError( formula, 0, "formula produced no value "
      "(unresolved reference)" );
  }
  return v.to_node();
}

inline notec::ordered_node notec::FormulaEvaluator::format(
  const ordered_node& value, FormatHint hint )
{
  if ( !internal::is_number(value) ) {
    return internal::make_string_node( internal::to_string_any(value) );
  }

  const double v = internal::number_of( value );
  switch ( hint ) {
    case FormatHint::DeltaScore:
      return internal::make_string_node(
        ( v >= 0 ? "+" : "" ) + internal::format_number(v) );
    case FormatHint::Percent: {
      char buf[ 64 ];
      std::snprintf( buf, sizeof(buf), "%.1f%%", v * 100.0 );
      return internal::make_string_node( buf );
    }
    case FormatHint::Plain:
      break;
  }
  return internal::make_string_node( internal::format_number(v) );
}
