//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#include <fstream>

#include "notec.hh"

namespace {

  const char* USAGE = "usage: notec TEMPLATE [SOURCE_DATA] [--fact-pack FILE]"
    " [--config FILE] [--timestamp ISO] [--quiet | --verbose]"
    " [--fail-on-warnings]";

  struct Options {
    std::string template_file;
    std::optional< std::string > source_file;
    std::optional< std::string > fact_pack_file;
    std::optional< std::string > config_file;
    std::optional< std::string > timestamp;
    std::optional< notec::Verbosity > verbosity;
    bool fail_on_warnings = false;
  };

  Options parse_args( int argc, char** argv ) {
    Options opt;
    std::vector< std::string > positional;

    for ( int i = 1; i < argc; ++i ) {
      const std::string a = argv[ i ];
      auto value = [&]() -> std::string {
        if ( i + 1 >= argc ) throw notec::Error( a + " requires a value" );
        return argv[ ++i ];
      };

      if ( a == "--fact-pack" ) opt.fact_pack_file = value();
      else if ( a == "--config" ) opt.config_file = value();
      else if ( a == "--timestamp" ) opt.timestamp = value();
      else if ( a == "--quiet" ) opt.verbosity = notec::Verbosity::Quiet;
      else if ( a == "--verbose" ) opt.verbosity = notec::Verbosity::Verbose;
      else if ( a == "--fail-on-warnings" ) opt.fail_on_warnings = true;
      else if ( a.size() > 1 && a[0] == '-' ) {
        throw notec::Error( "unknown option " + a + "\n" + USAGE );
      }
      else positional.push_back( a );
    }

    if ( positional.empty() || positional.size() > 2 ) {
      throw notec::Error( USAGE );
    }
    opt.template_file = positional[ 0 ];
    if ( positional.size() == 2 ) opt.source_file = positional[ 1 ];
    return opt;
  }

  notec::ordered_node read_document( const std::string& file ) {
    std::ifstream in( file );
    if ( !in ) throw notec::Error( "cannot open " + file );
    return notec::parse_document( in, file );
  }

  class Reporter {
  public:
    explicit Reporter( notec::Verbosity v ) : verbosity_( v ) {}

    void info( const std::string& msg ) const {
      if ( verbosity_ == notec::Verbosity::Verbose ) {
        std::cerr << "[notec] info: " << msg << "\n";
      }
    }
    void warning( const std::string& msg ) const {
      if ( verbosity_ != notec::Verbosity::Quiet ) {
        std::cerr << "[notec] warning: " << msg << "\n";
      }
    }

  private:
    notec::Verbosity verbosity_;
  };

  template < typename T >
  notec::ordered_node node_list( const std::vector< T >& items ) {
    std::vector< notec::ordered_node > out;
    out.reserve( items.size() );
    for ( const T& i : items ) out.push_back( i.to_node() );
    return notec::internal::make_node_from( out );
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    const Options opt = parse_args( argc, argv );

    std::vector< std::string > notes;
    notec::Config cfg;
    if ( opt.config_file ) {
      cfg = notec::load_config( read_document(*opt.config_file), &notes );
    }
    if ( opt.timestamp ) cfg.timestamp = opt.timestamp;
    if ( opt.verbosity ) cfg.verbosity = *opt.verbosity;
    if ( opt.fail_on_warnings ) cfg.fail_on_warnings = true;

    const Reporter log( cfg.verbosity );
    for ( const std::string& n : notes ) log.warning( n );
    notes.clear();

    log.info( "loading template " + opt.template_file );
    const notec::NoteTemplate tmpl = notec::load_template(
      read_document(opt.template_file), &notes );
    for ( const std::string& n : notes ) log.warning( n );

    const notec::ordered_node source = opt.source_file
      ? read_document( *opt.source_file ) : notec::ordered_node::mapping();
    std::optional< notec::ordered_node > fact_pack;
    if ( opt.fact_pack_file ) fact_pack = read_document( *opt.fact_pack_file );

    log.info( "deriving schemas" );
    const notec::DerivedSchema model = notec::derive_model_schema( tmpl,
      cfg.schema_id_base );
    const notec::DerivedSchema non_model = notec::derive_non_model_schema(
      tmpl, cfg.schema_id_base );
    notec::validate_mergeable( model, non_model );
    const notec::DerivedSchema render = notec::merge_schemas( model,
      non_model, tmpl.id, tmpl.name, tmpl.version, cfg.schema_id_base );

    log.info( "resolving non-model fields" );
    auto evaluator = std::make_shared< notec::FormulaEvaluator >();
    const notec::ResolutionEngine engine(
      notec::default_resolvers(evaluator) );
    const notec::ResolutionResult resolved = engine.build( tmpl, source,
      non_model );

    log.info( "composing prompt bundle" );
    notec::Clock clock = notec::system_clock_now;
    if ( cfg.timestamp ) clock = notec::fixed_clock( *cfg.timestamp );
    const notec::CompositionResult composed = notec::compose_prompt( tmpl,
      model, resolved.snapshot, fact_pack, clock );

    bool warned = false;
    for ( const notec::ResolutionWarning& w : resolved.warnings ) {
      if ( w.severity == notec::Severity::Warning ) warned = true;
      log.warning( std::string( notec::warning_reason_name(w.reason) ) + " at "
        + w.path + ": " + w.message );
    }
    for ( const notec::LintIssue& i : composed.issues ) {
      if ( i.severity == notec::Severity::Warning ) warned = true;
      log.warning( "[" + i.check + "] " + i.message );
    }
    for ( const notec::LintIssue& i : composed.lint.issues ) {
      if ( i.severity == notec::Severity::Warning ) warned = true;
      log.warning( "[" + i.check + "] " + i.message );
    }

    notec::ordered_node out = notec::ordered_node::mapping();
    out[ "structuredOutputSchema" ] = model.to_node();
    out[ "nonModelSchema" ] = non_model.to_node();
    out[ "renderSchema" ] = render.to_node();
    out[ "snapshot" ] = resolved.snapshot;
    out[ "resolved" ] = node_list( resolved.resolved );
    out[ "warnings" ] = node_list( resolved.warnings );
    out[ "bundle" ] = composed.bundle.to_node();
    out[ "issues" ] = node_list( composed.issues );
    out[ "lint" ] = composed.lint.to_node();
    std::cout << notec::internal::to_json( out ) << "\n";

    if ( resolved.has_errors() || composed.has_errors() ) return 2;
    if ( cfg.fail_on_warnings && warned ) return 2;
    return 0;
  } catch ( const std::exception& ex ) {
    std::cerr << "[notec] error: " << ex.what() << "\n";
    return 1;
  }
}
