//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "notec_common.hh"

namespace notec {

  enum class Verbosity { Quiet, Normal, Verbose };

  // Driver settings. Every field has a default so an absent config file
  // and an empty mapping behave the same.
  struct Config {
    std::string schema_id_base = internal::DEFAULT_SCHEMA_ID_BASE;
    std::optional< std::string > timestamp;
    Verbosity verbosity = Verbosity::Normal;
    bool fail_on_warnings = false;
  };

  // Read a config mapping. Unknown keys are reported through warnings_out
  // and ignored; a wrongly typed value throws ConfigError.
  Config load_config( const ordered_node& doc,
    std::vector< std::string >* warnings_out = nullptr );

} // namespace notec

inline notec::Config notec::load_config( const ordered_node& doc,
  std::vector< std::string >* warnings_out )
{
  Config cfg;
  if ( doc.is_null() ) return cfg;
  if ( !doc.is_mapping() ) {
    throw ConfigError( "config: document must be a mapping" );
  }

  auto expect_string = [&]( const std::string& key, const ordered_node& v ) {
    if ( !v.is_string() ) {
      throw ConfigError( "config: '" + key + "' must be a string" );
    }
    return internal::to_native_checked< std::string >( v );
  };

  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string key = mk.get_value< std::string >();
    if ( key == "schema_id_base" ) {
      cfg.schema_id_base = expect_string( key, mv );
      if ( cfg.schema_id_base.empty() ) {
        throw ConfigError( "config: 'schema_id_base' must not be empty" );
      }
    }
    else if ( key == "timestamp" ) {
      if ( !mv.is_null() ) cfg.timestamp = expect_string( key, mv );
    }
    else if ( key == "verbosity" ) {
      const std::string v = expect_string( key, mv );
      if ( v == "quiet" ) cfg.verbosity = Verbosity::Quiet;
      else if ( v == "normal" ) cfg.verbosity = Verbosity::Normal;
      else if ( v == "verbose" ) cfg.verbosity = Verbosity::Verbose;
      else {
        throw ConfigError( "config: 'verbosity' must be one of quiet, "
          "normal, verbose (got '" + v + "')" );
      }
    }
    else if ( key == "fail_on_warnings" ) {
      if ( !mv.is_boolean() ) {
        throw ConfigError( "config: 'fail_on_warnings' must be a boolean" );
      }
      cfg.fail_on_warnings = mv.get_value< bool >();
    }
    else if ( warnings_out ) {
      warnings_out->push_back( "config: unknown key '" + key + "' ignored" );
    }
  }
  return cfg;
}
