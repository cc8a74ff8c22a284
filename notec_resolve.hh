//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include <memory>
#include <regex>

#include "notec_formula.hh"
#include "notec_schema.hh"

namespace notec {

  enum class WarningReason {
    MissingSource, FormulaError, InvalidRef, TypeMismatch, UnresolvedSlot
  };

  inline const char* warning_reason_name( WarningReason r ) {
    switch ( r ) {
      case WarningReason::MissingSource: return "missing_source";
      case WarningReason::FormulaError: return "formula_error";
      case WarningReason::InvalidRef: return "invalid_ref";
      case WarningReason::TypeMismatch: return "type_mismatch";
      case WarningReason::UnresolvedSlot: return "unresolved_slot";
    }
    return "unknown";
  }

  // One value produced by a resolver, addressed by its snapshot path
  struct ResolvedField {
    std::string path;
    ordered_node value;
    SlotKind slot = SlotKind::Static;

    ordered_node to_node() const;
  };

  struct ResolutionWarning {
    std::string component_id;
    std::string slot_id;
    SlotKind slot = SlotKind::Static;
    std::string path;
    WarningReason reason = WarningReason::MissingSource;
    Severity severity = Severity::Warning;
    std::string message;

    ordered_node to_node() const;
  };

  // Everything a resolver may read. partial_snapshot holds the values
  // written so far in traversal order.
  struct ResolutionContext {
    const NoteTemplate& tmpl;
    const ordered_node& source_data;
    const DerivedSchema& target_schema;
    const ordered_node& partial_snapshot;
  };

  // Strategy for one slot kind. resolve returns nullopt when the item
  // cannot be produced from the available data.
  class SlotResolver {
  public:
    virtual ~SlotResolver() = default;
    virtual bool can_resolve( SlotKind slot ) const = 0;
    virtual std::optional< ResolvedField > resolve( const ContentItem& item,
      const ResolutionContext& ctx ) const = 0;
  };

  class LookupResolver : public SlotResolver {
  public:
    bool can_resolve( SlotKind slot ) const override {
      return slot == SlotKind::Lookup;
    }
    std::optional< ResolvedField > resolve( const ContentItem& item,
      const ResolutionContext& ctx ) const override;

  private:
    // "diagnoses[].code" -> "problems[].code" projects every element
    std::optional< ResolvedField > resolve_projection(
      const std::string& lookup, const std::string& target,
      const ordered_node& source_data ) const;
  };

  class StaticResolver : public SlotResolver {
  public:
    bool can_resolve( SlotKind slot ) const override {
      return slot == SlotKind::Static;
    }
    std::optional< ResolvedField > resolve( const ContentItem& item,
      const ResolutionContext& ctx ) const override;
  };

  class ComputedResolver : public SlotResolver {
  public:
    explicit ComputedResolver( std::shared_ptr< const FormulaEvaluator > ev )
      : evaluator_( std::move(ev) ) {}

    bool can_resolve( SlotKind slot ) const override {
      return slot == SlotKind::Computed;
    }
    std::optional< ResolvedField > resolve( const ContentItem& item,
      const ResolutionContext& ctx ) const override;

  private:
    std::shared_ptr< const FormulaEvaluator > evaluator_;
  };

  // Resolves "source:id#locator" references into {text, ref} quotes.
  // Locators: none (whole text/content), t=START-END (seconds), p=N (page).
  class VerbatimResolver : public SlotResolver {
  public:
    bool can_resolve( SlotKind slot ) const override {
      return slot == SlotKind::Verbatim;
    }
    std::optional< ResolvedField > resolve( const ContentItem& item,
      const ResolutionContext& ctx ) const override;

    // Seconds-to-characters ratio used when a transcript has no segments
    static constexpr std::size_t CHARS_PER_SECOND = 15;

  private:
    std::optional< std::string > extract_text( const ordered_node& doc,
      const std::string& locator ) const;
    std::optional< std::string > extract_time_range( const ordered_node& doc,
      const std::string& locator ) const;
    std::optional< std::string > extract_page( const ordered_node& doc,
      const std::string& locator ) const;
  };

  struct ResolutionResult {
    ordered_node snapshot = ordered_node::mapping();
    std::vector< ResolvedField > resolved;
    std::vector< ResolutionWarning > warnings;

    bool has_errors() const;
  };

  // Walks every non-model item of a template and builds the non-model
  // snapshot. Per-field failures never throw; they become warnings.
  class ResolutionEngine {
  public:
    explicit ResolutionEngine(
      std::vector< std::unique_ptr< SlotResolver > > resolvers )
      : resolvers_( std::move(resolvers) ) {}

    ResolutionResult build( const NoteTemplate& tmpl,
      const ordered_node& source_data,
      const DerivedSchema& target_schema ) const;

  private:
    std::vector< std::unique_ptr< SlotResolver > > resolvers_;

    void resolve_item( const Component& comp, const ContentItem& item,
      const ResolutionContext& ctx, ResolutionResult& out ) const;
  };

  // Lookup, static, computed and verbatim resolvers sharing one evaluator
  std::vector< std::unique_ptr< SlotResolver > > default_resolvers(
    std::shared_ptr< const FormulaEvaluator > evaluator
      = std::make_shared< FormulaEvaluator >() );

namespace internal {

  inline WarningReason failure_reason( SlotKind slot ) {
    if ( slot == SlotKind::Computed ) return WarningReason::FormulaError;
    if ( slot == SlotKind::Verbatim ) return WarningReason::InvalidRef;
    return WarningReason::MissingSource;
  }

  // A resolver may answer for the declared path itself or, for wildcard
  // projections, for the prefix in front of the first array marker
  inline bool path_matches( const std::string& declared,
    const std::string& returned )
  {
    if ( declared == returned ) return true;
    const std::size_t wc = declared.find( ARRAY_MARKER );
    if ( wc == std::string::npos ) return false;
    return declared.substr( 0, wc ) == returned;
  }

  inline std::optional< std::string > non_empty_string(
    const ordered_node& m, const std::string& key )
  {
    if ( !m.is_mapping() || !m.contains(key) ) return std::nullopt;
    const ordered_node& v = m.at( key );
    if ( !v.is_string() ) return std::nullopt;
    std::string s = to_native_checked< std::string >( v );
    if ( s.empty() ) return std::nullopt;
    return s;
  }

} // namespace notec::internal

} // namespace notec

inline notec::ordered_node notec::ResolvedField::to_node() const {
  ordered_node n = ordered_node::mapping();
  n[ "path" ] = internal::make_string_node( path );
  n[ "value" ] = value;
  n[ "slotType" ] = internal::make_string_node( slot_kind_name(slot) );
  return n;
}

inline notec::ordered_node notec::ResolutionWarning::to_node() const {
  using internal::make_string_node;
  ordered_node n = ordered_node::mapping();
  n[ "componentId" ] = make_string_node( component_id );
  n[ "slotId" ] = make_string_node( slot_id );
  n[ "slotType" ] = make_string_node( slot_kind_name(slot) );
  n[ "path" ] = make_string_node( path );
  n[ "reason" ] = make_string_node( warning_reason_name(reason) );
  n[ "severity" ] = make_string_node( severity_name(severity) );
  n[ "message" ] = make_string_node( message );
  return n;
}

inline bool notec::ResolutionResult::has_errors() const {
  for ( const ResolutionWarning& w : warnings ) {
    if ( w.severity == Severity::Error ) return true;
  }
  return false;
}

// Resolvers

inline std::optional< notec::ResolvedField > notec::LookupResolver::resolve(
  const ContentItem& item, const ResolutionContext& ctx ) const
{
  if ( !item.lookup || !item.target_path ) return std::nullopt;

  const std::string& lookup = *item.lookup;
  const std::string& target = *item.target_path;
  if ( lookup.find(internal::ARRAY_MARKER) != std::string::npos
    && target.find(internal::ARRAY_MARKER) != std::string::npos )
  {
    return resolve_projection( lookup, target, ctx.source_data );
  }

  std::optional< ordered_node > v = get_by_path( ctx.source_data, lookup );
  if ( !v ) return std::nullopt;
  return ResolvedField{ target, *v, SlotKind::Lookup };
}

inline std::optional< notec::ResolvedField >
  notec::LookupResolver::resolve_projection( const std::string& lookup,
    const std::string& target, const ordered_node& source_data ) const
{
  auto split = []( const std::string& p ) {
    const std::size_t wc = p.find( internal::ARRAY_MARKER );
    std::string tail = p.substr( wc + 2 );
    if ( !tail.empty() && tail[0] == internal::PATH_DELIMITER ) {
      tail.erase( 0, 1 );
    }
    return std::make_pair( p.substr(0, wc), tail );
  };
  const auto [source_root, source_tail] = split( lookup );
  const auto [target_root, target_tail] = split( target );

  std::optional< ordered_node > arr = get_by_path( source_data, source_root );
  if ( !arr || !arr->is_sequence() ) return std::nullopt;

  std::vector< ordered_node > projected;
  projected.reserve( arr->size() );
  for ( std::size_t i = 0; i < arr->size(); ++i ) {
    const ordered_node& entry = arr->at( i );
    std::optional< ordered_node > raw = source_tail.empty()
      ? std::optional< ordered_node >( entry )
      : get_by_path( entry, source_tail );

    if ( target_tail.empty() ) {
      projected.push_back( raw ? *raw : ordered_node() );
      continue;
    }
    ordered_node elem = ordered_node::mapping();
    if ( raw ) {
      try {
        set_by_path( elem, target_tail, *raw );
      }
      catch ( const InvalidPath& ) {
        return std::nullopt;
      }
    }
    projected.push_back( elem );
  }

  return ResolvedField{ target_root, internal::make_node_from( projected ),
    SlotKind::Lookup };
}

inline std::optional< notec::ResolvedField > notec::StaticResolver::resolve(
  const ContentItem& item, const ResolutionContext& ) const
{
  if ( !item.text || item.text->empty() || !item.target_path ) {
    return std::nullopt;
  }
  return ResolvedField{ *item.target_path,
    internal::make_string_node( *item.text ), SlotKind::Static };
}

inline std::optional< notec::ResolvedField > notec::ComputedResolver::resolve(
  const ContentItem& item, const ResolutionContext& ctx ) const
{
  if ( !item.formula || item.formula->empty() || !item.target_path ) {
    return std::nullopt;
  }

  // Earlier results shadow source data of the same name
  const ordered_node scope = internal::deep_merge( ctx.source_data,
    ctx.partial_snapshot );

  try {
    ordered_node value = evaluator_->evaluate( *item.formula, scope );
    if ( item.format ) value = FormulaEvaluator::format( value, *item.format );
    return ResolvedField{ *item.target_path, value, SlotKind::Computed };
  }
  catch ( const FormulaError& ) {
    return std::nullopt;
  }
}

inline std::optional< notec::ResolvedField > notec::VerbatimResolver::resolve(
  const ContentItem& item, const ResolutionContext& ctx ) const
{
  if ( !item.verbatim_ref || !item.target_path ) return std::nullopt;

  static const std::regex ref_re( R"(^([^:]+):([^#]+)(#(.+))?$)" );
  std::smatch m;
  if ( !std::regex_match(*item.verbatim_ref, m, ref_re) ) return std::nullopt;

  const std::string source = m[1].str();
  const std::string id = m[2].str();
  const std::string locator = m[4].matched ? m[4].str() : std::string();

  const ordered_node& data = ctx.source_data;
  if ( !data.is_mapping() || !data.contains(source) ) return std::nullopt;
  const ordered_node& bucket = data.at( source );
  if ( !bucket.is_mapping() || !bucket.contains(id) ) return std::nullopt;

  std::optional< std::string > text = extract_text( bucket.at(id), locator );
  if ( !text || text->empty() ) return std::nullopt;

  ordered_node quote = ordered_node::mapping();
  quote[ "text" ] = internal::make_string_node( *text );
  quote[ "ref" ] = internal::make_string_node( *item.verbatim_ref );
  return ResolvedField{ *item.target_path, quote, SlotKind::Verbatim };
}

inline std::optional< std::string > notec::VerbatimResolver::extract_text(
  const ordered_node& doc, const std::string& locator ) const
{
  if ( locator.empty() ) {
    if ( auto t = internal::non_empty_string(doc, "text") ) return t;
    return internal::non_empty_string( doc, "content" );
  }
  if ( internal::starts_with(locator, "t=") ) {
    return extract_time_range( doc, locator );
  }
  if ( internal::starts_with(locator, "p=") ) {
    return extract_page( doc, locator );
  }
  return std::nullopt;
}

inline std::optional< std::string >
  notec::VerbatimResolver::extract_time_range( const ordered_node& doc,
    const std::string& locator ) const
{
  static const std::regex range_re( R"(^t=(\d+)-(\d+)$)" );
  std::smatch m;
  if ( !std::regex_match(locator, m, range_re) ) return std::nullopt;

  const std::optional< std::size_t > start =
    internal::parse_index( m[1].str() );
  const std::optional< std::size_t > end =
    internal::parse_index( m[2].str() );
  if ( !start || !end ) return std::nullopt;

  if ( doc.is_mapping() && doc.contains("segments")
    && doc.at("segments").is_sequence() )
  {
    const ordered_node& segs = doc.at( "segments" );
    std::string joined;
    bool first = true;
    for ( std::size_t i = 0; i < segs.size(); ++i ) {
      const ordered_node& seg = segs.at( i );
      if ( !seg.is_mapping() || !seg.contains("timestamp")
        || !internal::is_number(seg.at("timestamp")) ) continue;
      const double ts = internal::number_of( seg.at("timestamp") );
      if ( ts < static_cast< double >(*start)
        || ts > static_cast< double >(*end) ) continue;
      if ( !first ) joined += ' ';
      first = false;
      if ( seg.contains("text") ) {
        joined += internal::to_string_any( seg.at("text") );
      }
    }
    return joined;
  }

  // No segment timeline: approximate by character offsets
  std::optional< std::string > text = internal::non_empty_string( doc, "text" );
  if ( !text ) return std::nullopt;
  // Offsets past the text clamp to its end
  const std::size_t limit = text->size() / CHARS_PER_SECOND + 1;
  const std::size_t from = std::min( *start, limit ) * CHARS_PER_SECOND;
  const std::size_t to = std::min( *end, limit ) * CHARS_PER_SECOND;
  if ( from >= text->size() || to <= from ) return std::string();
  return text->substr( from, to - from );
}

inline std::optional< std::string > notec::VerbatimResolver::extract_page(
  const ordered_node& doc, const std::string& locator ) const
{
  static const std::regex page_re( R"(^p=(\d+)$)" );
  std::smatch m;
  if ( !std::regex_match(locator, m, page_re) ) return std::nullopt;

  const std::optional< std::size_t > page =
    internal::parse_index( m[1].str() );
  if ( !page || *page == 0 || !doc.is_mapping() || !doc.contains("pages") ) {
    return std::nullopt;
  }
  const ordered_node& pages = doc.at( "pages" );
  if ( !pages.is_sequence() || *page > pages.size() ) return std::nullopt;
  return internal::non_empty_string( pages.at(*page - 1), "text" );
}

// Engine

inline notec::ResolutionResult notec::ResolutionEngine::build(
  const NoteTemplate& tmpl, const ordered_node& source_data,
  const DerivedSchema& target_schema ) const
{
  ResolutionResult out;
  ResolutionContext ctx{ tmpl, source_data, target_schema, out.snapshot };

  walk_items( tmpl, [&]( const Component& comp, const ContentItem& item,
    const ContentItem* )
  {
    resolve_item( comp, item, ctx, out );
  } );

  return out;
}

inline void notec::ResolutionEngine::resolve_item( const Component& comp,
  const ContentItem& item, const ResolutionContext& ctx,
  ResolutionResult& out ) const
{
  // Model fields are produced downstream
  if ( item.slot == SlotKind::Model ) return;
  // Display-only text
  if ( item.slot == SlotKind::Static && !item.target_path ) return;

  const std::string declared = item.target_path ? *item.target_path
    : std::string( "unknown" );
  const Severity failure_severity = item.is_required()
    ? Severity::Error : Severity::Warning;

  auto warn = [&]( WarningReason reason, Severity severity,
    const std::string& path, const std::string& msg )
  {
    out.warnings.push_back( ResolutionWarning{ comp.id, item.id, item.slot,
      path, reason, severity, msg } );
  };

  const SlotResolver* resolver = nullptr;
  for ( const auto& r : resolvers_ ) {
    if ( r->can_resolve(item.slot) ) { resolver = r.get(); break; }
  }
  if ( !resolver ) {
    warn( WarningReason::MissingSource, failure_severity, declared,
      std::string( "No resolver found for slot type: " )
        + slot_kind_name( item.slot ) );
    return;
  }

  std::optional< ResolvedField > result = resolver->resolve( item, ctx );
  if ( !result ) {
    warn( internal::failure_reason(item.slot), failure_severity, declared,
      std::string( "Failed to resolve " ) + slot_kind_name( item.slot )
        + " slot: " + item.id );
    return;
  }

  if ( !item.target_path || !internal::path_matches(declared, result->path) ) {
    warn( WarningReason::UnresolvedSlot, Severity::Warning, declared,
      "Resolver returned path \"" + result->path + "\" for slot "
        + item.id + " declared at \"" + declared + "\"; value discarded" );
    return;
  }

  try {
    set_by_path( out.snapshot, result->path, result->value );
  }
  catch ( const Error& e ) {
    warn( WarningReason::TypeMismatch, Severity::Error, result->path,
      "Failed to set value at path " + result->path + ": " + e.what() );
    return;
  }
  out.resolved.push_back( std::move(*result) );
}

inline std::vector< std::unique_ptr< notec::SlotResolver > >
  notec::default_resolvers( std::shared_ptr< const FormulaEvaluator > evaluator )
{
  std::vector< std::unique_ptr< SlotResolver > > out;
  out.push_back( std::make_unique< LookupResolver >() );
  out.push_back( std::make_unique< StaticResolver >() );
  out.push_back( std::make_unique< ComputedResolver >( std::move(evaluator) ) );
  out.push_back( std::make_unique< VerbatimResolver >() );
  return out;
}
