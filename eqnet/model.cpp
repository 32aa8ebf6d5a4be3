#include "model.h"

#include <eqnet/error.h>
#include <eqnet/expr/parser.h>
#include <eqnet/util/type_traits.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>


using namespace eqnet;


static bool is_builtin( std::string const & name )
{
	auto const & b = builtin_identifiers();
	return std::find( b.begin(), b.end(), name ) != b.end();
}

static std::vector<model::rule> compile_rules(
    std::vector<std::string> const & lines,
    expr::symbol_table const & symbols,
    size_ num_state,
    bool allow_differential,
    char const * what )
{
	std::vector<model::rule> result;
	std::vector<bool> assigned( num_state, false );

	for( auto const & line : lines )
	{
		auto eq = parse_equation( line );

		int_ target = 0;
		if( !eq.target.empty() )
		{
			auto const * s = symbols.find( eq.target );
			if( !s ) throw unknown_identifier_error( eq.target, 0 );
			if( s->kind != expr::symbol_kind::variable || static_cast<size_>( s->slot ) >= num_state )
				throw definition_error(
				    std::string( what ) + " rule '" + line + "' assigns to '" + eq.target +
				    "' which is not a state variable" );

			target = s->slot;
		}

		if( eq.kind == equation_kind::differential && !allow_differential )
			throw definition_error( std::string( what ) + " rule '" + line + "' must be an assignment" );

		if( assigned[target] )
			throw definition_error(
			    std::string( what ) + " rules assign to '" + symbols[target].name + "' more than once" );
		assigned[target] = true;

		result.push_back(
		    { target, eq.kind, eq.unit, expr::compile( std::move( eq.rhs ), eq.source, symbols ) } );
	}

	return result;
}


namespace eqnet
{
std::vector<std::string> const & builtin_identifiers()
{
	static std::vector<std::string> const names{ "t", "dt", "I_ext" };
	return names;
}


model::model( model_desc const & desc )
    : _name( desc.name )
    , _refractory( desc.refractory )
{
	if( desc.state.empty() )
		throw definition_error( "model '" + desc.name + "' declares no state variables" );
	if( !std::isfinite( desc.refractory ) || desc.refractory < 0.0 )
		throw definition_error( "model '" + desc.name + "' has a negative refractory period" );

	for( auto const & [name, init] : desc.state )
	{
		if( is_builtin( name ) ) throw definition_error( "identifier '" + name + "' is reserved" );
		_symbols.add( name, expr::symbol_kind::variable );
		_initial.push_back( init );
	}
	for( auto const & [name, value] : desc.params )
	{
		if( is_builtin( name ) ) throw definition_error( "identifier '" + name + "' is reserved" );
		_symbols.add( name, expr::symbol_kind::parameter );
		_defaults.push_back( value );
	}
	for( auto const & name : builtin_identifiers() ) _symbols.add( name, expr::symbol_kind::variable );

	if( desc.input.empty() )
		_input = 0;
	else
	{
		auto const * s = _symbols.find( desc.input );
		if( !s || s->kind != expr::symbol_kind::variable || static_cast<size_>( s->slot ) >= num_state() )
			throw definition_error( "input '" + desc.input + "' is not a state variable" );
		_input = s->slot;
	}

	_update = compile_rules( desc.update, _symbols, num_state(), true, "update" );

	if( desc.threshold.empty() )
		throw definition_error( "model '" + desc.name + "' has no spike condition" );
	_threshold = expr::compile( desc.threshold, _symbols );

	_reset = compile_rules( desc.reset, _symbols, num_state(), false, "reset" );

	spdlog::debug(
	    "compiled model '{}': {} state variable(s), {} parameter(s), {} update and {} reset "
	    "rule(s)",
	    _name,
	    num_state(),
	    num_params(),
	    _update.size(),
	    _reset.size() );
}

std::string const & model::name() const { return _name; }
expr::symbol_table const & model::symbols() const { return _symbols; }

size_ model::num_state() const { return _initial.size(); }
size_ model::num_params() const { return _defaults.size(); }
size_ model::num_slots() const { return _symbols.size(); }

int_ model::time_slot() const { return util::narrow<int_>( num_state() + num_params() ); }
int_ model::dt_slot() const { return time_slot() + 1; }
int_ model::external_slot() const { return time_slot() + 2; }
int_ model::input() const { return _input; }

std::vector<double> const & model::initial_state() const { return _initial; }
std::vector<double> const & model::defaults() const { return _defaults; }

int_ model::param_index( std::string_view name ) const
{
	auto const * s = _symbols.find( name );
	if( !s || s->kind != expr::symbol_kind::parameter ) return -1;
	return s->slot - util::narrow<int_>( num_state() );
}

std::vector<model::rule> const & model::update() const { return _update; }
expr::expression const & model::threshold() const { return _threshold; }
std::vector<model::rule> const & model::reset() const { return _reset; }
double model::refractory() const { return _refractory; }


model_ptr compile_model( model_desc const & desc ) { return std::make_shared<model const>( desc ); }
} // namespace eqnet
