#include "functions.h"

#include <eqnet/util/assert.h>

#include <algorithm>
#include <cmath>
#include <iterator>


using eqnet::expr::function;

// clang-format off
static function const registry[] = {
	{ "abs",   1, []( double const * x ) { return std::fabs( x[0] ); } },
	{ "exp",   1, []( double const * x ) { return std::exp( x[0] ); } },
	{ "log",   1, []( double const * x ) { return std::log( x[0] ); } },
	{ "sqrt",  1, []( double const * x ) { return std::sqrt( x[0] ); } },
	{ "sin",   1, []( double const * x ) { return std::sin( x[0] ); } },
	{ "cos",   1, []( double const * x ) { return std::cos( x[0] ); } },
	{ "tan",   1, []( double const * x ) { return std::tan( x[0] ); } },
	{ "tanh",  1, []( double const * x ) { return std::tanh( x[0] ); } },
	{ "floor", 1, []( double const * x ) { return std::floor( x[0] ); } },
	{ "ceil",  1, []( double const * x ) { return std::ceil( x[0] ); } },
	{ "min",   2, []( double const * x ) { return std::fmin( x[0], x[1] ); } },
	{ "max",   2, []( double const * x ) { return std::fmax( x[0], x[1] ); } },
	{ "pow",   2, []( double const * x ) { return std::pow( x[0], x[1] ); } },
	{ "clamp", 3, []( double const * x ) { return std::fmin( x[2], std::fmax( x[1], x[0] ) ); } },
};
// clang-format on


namespace eqnet::expr
{
std::optional<int_> find_function( std::string_view name )
{
	auto const it = std::find_if( std::begin( registry ), std::end( registry ), [&]( auto const & f ) {
		return name == f.name;
	} );

	if( it == std::end( registry ) ) return std::nullopt;
	return static_cast<int_>( it - std::begin( registry ) );
}

function const & get_function( int_ index )
{
	eqnet_assert( index >= 0 && static_cast<size_>( index ) < num_functions(), "invalid function index" );
	return registry[index];
}

size_ num_functions() { return std::size( registry ); }

std::optional<double> find_constant( std::string_view name )
{
	if( name == "pi" ) return 3.14159265358979323846;
	return std::nullopt;
}
} // namespace eqnet::expr
