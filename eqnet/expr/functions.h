#pragma once

#include <eqnet/util/stdint.h>

#include <optional>
#include <string_view>


namespace eqnet
{
namespace expr
{
// Fixed registry of callable functions. Out-of-domain arguments produce the
// IEEE result of the underlying <cmath> function (NaN, inf), never an error.
struct function
{
	char const * name;
	int_ arity;
	double ( *fn )( double const * args );
};

// Index of the function named 'name', nullopt if there is none.
std::optional<int_> find_function( std::string_view name );
function const & get_function( int_ index );
size_ num_functions();

// Named constants, folded into literals at compile time.
std::optional<double> find_constant( std::string_view name );
} // namespace expr
} // namespace eqnet
