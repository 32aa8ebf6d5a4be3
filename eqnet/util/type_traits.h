#pragma once

#include <limits>
#include <type_traits>
#include <typeinfo>


namespace eqnet
{
namespace util
{
template <typename To, typename From>
constexpr To narrow_cast( From x )
{
	return static_cast<To>( x );
}

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-compare"
/**
 * Converts between integral types. Throws std::bad_cast if the destination
 * type cannot represent the source value. Neuron ids are int_ while container
 * sizes are size_, this is the one place where the two meet.
 */
template <typename To, typename From>
constexpr To narrow( From x )
{
	static_assert(
	    std::is_integral<From>::value && std::is_integral<To>::value,
	    "narrow() is intended for integral types only" );
	static_assert( !std::is_same<From, To>::value, "pointless conversion between identical types" );

	if constexpr( std::is_signed<From>::value && std::is_unsigned<To>::value )
		if( x < 0 ) throw std::bad_cast();

	if constexpr( std::is_signed<From>::value && std::is_signed<To>::value )
		if( x < std::numeric_limits<To>::min() ) throw std::bad_cast();

	if constexpr( std::numeric_limits<To>::digits < std::numeric_limits<From>::digits )
		if( x > 0 && static_cast<std::make_unsigned_t<From>>( x ) >
		                 static_cast<std::make_unsigned_t<To>>( std::numeric_limits<To>::max() ) )
			throw std::bad_cast();

	return static_cast<To>( x );
}
#pragma GCC diagnostic pop
} // namespace util
} // namespace eqnet
