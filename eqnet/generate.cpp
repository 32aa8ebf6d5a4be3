#include "generate.h"

#include <eqnet/error.h>
#include <eqnet/util/random.h>

#include <stdexcept>
#include <string>


namespace eqnet
{
size_ generate_random(
    topology & topo,
    int_ const first,
    size_ const count,
    double const p,
    double const weight,
    double const delay,
    ulong_ const seed /* = 1337 */,
    synapse_type const type /* = synapse_type::excitatory */ )
{
	if( !( p >= 0.0 && p <= 1.0 ) )
		throw std::invalid_argument( "connection probability must lie in [0, 1], got " + std::to_string( p ) );

	long_ const last = static_cast<long_>( first ) + static_cast<long_>( count );
	if( count > 0 && ( first < 0 || last > static_cast<long_>( topo.num_neurons() ) ) )
		throw unknown_neuron_error( first < 0 ? first : last - 1 );

	util::xoroshiro256ss gen( seed );

	size_ result = 0;
	for( long_ src = first; src < last; src++ )
		for( long_ dst = first; dst < last; dst++ )
		{
			if( src == dst ) continue;

			if( util::uniform_left_inc( gen ) < p )
			{
				topo.connect( src, dst, weight, delay, type );
				++result;
			}
		}

	return result;
}
} // namespace eqnet
