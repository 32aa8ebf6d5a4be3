#include "topology.h"

#include <eqnet/error.h>
#include <eqnet/util/type_traits.h>

#include <cmath>
#include <limits>
#include <stdexcept>


namespace eqnet
{
double synapse::magnitude() const { return type == synapse_type::inhibitory ? -weight : weight; }


int_ topology::add_neurons( population pop )
{
	if( !pop.model ) throw std::invalid_argument( "population without a model" );
	if( pop.count == 0 ) throw std::invalid_argument( "empty population" );
	if( pop.count > static_cast<size_>( std::numeric_limits<int_>::max() ) - num_neurons() )
		throw std::invalid_argument( "too many neurons" );

	for( auto const & p : pop.params )
		if( pop.model->param_index( p.first ) < 0 )
			throw definition_error(
			    "model '" + pop.model->name() + "' has no parameter '" + p.first + "'" );

	int_ const first = util::narrow<int_>( num_neurons() );
	int_ const index = util::narrow<int_>( _populations.size() );

	_membership.insert( _membership.end(), pop.count, index );
	_populations.push_back( std::move( pop ) );

	return first;
}

int_ topology::add_neurons( model_ptr m, size_ count )
{
	return add_neurons( population{ std::move( m ), count, {} } );
}

synapse_id topology::connect(
    long_ src, long_ dst, double weight, double delay, synapse_type type /* = excitatory */ )
{
	if( src < 0 || static_cast<size_>( src ) >= num_neurons() ) throw unknown_neuron_error( src );
	if( dst < 0 || static_cast<size_>( dst ) >= num_neurons() ) throw unknown_neuron_error( dst );
	// also rejects NaN
	if( !( delay >= 0.0 ) || std::isinf( delay ) ) throw invalid_delay_error( delay );

	_synapses.push_back(
	    { static_cast<int_>( src ), static_cast<int_>( dst ), weight, delay, type } );
	return _synapses.size() - 1;
}

size_ topology::num_neurons() const { return _membership.size(); }
size_ topology::num_synapses() const { return _synapses.size(); }

std::vector<population> const & topology::populations() const { return _populations; }
std::vector<synapse> const & topology::synapses() const { return _synapses; }
std::vector<int_> const & topology::membership() const { return _membership; }
} // namespace eqnet
