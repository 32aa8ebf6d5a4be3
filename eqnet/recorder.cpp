#include "recorder.h"

#include <eqnet/util/assert.h>

#include <algorithm>
#include <stdexcept>


namespace eqnet
{
spike_recorder::spike_recorder( size_ const num_neurons, size_ const capacity /* = 1000 */ )
    : _spikes( num_neurons, util::circular_buffer<double>( capacity ) )
{
	eqnet_assert( capacity > 0 );
}

void spike_recorder::record( std::vector<spike> const & spikes )
{
	for( auto const & s : spikes )
	{
		eqnet_assert( s.neuron >= 0 && static_cast<size_>( s.neuron ) < _spikes.size() );
		_spikes[s.neuron].push_back( s.time );
	}

	_total += spikes.size();
}

std::vector<double> spike_recorder::spikes( int_ const neuron ) const
{
	eqnet_assert( neuron >= 0 && static_cast<size_>( neuron ) < _spikes.size() );
	return _spikes[neuron].to_vector();
}

size_ spike_recorder::count( int_ const neuron ) const
{
	eqnet_assert( neuron >= 0 && static_cast<size_>( neuron ) < _spikes.size() );
	return _spikes[neuron].size();
}

size_ spike_recorder::total() const { return _total; }
size_ spike_recorder::num_neurons() const { return _spikes.size(); }

void spike_recorder::clear()
{
	for( auto & buf : _spikes ) buf.clear();
	_total = 0;
}


trace_recorder::trace_recorder( std::string variable, double const window /* = 0.0 */ )
    : _variable( std::move( variable ) )
    , _window( window )
{
}

void trace_recorder::watch( int_ const neuron ) { _samples.try_emplace( neuron ); }

void trace_recorder::sample_from( snn const & net )
{
	double const now = net.time();

	for( auto & [id, trace] : _samples )
	{
		double const x = net.inspect( id )[_variable];
		if( trace.empty() || trace.back().second != x ) trace.emplace_back( now, x );

		// the latest sample stays: it is the current value
		if( _window > 0.0 )
			trace.erase(
			    trace.begin(),
			    std::find_if( trace.begin(), trace.end() - 1, [&]( sample const & s ) {
				    return now - s.first < _window;
			    } ) );
	}
}

std::vector<trace_recorder::sample> const & trace_recorder::samples( int_ const neuron ) const
{
	auto it = _samples.find( neuron );
	if( it == _samples.end() )
		throw std::out_of_range( "neuron " + std::to_string( neuron ) + " is not watched" );

	return it->second;
}

std::string const & trace_recorder::variable() const { return _variable; }
double trace_recorder::window() const { return _window; }
} // namespace eqnet
