#include "snn.h"

#include <eqnet/error.h>
#include <eqnet/util/type_traits.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>


using namespace eqnet::util;


static bool fires( double const condition ) { return condition != 0.0 && !std::isnan( condition ); }


namespace eqnet::cpu
{
snn::snn( topology topo, sim_config const & cfg /* = {} */ )
    : ::eqnet::snn( cfg )
    , _topo( std::move( topo ) )
    , _queue( cfg.max_pending )
{
	size_ const n = _topo.num_neurons();

	{
		std::vector<int_> sources;
		sources.reserve( _topo.num_synapses() );
		for( auto const & syn : _topo.synapses() ) sources.push_back( syn.src );

		_adj = { n, sources };
	}

	size_ max_slots = 0;
	for( auto const & pop : _topo.populations() )
	{
		std::vector<double> params = pop.model->defaults();
		for( auto const & [name, value] : pop.params )
			params[pop.model->param_index( name )] = value;

		_params.push_back( std::move( params ) );
		max_slots = std::max( max_slots, pop.model->num_slots() );
	}

	_state.offsets.reserve( n + 1 );
	_state.offsets.push_back( 0 );
	for( size_ i = 0; i < n; i++ )
	{
		auto const & init = _model( i ).initial_state();
		_state.values.insert( _state.values.end(), init.begin(), init.end() );
		_state.offsets.push_back( _state.values.size() );
	}

	_external.resize( n, 0.0 );
	_refractory_until.resize( n, -std::numeric_limits<double>::infinity() );
	_last_spike.resize( n, std::numeric_limits<double>::quiet_NaN() );
	_refractory.resize( n, 0 );

	_slots.resize( max_slots );

	spdlog::info(
	    "built network: {} neurons in {} population(s), {} synapses, dt={}",
	    n,
	    _topo.populations().size(),
	    _topo.num_synapses(),
	    cfg.dt );
}

size_ snn::num_neurons() const { return _topo.num_neurons(); }
size_ snn::num_synapses() const { return _topo.num_synapses(); }
size_ snn::num_pending() const { return _queue.size(); }

neuron_snapshot snn::inspect( long_ const id ) const
{
	_check( id );
	size_ const i = narrow_cast<size_>( id );
	model const & m = _model( i );

	neuron_snapshot result;
	result.id = narrow_cast<int_>( id );
	result.model = m.name();
	for( size_ j = 0; j < m.num_state(); j++ )
		result.state.emplace_back( m.symbols()[j].name, _neuron( i )[j] );
	result.external = _external[i];
	result.refractory_until = _refractory_until[i];
	result.refractory = time() < _refractory_until[i] - time_eps();
	if( !std::isnan( _last_spike[i] ) ) result.last_spike = _last_spike[i];

	return result;
}

void snn::set_input( long_ const id, double const value )
{
	_check( id );
	_external[narrow_cast<size_>( id )] = value;
}

topology const & snn::topo() const { return _topo; }
size_ snn::num_dropped() const { return _queue.dropped(); }
size_ snn::num_rejected() const { return _rejected; }

void snn::_tick( double const time, double const dt, std::vector<spike> & out )
{
	double const eps = 1e-9 * dt;
	size_ const n = num_neurons();

	for( size_ i = 0; i < n; i++ ) _refractory[i] = time < _refractory_until[i] - eps;

	// Deliver spikes
	{
		_due.clear();
		_queue.pop_due( time + eps, _due );

		for( auto const & e : _due )
		{
			if( _refractory[e.target] && config().on_refractory == refractory_input::drop )
			{
				++_rejected;
				continue;
			}

			_neuron( e.target )[_model( e.target ).input()] += e.magnitude;
		}
	}

	// Update neurons
	for( size_ i = 0; i < n; i++ )
	{
		if( _refractory[i] ) continue;

		auto const & rules = _model( i ).update();
		_load( i, time, dt );

		_results.resize( rules.size() );
		for( size_ j = 0; j < rules.size(); j++ ) _results[j] = rules[j].rhs.eval( _slots.data() );

		double * x = _neuron( i );
		for( size_ j = 0; j < rules.size(); j++ )
		{
			if( rules[j].kind == equation_kind::differential )
				x[rules[j].target] += _results[j] * dt;
			else
				x[rules[j].target] = _results[j];
		}
	}

	// Detect spikes
	size_ const first_spike = out.size();
	size_ dropped = 0;
	for( size_ i = 0; i < n; i++ )
	{
		if( _refractory[i] ) continue;

		model const & m = _model( i );
		_load( i, time, dt );
		if( !fires( m.threshold().eval( _slots.data() ) ) ) continue;

		auto const & rules = m.reset();
		_results.resize( rules.size() );
		for( size_ j = 0; j < rules.size(); j++ ) _results[j] = rules[j].rhs.eval( _slots.data() );

		double * x = _neuron( i );
		for( size_ j = 0; j < rules.size(); j++ ) x[rules[j].target] = _results[j];

		_refractory_until[i] = time + m.refractory();
		_last_spike[i] = time;
		out.push_back( { narrow_cast<int_>( i ), time } );

		for( int_ syn : _adj.neighbors( i ) )
		{
			auto const & s = _topo.synapses()[syn];
			if( !_queue.push( { s.dst, time + s.delay, s.magnitude() } ) ) ++dropped;
		}
	}

	if( dropped > 0 )
		spdlog::warn(
		    "spike queue at capacity ({}), dropped {} event(s) at t={}", _queue.capacity(), dropped, time );

	spdlog::trace(
	    "t={}: delivered {}, fired {}, pending {}", time, _due.size(), out.size() - first_spike, _queue.size() );
}

model const & snn::_model( size_ const i ) const
{
	return *_topo.populations()[_topo.membership()[i]].model;
}

double * snn::_neuron( size_ const i ) { return _state.values.data() + _state.offsets[i]; }
double const * snn::_neuron( size_ const i ) const { return _state.values.data() + _state.offsets[i]; }

void snn::_load( size_ const i, double const time, double const dt )
{
	model const & m = _model( i );
	auto const & params = _params[_topo.membership()[i]];

	std::copy_n( _neuron( i ), m.num_state(), _slots.begin() );
	std::copy( params.begin(), params.end(), _slots.begin() + m.num_state() );
	_slots[m.time_slot()] = time;
	_slots[m.dt_slot()] = dt;
	_slots[m.external_slot()] = _external[i];
}

void snn::_check( long_ const id ) const
{
	if( id < 0 || id >= narrow_cast<long_>( num_neurons() ) ) throw unknown_neuron_error( id );
}
} // namespace eqnet::cpu
