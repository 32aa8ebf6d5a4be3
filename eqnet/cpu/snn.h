#pragma once

#include <eqnet/snn.h>
#include <eqnet/spike_queue.h>
#include <eqnet/topology.h>
#include <eqnet/util/adj_list.h>

#include <vector>


namespace eqnet
{
namespace cpu
{
// Single-threaded reference backend.
class snn : public ::eqnet::snn
{
public:
	// Throws std::invalid_argument for an invalid cfg.
	snn( topology topo, sim_config const & cfg = {} );

	size_ num_neurons() const override;
	size_ num_synapses() const override;
	size_ num_pending() const override;

	neuron_snapshot inspect( long_ id ) const override;
	void set_input( long_ id, double value ) override;

	topology const & topo() const;
	// no. of spike events dropped because the queue was full
	size_ num_dropped() const;
	// no. of deliveries discarded because the target was refractory
	size_ num_rejected() const;

private:
	topology _topo;
	util::adj_list _adj;

	struct
	{
		std::vector<size_> offsets; // into values, one per neuron plus one
		std::vector<double> values;
	} _state;

	// per population, defaults with overrides applied
	std::vector<std::vector<double>> _params;

	std::vector<double> _external;
	std::vector<double> _refractory_until;
	std::vector<double> _last_spike; // NaN: never
	std::vector<char> _refractory;   // per tick

	spike_queue _queue;
	size_ _rejected = 0;

	// scratch
	std::vector<spike_event> _due;
	std::vector<double> _slots;
	std::vector<double> _results;

	void _tick( double time, double dt, std::vector<spike> & out ) override;

	model const & _model( size_ i ) const;
	double * _neuron( size_ i );
	double const * _neuron( size_ i ) const;
	// Fills _slots for neuron i
	void _load( size_ i, double time, double dt );
	void _check( long_ id ) const;
};
} // namespace cpu
} // namespace eqnet
