#pragma once

#include <eqnet/model.h>
#include <eqnet/util/stdint.h>

#include <string>
#include <utility>
#include <vector>


namespace eqnet
{
enum class synapse_type
{
	excitatory,
	inhibitory
};

struct synapse
{
	int_ src;
	int_ dst;
	double weight;
	double delay; // simulated time, >= 0
	synapse_type type = synapse_type::excitatory;

	// signed effect delivered to dst: +weight or -weight
	double magnitude() const;
};

using synapse_id = size_;

// A contiguous range of neurons sharing one model (and one set of parameter
// values).
struct population
{
	model_ptr model;
	size_ count;
	// overrides of the model's parameter defaults
	std::vector<std::pair<std::string, double>> params;
};

// Network under construction. Neuron ids are assigned consecutively in the
// order populations are added. Handed to snn by value: the running simulation
// never observes later edits.
class topology
{
public:
	// @return id of the first neuron of the new population
	// Throws std::invalid_argument for a null model or an empty population,
	// definition_error for an override naming no parameter of the model.
	int_ add_neurons( population pop );
	int_ add_neurons( model_ptr m, size_ count );

	// Self-loops and duplicate connections are allowed.
	// Throws unknown_neuron_error, invalid_delay_error.
	synapse_id connect(
	    long_ src,
	    long_ dst,
	    double weight,
	    double delay,
	    synapse_type type = synapse_type::excitatory );

	size_ num_neurons() const;
	size_ num_synapses() const;

	std::vector<population> const & populations() const;
	std::vector<synapse> const & synapses() const;
	// population index of every neuron
	std::vector<int_> const & membership() const;

private:
	std::vector<population> _populations;
	std::vector<synapse> _synapses;
	std::vector<int_> _membership;
};
} // namespace eqnet
