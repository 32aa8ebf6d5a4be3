#pragma once

#include <eqnet/topology.h>
#include <eqnet/util/stdint.h>


namespace eqnet
{
// Adds a synapse src->dst with probability p for every ordered pair of
// distinct neurons in [first, first + count). The same seed always yields
// the same synapses.
// @return no. of synapses added
// Throws std::invalid_argument unless 0 <= p <= 1,
// unknown_neuron_error, invalid_delay_error.
size_ generate_random(
    topology & topo,
    int_ first,
    size_ count,
    double p,
    double weight,
    double delay,
    ulong_ seed = 1337,
    synapse_type type = synapse_type::excitatory );
} // namespace eqnet
