#pragma once

#include <eqnet/snn.h>
#include <eqnet/util/circular_buffer.h>
#include <eqnet/util/stdint.h>

#include <map>
#include <string>
#include <utility>
#include <vector>


namespace eqnet
{
// Keeps the most recent spike times of every neuron.
class spike_recorder
{
public:
	explicit spike_recorder( size_ num_neurons, size_ capacity = 1000 );

	// Feed with the output of snn::advance()/step().
	void record( std::vector<spike> const & spikes );

	// Spike times of 'neuron', oldest first.
	std::vector<double> spikes( int_ neuron ) const;
	size_ count( int_ neuron ) const;
	size_ total() const;
	size_ num_neurons() const;
	void clear();

private:
	std::vector<util::circular_buffer<double>> _spikes;
	size_ _total = 0;
};


// Samples one state variable of selected neurons over time.
class trace_recorder
{
public:
	using sample = std::pair<double, double>; // (time, value)

	// window <= 0: keep everything
	explicit trace_recorder( std::string variable, double window = 0.0 );

	void watch( int_ neuron );
	// Appends the current value of every watched neuron unless it equals the
	// previously recorded one, then discards samples older than the window.
	// Throws unknown_neuron_error, std::out_of_range.
	void sample_from( snn const & net );

	std::vector<sample> const & samples( int_ neuron ) const;
	std::string const & variable() const;
	double window() const;

private:
	std::string _variable;
	double _window;
	std::map<int_, std::vector<sample>> _samples;
};
} // namespace eqnet
