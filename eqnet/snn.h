#pragma once

#include <eqnet/clock.h>
#include <eqnet/config.h>
#include <eqnet/util/stdint.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace eqnet
{
// A spike emitted by 'neuron' during the tick that ended at 'time'.
struct spike
{
	int_ neuron;
	double time;
};

bool operator==( spike const & a, spike const & b );

// Post-tick copy of one neuron's observable state.
struct neuron_snapshot
{
	int_ id;
	std::string model;
	std::vector<std::pair<std::string, double>> state;
	double external; // I_ext
	bool refractory;
	double refractory_until;
	std::optional<double> last_spike;

	// Value of the state variable 'name'. Throws std::out_of_range.
	double operator[]( std::string_view name ) const;
};


// Abstract base class for simulation backends (currently cpu::snn).
// Owns the clock and the time-control policy; backends implement one tick.
//
// The simulation is a callable stepping function, not a scheduler: the host
// decides when to call advance(). Each tick is applied completely before
// advance() returns, so every observer sees post-tick state.
class snn
{
public:
	virtual ~snn() = default;

	// Executes 'ticks' ticks, or none while paused. Time control is read
	// once, at the start of the call.
	// @return spikes in tick order, ascending neuron id within a tick
	std::vector<spike> advance( size_ ticks );
	// Installs 'tc' as the current time control, then advance( ticks ).
	std::vector<spike> advance( size_ ticks, time_control const & tc );
	// Executes exactly one tick, paused or not.
	std::vector<spike> step();

	void pause();
	void resume();
	// Throws std::invalid_argument unless speed > 0.
	void set_speed( double speed );
	bool paused() const;
	double speed() const;
	time_control const & control() const;

	double dt() const;
	double time() const;
	size_ ticks() const;

	virtual size_ num_neurons() const = 0;
	virtual size_ num_synapses() const = 0;
	// no. of spike events scheduled but not yet delivered
	virtual size_ num_pending() const = 0;

	// Throws unknown_neuron_error.
	virtual neuron_snapshot inspect( long_ id ) const = 0;
	// Sets the neuron's I_ext, in effect until changed.
	// Throws unknown_neuron_error.
	virtual void set_input( long_ id, double value ) = 0;

protected:
	explicit snn( sim_config const & cfg );

	sim_config const & config() const;
	// Tolerance used when comparing scheduled times against the clock.
	double time_eps() const;

	// Runs one tick ending at 'time' with step 'dt'. Appends emitted spikes
	// to 'out'. Must not throw.
	virtual void _tick( double time, double dt, std::vector<spike> & out ) = 0;

private:
	sim_config _cfg;
	sim_clock _clock;

	void _step( std::vector<spike> & out );
};
} // namespace eqnet
