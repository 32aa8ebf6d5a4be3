#pragma once

#include <eqnet/util/stdint.h>


namespace eqnet
{
// What happens to synaptic input that arrives while the target is refractory.
enum class refractory_input
{
	retain, // added to the input variable as usual
	drop    // discarded
};

// Time-control state. Read by the stepper once at the start of every
// advance() call.
struct time_control
{
	bool paused = false;
	double speed = 1.0; // > 0, scales the step: effective dt = dt * speed
};

struct sim_config
{
	double dt = 1.0; // base tick duration, > 0
	time_control control;
	refractory_input on_refractory = refractory_input::retain;
	// max. no. of pending spike events, 0: unbounded. Events beyond the limit
	// are dropped, counted and logged.
	size_ max_pending = 0;
};

// Throws std::invalid_argument for a non-positive or non-finite dt or speed.
void validate( sim_config const & cfg );
void validate( time_control const & tc );
} // namespace eqnet
