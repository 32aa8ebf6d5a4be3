#pragma once

#include <eqnet/config.h>
#include <eqnet/util/numeric.h>
#include <eqnet/util/stdint.h>


namespace eqnet
{
// Simulated time. Owned by snn, advanced by nothing but its stepper.
class sim_clock
{
public:
	explicit sim_clock( double dt, time_control tc = {} );

	double dt() const;
	double time() const;
	// no. of ticks executed so far
	size_ ticks() const;

	time_control const & control() const;
	void set_control( time_control tc );
	void pause();
	void resume();
	void set_speed( double speed );
	bool paused() const;
	double speed() const;

	double effective_dt() const;

	// Advances time by effective_dt(), returns the new time.
	double tick();

private:
	double _dt;
	time_control _control;
	util::kahan_sum<double> _time;
	size_ _ticks = 0;
};
} // namespace eqnet
