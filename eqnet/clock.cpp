#include "clock.h"

#include <cmath>
#include <stdexcept>
#include <string>


namespace eqnet
{
void validate( time_control const & tc )
{
	if( !std::isfinite( tc.speed ) || tc.speed <= 0.0 )
		throw std::invalid_argument( "speed multiplier must be > 0, got " + std::to_string( tc.speed ) );
}

void validate( sim_config const & cfg )
{
	if( !std::isfinite( cfg.dt ) || cfg.dt <= 0.0 )
		throw std::invalid_argument( "dt must be > 0, got " + std::to_string( cfg.dt ) );

	validate( cfg.control );
}


sim_clock::sim_clock( double dt, time_control tc /* = {} */ )
    : _dt( dt )
    , _control( tc )
{
	validate( sim_config{ dt, tc } );
}

double sim_clock::dt() const { return _dt; }
double sim_clock::time() const { return _time; }
size_ sim_clock::ticks() const { return _ticks; }

time_control const & sim_clock::control() const { return _control; }

void sim_clock::set_control( time_control tc )
{
	validate( tc );
	_control = tc;
}

void sim_clock::pause() { _control.paused = true; }
void sim_clock::resume() { _control.paused = false; }

void sim_clock::set_speed( double speed ) { set_control( { _control.paused, speed } ); }

bool sim_clock::paused() const { return _control.paused; }
double sim_clock::speed() const { return _control.speed; }

double sim_clock::effective_dt() const { return _dt * _control.speed; }

double sim_clock::tick()
{
	++_ticks;
	return _time.add( effective_dt() );
}
} // namespace eqnet
