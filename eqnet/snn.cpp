#include "snn.h"

#include <spdlog/spdlog.h>

#include <stdexcept>


namespace eqnet
{
bool operator==( spike const & a, spike const & b ) { return a.neuron == b.neuron && a.time == b.time; }

double neuron_snapshot::operator[]( std::string_view name ) const
{
	for( auto const & [k, v] : state )
		if( k == name ) return v;

	throw std::out_of_range( "neuron " + std::to_string( id ) + " has no state variable '" + std::string( name ) + "'" );
}


snn::snn( sim_config const & cfg )
    : _cfg( cfg )
    , _clock( cfg.dt, cfg.control )
{
}

std::vector<spike> snn::advance( size_ ticks )
{
	std::vector<spike> result;
	if( _clock.paused() ) return result;

	for( size_ i = 0; i < ticks; i++ ) _step( result );
	return result;
}

std::vector<spike> snn::advance( size_ ticks, time_control const & tc )
{
	_clock.set_control( tc );
	return advance( ticks );
}

std::vector<spike> snn::step()
{
	std::vector<spike> result;
	_step( result );
	return result;
}

void snn::pause()
{
	if( !paused() ) spdlog::debug( "paused at t={}", time() );
	_clock.pause();
}

void snn::resume()
{
	if( paused() ) spdlog::debug( "resumed at t={}", time() );
	_clock.resume();
}

void snn::set_speed( double speed )
{
	_clock.set_speed( speed );
	spdlog::debug( "speed set to {} (effective dt {})", speed, _clock.effective_dt() );
}

bool snn::paused() const { return _clock.paused(); }
double snn::speed() const { return _clock.speed(); }
time_control const & snn::control() const { return _clock.control(); }

double snn::dt() const { return _clock.dt(); }
double snn::time() const { return _clock.time(); }
size_ snn::ticks() const { return _clock.ticks(); }

sim_config const & snn::config() const { return _cfg; }

double snn::time_eps() const { return 1e-9 * _clock.effective_dt(); }

void snn::_step( std::vector<spike> & out )
{
	double const dt = _clock.effective_dt();
	_tick( _clock.tick(), dt, out );
}
} // namespace eqnet
