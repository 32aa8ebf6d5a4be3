#include <gtest/gtest.h>

#include <eqnet/clock.h>

#include <cmath>
#include <limits>


using namespace eqnet;


TEST( Clock, Ctor )
{
	sim_clock c( 0.1 );
	ASSERT_EQ( c.dt(), 0.1 );
	ASSERT_EQ( c.time(), 0.0 );
	ASSERT_EQ( c.ticks(), 0u );
	ASSERT_FALSE( c.paused() );
	ASSERT_EQ( c.speed(), 1.0 );

	ASSERT_THROW( sim_clock( 0.0 ), std::invalid_argument );
	ASSERT_THROW( sim_clock( -1.0 ), std::invalid_argument );
	ASSERT_THROW( sim_clock( std::nan( "" ) ), std::invalid_argument );
	ASSERT_THROW( sim_clock( 1.0, { false, 0.0 } ), std::invalid_argument );
}

TEST( Clock, Tick )
{
	sim_clock c( 0.001 );
	for( int i = 0; i < 1000; i++ ) c.tick();

	ASSERT_EQ( c.ticks(), 1000u );
	ASSERT_DOUBLE_EQ( c.time(), 1.0 );
}

TEST( Clock, Speed )
{
	sim_clock c( 0.5 );
	c.set_speed( 2.0 );
	ASSERT_EQ( c.effective_dt(), 1.0 );
	ASSERT_EQ( c.tick(), 1.0 );

	c.set_speed( 0.25 );
	ASSERT_EQ( c.tick(), 1.125 );

	ASSERT_THROW( c.set_speed( 0.0 ), std::invalid_argument );
	ASSERT_THROW( c.set_speed( -1.0 ), std::invalid_argument );
	ASSERT_THROW( c.set_speed( std::numeric_limits<double>::infinity() ), std::invalid_argument );
	ASSERT_EQ( c.speed(), 0.25 );
}

TEST( Clock, Pause )
{
	sim_clock c( 1.0 );
	c.pause();
	ASSERT_TRUE( c.paused() );
	c.set_speed( 3.0 );
	ASSERT_TRUE( c.paused() );
	c.resume();
	ASSERT_FALSE( c.paused() );
	ASSERT_EQ( c.speed(), 3.0 );

	c.set_control( { true, 1.0 } );
	ASSERT_TRUE( c.control().paused );
	ASSERT_THROW( c.set_control( { false, -2.0 } ), std::invalid_argument );
	ASSERT_TRUE( c.paused() );
}

TEST( Config, Validate )
{
	ASSERT_NO_THROW( validate( sim_config{} ) );
	ASSERT_THROW( validate( sim_config{ 0.0 } ), std::invalid_argument );

	sim_config cfg;
	cfg.control.speed = 0.0;
	ASSERT_THROW( validate( cfg ), std::invalid_argument );
}
