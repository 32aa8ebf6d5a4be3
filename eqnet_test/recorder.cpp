#include <gtest/gtest.h>

#include <eqnet/cpu/snn.h>
#include <eqnet/error.h>
#include <eqnet/models/lif.h>
#include <eqnet/recorder.h>


using namespace eqnet;


TEST( SpikeRecorder, Record )
{
	spike_recorder rec( 3, 2 );
	ASSERT_EQ( rec.num_neurons(), 3u );

	rec.record( { { 0, 1.0 }, { 2, 1.0 } } );
	rec.record( { { 0, 2.0 } } );
	rec.record( { { 0, 3.0 } } );

	ASSERT_EQ( rec.total(), 4u );
	// bounded per neuron, oldest dropped first
	ASSERT_EQ( rec.spikes( 0 ), ( std::vector<double>{ 2.0, 3.0 } ) );
	ASSERT_EQ( rec.count( 1 ), 0u );
	ASSERT_EQ( rec.spikes( 2 ), std::vector<double>{ 1.0 } );

	rec.clear();
	ASSERT_EQ( rec.total(), 0u );
	ASSERT_TRUE( rec.spikes( 0 ).empty() );
}

TEST( SpikeRecorder, Network )
{
	topology topo;
	topo.add_neurons( compile_model( models::lif::desc() ), 4 );
	cpu::snn net( topo, { 0.5 } );
	net.set_input( 2, 5.0 );

	spike_recorder rec( net.num_neurons() );
	for( int i = 0; i < 10; i++ ) rec.record( net.advance( 100 ) );

	ASSERT_GT( rec.count( 2 ), 0u );
	ASSERT_EQ( rec.total(), rec.count( 2 ) );
	ASSERT_EQ( rec.spikes( 2 ).back(), *net.inspect( 2 ).last_spike );
}

TEST( TraceRecorder, Sample )
{
	model_desc m;
	m.name = "ramp";
	m.state = { { "v", 0.0 }, { "c", 7.0 } };
	m.update = { "v = v + 1" };
	m.threshold = "0";
	m.reset = { "v" };

	topology topo;
	topo.add_neurons( compile_model( m ), 2 );
	cpu::snn net( topo );

	trace_recorder v( "v" );
	trace_recorder c( "c", 3.0 );
	v.watch( 1 );
	c.watch( 0 );

	for( int i = 0; i < 5; i++ )
	{
		net.step();
		v.sample_from( net );
		c.sample_from( net );
	}

	ASSERT_EQ( v.variable(), "v" );
	ASSERT_EQ( v.samples( 1 ).size(), 5u );
	ASSERT_EQ( v.samples( 1 ).back(), ( trace_recorder::sample{ 5.0, 5.0 } ) );
	ASSERT_THROW( v.samples( 0 ), std::out_of_range );

	// unchanged values are not recorded again
	ASSERT_EQ( c.samples( 0 ).size(), 1u );
	ASSERT_EQ( c.samples( 0 )[0].second, 7.0 );
}

TEST( TraceRecorder, Window )
{
	model_desc m;
	m.name = "ramp";
	m.state = { { "v", 0.0 } };
	m.update = { "v = t" };
	m.threshold = "0";
	m.reset = { "v" };

	topology topo;
	topo.add_neurons( compile_model( m ), 1 );
	cpu::snn net( topo );

	trace_recorder rec( "v", 3.0 );
	ASSERT_EQ( rec.window(), 3.0 );
	rec.watch( 0 );
	for( int i = 0; i < 10; i++ )
	{
		net.step();
		rec.sample_from( net );
	}

	// t in (7, 10]
	auto const & s = rec.samples( 0 );
	ASSERT_EQ( s.size(), 3u );
	ASSERT_EQ( s.front().first, 8.0 );
	ASSERT_EQ( s.back().second, 10.0 );

	trace_recorder bad( "w" );
	bad.watch( 0 );
	ASSERT_THROW( bad.sample_from( net ), std::out_of_range );

	trace_recorder missing( "v" );
	missing.watch( 5 );
	ASSERT_THROW( missing.sample_from( net ), unknown_neuron_error );
}
