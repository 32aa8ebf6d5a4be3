#include <gtest/gtest.h>

#include "model.h"

#include <eqnet/cpu/snn.h>
#include <eqnet/error.h>

#include <cmath>
#include <memory>


using namespace eqnet;


// v integrates its input, fires at v >= 1
static model_desc integrator( double refractory = 0.0 )
{
	model_desc m;
	m.name = "integrator";
	m.state = { { "v", 0.0 } };
	m.update = { "v" };
	m.threshold = "v >= 1";
	m.reset = { "0" };
	m.refractory = refractory;
	return m;
}

// fires every tick while I_ext > 0
static model_desc pacemaker()
{
	model_desc m;
	m.name = "pacemaker";
	m.state = { { "v", 0.0 } };
	m.update = { "v = I_ext" };
	m.threshold = "v > 0";
	m.reset = { "v = 0" };
	return m;
}

// records everything it receives in 'acc', never fires
static model_desc accumulator()
{
	model_desc m;
	m.name = "accumulator";
	m.state = { { "acc", 0.0 } };
	m.update = { "acc" };
	m.threshold = "0";
	m.reset = { "acc" };
	return m;
}

static std::vector<std::vector<double>> states( snn const & net )
{
	std::vector<std::vector<double>> result;
	for( size_ i = 0; i < net.num_neurons(); i++ )
	{
		std::vector<double> x;
		for( auto const & [name, value] : net.inspect( i ).state ) x.push_back( value );
		result.push_back( x );
	}
	return result;
}


TEST_ALL_MODELS( AllModels );

TYPED_TEST( AllModels, Ctor )
{
	topology topo;
	topo.add_neurons( compile_model( TypeParam::desc() ), 100 );
	topo.connect( 0, 1, 1.0, 1.0 );

	cpu::snn x( topo, { 0.1 } );

	ASSERT_EQ( x.num_neurons(), 100u );
	ASSERT_EQ( x.num_synapses(), 1u );
	ASSERT_EQ( x.num_pending(), 0u );
	ASSERT_EQ( x.dt(), 0.1 );
	ASSERT_EQ( x.time(), 0.0 );
	ASSERT_EQ( x.ticks(), 0u );
	ASSERT_FALSE( x.paused() );
	ASSERT_EQ( x.speed(), 1.0 );

	auto const snap = x.inspect( 99 );
	ASSERT_EQ( snap.id, 99 );
	ASSERT_EQ( snap.model, TypeParam::desc().name );
	ASSERT_EQ( snap.state.size(), TypeParam::desc().state.size() );
	ASSERT_EQ( snap["v"], TypeParam::desc().state[0].second );
	ASSERT_FALSE( snap.refractory );
	ASSERT_FALSE( snap.last_spike );

	ASSERT_THROW( x.inspect( 100 ), unknown_neuron_error );
	ASSERT_THROW( x.inspect( -1 ), unknown_neuron_error );
	ASSERT_THROW( x.set_input( 100, 1.0 ), unknown_neuron_error );
	ASSERT_THROW( snap["nope"], std::out_of_range );

	ASSERT_THROW( cpu::snn( topo, sim_config{ 0.0 } ), std::invalid_argument );
}

TYPED_TEST( AllModels, PauseResume )
{
	auto const build = [] {
		topology topo;
		topo.add_neurons( compile_model( TypeParam::desc() ), 20 );
		for( int_ i = 0; i < 20; i++ ) topo.connect( i, ( i + 1 ) % 20, 5.0, 2.0 );
		auto net = std::make_unique<cpu::snn>( topo, sim_config{ 0.5 } );
		for( int_ i = 0; i < 20; i += 3 ) net->set_input( i, 15.0 );
		return net;
	};

	auto a = build();
	auto b = build();

	auto const sa = a->advance( 400 );

	auto sb = b->advance( 150 );
	b->pause();
	ASSERT_TRUE( b->advance( 1000 ).empty() );
	ASSERT_EQ( b->ticks(), 150u );
	ASSERT_EQ( b->time(), 75.0 );
	b->resume();
	auto const rest = b->advance( 250 );
	sb.insert( sb.end(), rest.begin(), rest.end() );

	ASSERT_FALSE( sa.empty() );
	ASSERT_EQ( sa, sb );
	ASSERT_EQ( a->time(), b->time() );
	ASSERT_EQ( states( *a ), states( *b ) );
	ASSERT_EQ( a->num_pending(), b->num_pending() );
}

TYPED_TEST( AllModels, HostTimeControl )
{
	topology topo;
	topo.add_neurons( compile_model( TypeParam::desc() ), 10 );
	for( int_ i = 0; i < 10; i++ ) topo.connect( i, ( i + 3 ) % 10, 5.0, 1.0 );

	cpu::snn net( topo, sim_config{ 0.5 } );
	for( int_ i = 0; i < 10; i += 2 ) net.set_input( i, 15.0 );

	net.advance( 40, { false, 1.0 } );
	auto const before = states( net );
	auto const pending = net.num_pending();

	ASSERT_TRUE( net.advance( 500, { true, 1.0 } ).empty() );
	ASSERT_TRUE( net.paused() );
	ASSERT_EQ( net.ticks(), 40u );
	ASSERT_EQ( net.time(), 20.0 );
	ASSERT_EQ( states( net ), before );
	ASSERT_EQ( net.num_pending(), pending );

	net.advance( 1, { false, 2.0 } );
	ASSERT_FALSE( net.paused() );
	ASSERT_EQ( net.ticks(), 41u );
	ASSERT_EQ( net.time(), 21.0 );
}

TYPED_TEST( AllModels, Independence )
{
	// without synapses every neuron evolves on its own
	topology topo;
	auto const m = compile_model( TypeParam::desc() );
	topo.add_neurons( m, 10 );

	cpu::snn net( topo, { 0.5 } );
	for( int_ i = 0; i < 10; i++ ) net.set_input( i, i * 2.0 );

	std::vector<std::unique_ptr<cpu::snn>> singles;
	for( int_ i = 0; i < 10; i++ )
	{
		topology t;
		t.add_neurons( m, 1 );
		singles.push_back( std::make_unique<cpu::snn>( t, sim_config{ 0.5 } ) );
		singles.back()->set_input( 0, i * 2.0 );
	}

	for( int iter = 0; iter < 10; iter++ )
	{
		auto const spikes = net.advance( 50 );
		ASSERT_EQ( net.num_pending(), 0u );

		for( int_ i = 0; i < 10; i++ )
		{
			auto const own = singles[i]->advance( 50 );

			std::vector<double> expected, actual;
			for( auto const & s : own ) expected.push_back( s.time );
			for( auto const & s : spikes )
				if( s.neuron == i ) actual.push_back( s.time );

			ASSERT_EQ( actual, expected );
			ASSERT_EQ( net.inspect( i ).state, singles[i]->inspect( 0 ).state );
		}
	}
}


TEST( SNN, Identity )
{
	model_desc m;
	m.name = "identity";
	m.state = { { "v", 0.0 } };
	m.update = { "v" };
	m.threshold = "v > 1";
	m.reset = { "0" };

	topology topo;
	topo.add_neurons( compile_model( m ), 1 );
	cpu::snn net( topo );

	ASSERT_TRUE( net.advance( 1000 ).empty() );
	ASSERT_EQ( net.inspect( 0 )["v"], 0.0 );
	ASSERT_EQ( net.ticks(), 1000u );
	ASSERT_EQ( net.time(), 1000.0 );
}

TEST( SNN, Delay )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	topo.add_neurons( compile_model( accumulator() ), 1 );
	topo.connect( 0, 1, 2.0, 3.0 );

	cpu::snn net( topo );

	// tick 1: no input yet
	ASSERT_TRUE( net.step().empty() );

	net.set_input( 0, 1.0 );
	auto const fired = net.step();
	ASSERT_EQ( fired, ( std::vector<spike>{ { 0, 2.0 } } ) );
	net.set_input( 0, 0.0 );

	// source spiked at tick 2: nothing arrives at ticks 3 and 4
	net.step();
	ASSERT_EQ( net.inspect( 1 )["acc"], 0.0 );
	ASSERT_EQ( net.num_pending(), 1u );
	net.step();
	ASSERT_EQ( net.inspect( 1 )["acc"], 0.0 );

	// exactly at tick 5
	net.step();
	ASSERT_EQ( net.inspect( 1 )["acc"], 2.0 );
	ASSERT_EQ( net.num_pending(), 0u );

	// and never again
	net.advance( 10 );
	ASSERT_EQ( net.inspect( 1 )["acc"], 2.0 );
}

TEST( SNN, ZeroDelay )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	topo.add_neurons( compile_model( accumulator() ), 1 );
	topo.connect( 0, 1, 1.0, 0.0 );

	cpu::snn net( topo );
	net.set_input( 0, 1.0 );

	net.step();
	// same-tick effects are never visible
	ASSERT_EQ( net.inspect( 1 )["acc"], 0.0 );
	net.step();
	ASSERT_EQ( net.inspect( 1 )["acc"], 1.0 );
}

TEST( SNN, Inhibitory )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	topo.add_neurons( compile_model( accumulator() ), 1 );
	topo.connect( 0, 1, 1.5, 1.0, synapse_type::inhibitory );
	// duplicates sum up
	topo.connect( 0, 1, 0.5, 1.0 );
	topo.connect( 0, 1, 0.5, 1.0 );

	cpu::snn net( topo );
	net.set_input( 0, 1.0 );
	net.advance( 2 );

	ASSERT_EQ( net.inspect( 1 )["acc"], -0.5 );
}

TEST( SNN, SpikeOrder )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 5 );
	cpu::snn net( topo );

	net.set_input( 4, 1.0 );
	net.set_input( 1, 1.0 );
	net.set_input( 3, 1.0 );

	auto const spikes = net.advance( 2 );
	ASSERT_EQ(
	    spikes, ( std::vector<spike>{ { 1, 1.0 }, { 3, 1.0 }, { 4, 1.0 }, { 1, 2.0 }, { 3, 2.0 }, { 4, 2.0 } } ) );
}

TEST( SNN, SimultaneousUpdate )
{
	model_desc m;
	m.name = "swap";
	m.state = { { "x", 1.0 }, { "y", 2.0 } };
	m.update = { "x = y", "y = x" };
	m.threshold = "x > 100";
	m.reset = { "x = 0" };

	topology topo;
	topo.add_neurons( compile_model( m ), 1 );
	cpu::snn net( topo );

	net.step();
	ASSERT_EQ( net.inspect( 0 )["x"], 2.0 );
	ASSERT_EQ( net.inspect( 0 )["y"], 1.0 );
}

TEST( SNN, Euler )
{
	model_desc m;
	m.name = "decay";
	m.state = { { "v", 1.0 } };
	m.params = { { "tau", 10.0 } };
	m.update = { "dv/dt = -v / tau" };
	m.threshold = "0";
	m.reset = { "v" };

	topology topo;
	topo.add_neurons( compile_model( m ), 2 );
	topo.add_neurons( { compile_model( m ), 1, { { "tau", 5.0 } } } );
	cpu::snn net( topo, { 0.5 } );

	net.step();
	ASSERT_DOUBLE_EQ( net.inspect( 0 )["v"], 1.0 - 0.5 * 0.1 );
	ASSERT_DOUBLE_EQ( net.inspect( 2 )["v"], 1.0 - 0.5 * 0.2 );

	// the speed multiplier only scales dt
	net.set_speed( 2.0 );
	net.step();
	ASSERT_DOUBLE_EQ( net.inspect( 0 )["v"], 0.95 * ( 1.0 - 1.0 * 0.1 ) );
	ASSERT_DOUBLE_EQ( net.time(), 1.5 );
}

TEST( SNN, Builtins )
{
	model_desc m;
	m.name = "clock";
	m.state = { { "time", -1.0 }, { "step", -1.0 } };
	m.update = { "time = t", "step = dt" };
	m.threshold = "0";
	m.reset = { "time" };

	topology topo;
	topo.add_neurons( compile_model( m ), 1 );
	cpu::snn net( topo, { 0.25 } );

	net.advance( 4 );
	ASSERT_EQ( net.inspect( 0 )["time"], 1.0 );
	ASSERT_EQ( net.inspect( 0 )["step"], 0.25 );

	net.advance( 2, { false, 4.0 } );
	ASSERT_EQ( net.inspect( 0 )["time"], 3.0 );
	ASSERT_EQ( net.inspect( 0 )["step"], 1.0 );
	ASSERT_EQ( net.speed(), 4.0 );
}

TEST( SNN, Speed )
{
	// delays are in simulated time: at speed 2 a tick covers twice as much of it
	auto build = [] {
		topology topo;
		topo.add_neurons( compile_model( pacemaker() ), 1 );
		topo.add_neurons( compile_model( accumulator() ), 1 );
		topo.connect( 0, 1, 1.0, 4.0 );
		return topo;
	};

	cpu::snn slow( build() );
	cpu::snn fast( build(), { 1.0, { false, 2.0 } } );
	slow.set_input( 0, 1.0 );
	fast.set_input( 0, 1.0 );

	ASSERT_EQ( fast.speed(), 2.0 );
	auto const fs = fast.advance( 5 );
	auto const ss = slow.advance( 10 );
	ASSERT_EQ( fast.time(), slow.time() );
	ASSERT_EQ( fast.ticks(), 5u );

	ASSERT_EQ( fs.size(), 5u );
	ASSERT_EQ( fs[1].time, 4.0 );
	ASSERT_EQ( ss.size(), 10u );

	// fast: spikes at 2, 4, 6 arrive at 6, 8, 10
	ASSERT_EQ( fast.inspect( 1 )["acc"], 3.0 );
	// slow: spikes at 1..6 arrive at 5..10
	ASSERT_EQ( slow.inspect( 1 )["acc"], 6.0 );
}

TEST( SNN, NaN )
{
	model_desc m;
	m.name = "nan";
	m.state = { { "v", 0.0 } };
	m.update = { "v = 0 / 0" };
	m.threshold = "v";
	m.reset = { "0" };

	topology topo;
	topo.add_neurons( compile_model( m ), 1 );
	cpu::snn net( topo );

	// NaN never satisfies a spike condition
	ASSERT_TRUE( net.advance( 100 ).empty() );
	ASSERT_TRUE( std::isnan( net.inspect( 0 )["v"] ) );

	// +inf does
	m.update = { "v = 1 / 0" };
	topology topo2;
	topo2.add_neurons( compile_model( m ), 1 );
	cpu::snn inf( topo2 );
	ASSERT_EQ( inf.advance( 3 ).size(), 3u );
}

TEST( SNN, Refractory )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	auto const m = integrator( 3.0 );
	topo.add_neurons( compile_model( m ), 1 );
	topo.connect( 0, 1, 1.0, 0.0 );

	cpu::snn net( topo );
	net.set_input( 0, 1.0 );

	// tick 1: 0 fires, tick 2: 1 receives and fires, refractory until t=5
	auto spikes = net.advance( 2 );
	ASSERT_EQ( spikes.back(), ( spike{ 1, 2.0 } ) );

	auto const snap = net.inspect( 1 );
	ASSERT_TRUE( snap.refractory );
	ASSERT_EQ( snap.refractory_until, 5.0 );
	ASSERT_EQ( *snap.last_spike, 2.0 );

	// ticks 3, 4: refractory, input is retained
	spikes = net.advance( 2 );
	for( auto const & s : spikes ) ASSERT_EQ( s.neuron, 0 );
	ASSERT_EQ( net.inspect( 1 )["v"], 2.0 );

	// tick 5: evaluates again
	spikes = net.advance( 1 );
	ASSERT_EQ( spikes.back(), ( spike{ 1, 5.0 } ) );
	ASSERT_EQ( net.inspect( 1 ).refractory_until, 8.0 );
	ASSERT_EQ( net.inspect( 1 )["v"], 0.0 );
}

TEST( SNN, RefractoryDrop )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	topo.add_neurons( compile_model( integrator( 3.0 ) ), 1 );
	topo.connect( 0, 1, 1.0, 0.0 );

	sim_config cfg;
	cfg.on_refractory = refractory_input::drop;
	cpu::snn net( topo, cfg );
	net.set_input( 0, 1.0 );

	net.advance( 4 );
	ASSERT_EQ( net.inspect( 1 )["v"], 0.0 );
	ASSERT_EQ( net.num_rejected(), 2u );

	// tick 5: not refractory anymore
	auto const spikes = net.advance( 1 );
	ASSERT_EQ( spikes.back(), ( spike{ 1, 5.0 } ) );
}

TEST( SNN, Step )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	cpu::snn net( topo );
	net.set_input( 0, 1.0 );

	net.pause();
	ASSERT_TRUE( net.advance( 10 ).empty() );
	ASSERT_EQ( net.time(), 0.0 );

	// single-step while paused
	ASSERT_EQ( net.step(), ( std::vector<spike>{ { 0, 1.0 } } ) );
	ASSERT_TRUE( net.paused() );
	ASSERT_EQ( net.ticks(), 1u );

	ASSERT_TRUE( net.advance( 0 ).empty() );
	net.resume();
	ASSERT_TRUE( net.advance( 0 ).empty() );
	ASSERT_EQ( net.advance( 2 ).size(), 2u );
	ASSERT_EQ( net.time(), 3.0 );
}

TEST( SNN, SetSpeed )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	cpu::snn net( topo );

	ASSERT_THROW( net.set_speed( 0.0 ), std::invalid_argument );
	ASSERT_THROW( net.set_speed( -1.0 ), std::invalid_argument );
	ASSERT_THROW( net.advance( 1, { false, std::nan( "" ) } ), std::invalid_argument );
	ASSERT_EQ( net.speed(), 1.0 );
	ASSERT_EQ( net.ticks(), 0u );
}

TEST( SNN, QueueCapacity )
{
	topology topo;
	topo.add_neurons( compile_model( pacemaker() ), 1 );
	topo.add_neurons( compile_model( accumulator() ), 1 );
	for( int i = 0; i < 5; i++ ) topo.connect( 0, 1, 1.0, 10.0 );

	sim_config cfg;
	cfg.max_pending = 8;
	cpu::snn net( topo, cfg );
	net.set_input( 0, 1.0 );

	net.advance( 2 );
	ASSERT_EQ( net.num_pending(), 8u );
	ASSERT_EQ( net.num_dropped(), 2u );
}

TEST( SNN, Override )
{
	topology topo;
	auto const m = compile_model( models::lif::desc() );
	topo.add_neurons( m, 1 );
	topo.add_neurons( { m, 1, { { "v_thres", -60.0 } } } );

	cpu::snn net( topo, { 0.5 } );
	net.set_input( 0, 1.0 );
	net.set_input( 1, 1.0 );

	// -65 + R * I = -55 lies between the two thresholds
	auto const spikes = net.advance( 1000 );
	ASSERT_FALSE( spikes.empty() );
	for( auto const & s : spikes ) ASSERT_EQ( s.neuron, 1 );
}
