#include <gtest/gtest.h>

#include <eqnet/error.h>
#include <eqnet/generate.h>
#include <eqnet/models/lif.h>


using namespace eqnet;


static topology make( size_ n )
{
	topology topo;
	topo.add_neurons( compile_model( models::lif::desc() ), n );
	return topo;
}


TEST( Generate, Density )
{
	auto topo = make( 100 );

	ASSERT_EQ( generate_random( topo, 0, 100, 0.0, 1.0, 1.0 ), 0u );
	ASSERT_EQ( generate_random( topo, 0, 10, 1.0, 1.0, 1.0 ), 90u );

	auto const n = generate_random( topo, 0, 100, 0.1, 1.0, 1.0 );
	ASSERT_EQ( topo.num_synapses(), 90u + n );
	EXPECT_NEAR( n / 9900.0, 0.1, 0.02 ) << "Test depends on rng, repeat it.";

	for( auto const & s : topo.synapses() ) ASSERT_NE( s.src, s.dst );
}

TEST( Generate, Deterministic )
{
	auto a = make( 50 );
	auto b = make( 50 );
	auto c = make( 50 );

	generate_random( a, 10, 40, 0.2, 0.5, 2.0, 7 );
	generate_random( b, 10, 40, 0.2, 0.5, 2.0, 7 );
	generate_random( c, 10, 40, 0.2, 0.5, 2.0, 8, synapse_type::inhibitory );

	ASSERT_EQ( a.num_synapses(), b.num_synapses() );
	for( size_ i = 0; i < a.num_synapses(); i++ )
	{
		ASSERT_EQ( a.synapses()[i].src, b.synapses()[i].src );
		ASSERT_EQ( a.synapses()[i].dst, b.synapses()[i].dst );
		ASSERT_GE( a.synapses()[i].src, 10 );
	}

	for( auto const & s : c.synapses() ) ASSERT_EQ( s.magnitude(), -0.5 );
}

TEST( Generate, ZeroSeed )
{
	auto topo = make( 40 );

	auto const n = generate_random( topo, 0, 40, 0.05, 1.0, 1.0, 0 );
	ASSERT_GT( n, 0u );
	ASSERT_LT( n, 300u );
}

TEST( Generate, Errors )
{
	auto topo = make( 10 );

	ASSERT_THROW( generate_random( topo, 0, 10, 1.5, 1.0, 1.0 ), std::invalid_argument );
	ASSERT_THROW( generate_random( topo, 0, 10, -0.1, 1.0, 1.0 ), std::invalid_argument );
	ASSERT_THROW( generate_random( topo, 5, 10, 0.5, 1.0, 1.0 ), unknown_neuron_error );
	ASSERT_THROW( generate_random( topo, 0, 10, 1.0, 1.0, -1.0 ), invalid_delay_error );
	ASSERT_EQ( generate_random( topo, 20, 0, 1.0, 1.0, 1.0 ), 0u );
}
