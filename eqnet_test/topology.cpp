#include <gtest/gtest.h>

#include <eqnet/error.h>
#include <eqnet/models/lif.h>
#include <eqnet/topology.h>

#include <cmath>
#include <limits>


using namespace eqnet;


static model_ptr lif() { return compile_model( models::lif::desc() ); }


TEST( Topology, AddNeurons )
{
	topology topo;
	ASSERT_EQ( topo.num_neurons(), 0u );

	auto const m = lif();
	ASSERT_EQ( topo.add_neurons( m, 3 ), 0 );
	ASSERT_EQ( topo.add_neurons( { m, 2, { { "tau", 20.0 } } } ), 3 );

	ASSERT_EQ( topo.num_neurons(), 5u );
	ASSERT_EQ( topo.populations().size(), 2u );
	ASSERT_EQ( topo.membership(), ( std::vector<int_>{ 0, 0, 0, 1, 1 } ) );
	ASSERT_EQ( topo.populations()[1].params[0].second, 20.0 );

	ASSERT_THROW( topo.add_neurons( nullptr, 1 ), std::invalid_argument );
	ASSERT_THROW( topo.add_neurons( m, 0 ), std::invalid_argument );
	ASSERT_THROW( topo.add_neurons( { m, 1, { { "v", 1.0 } } } ), definition_error );
	ASSERT_THROW( topo.add_neurons( { m, 1, { { "nope", 1.0 } } } ), definition_error );
	ASSERT_EQ( topo.num_neurons(), 5u );
}

TEST( Topology, Connect )
{
	topology topo;
	topo.add_neurons( lif(), 3 );

	ASSERT_EQ( topo.connect( 0, 1, 0.5, 1.0 ), 0u );
	// self-loops and duplicates are allowed
	ASSERT_EQ( topo.connect( 1, 1, 0.5, 0.0 ), 1u );
	ASSERT_EQ( topo.connect( 0, 1, 0.5, 1.0, synapse_type::inhibitory ), 2u );

	ASSERT_EQ( topo.num_synapses(), 3u );
	auto const & s = topo.synapses()[2];
	ASSERT_EQ( s.src, 0 );
	ASSERT_EQ( s.dst, 1 );
	ASSERT_EQ( s.type, synapse_type::inhibitory );
	ASSERT_EQ( s.magnitude(), -0.5 );
	ASSERT_EQ( topo.synapses()[0].magnitude(), 0.5 );
}

TEST( Topology, Errors )
{
	topology topo;
	topo.add_neurons( lif(), 3 );

	try
	{
		topo.connect( 0, 3, 1.0, 1.0 );
		FAIL() << "expected unknown_neuron_error";
	}
	catch( unknown_neuron_error const & e )
	{
		ASSERT_EQ( e.id(), 3 );
	}
	ASSERT_THROW( topo.connect( -1, 0, 1.0, 1.0 ), unknown_neuron_error );
	ASSERT_THROW( topo.connect( 0, 1000000000000, 1.0, 1.0 ), topology_error );

	try
	{
		topo.connect( 0, 1, 1.0, -0.5 );
		FAIL() << "expected invalid_delay_error";
	}
	catch( invalid_delay_error const & e )
	{
		ASSERT_EQ( e.delay(), -0.5 );
	}
	ASSERT_THROW( topo.connect( 0, 1, 1.0, std::nan( "" ) ), invalid_delay_error );
	ASSERT_THROW(
	    topo.connect( 0, 1, 1.0, std::numeric_limits<double>::infinity() ), invalid_delay_error );

	ASSERT_EQ( topo.num_synapses(), 0u );
}
