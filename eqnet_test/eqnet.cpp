#include <gtest/gtest.h>

#include <eqnet/eqnet.h>
#include <eqnet/models/izhikevich.h>


using namespace eqnet;


TEST( Eqnet, CompileEquation )
{
	auto const eq = compile_equation( "a + b * 2", { "a", "b" } );
	ASSERT_TRUE( eq.target.empty() );
	ASSERT_EQ( expr::evaluate( eq.rhs, { { "a", 1 }, { "b", 3 } } ), 7.0 );

	auto const de = compile_equation( "dv/dt = -v / tau : mV", { "v", "tau" } );
	ASSERT_EQ( de.target, "v" );
	ASSERT_EQ( de.kind, equation_kind::differential );
	ASSERT_EQ( de.unit, "mV" );

	try
	{
		compile_equation( "x + 1", { "a" } );
		FAIL() << "expected unknown_identifier_error";
	}
	catch( compile_error const & e )
	{
		ASSERT_EQ( e.kind(), compile_error_kind::unknown_identifier );
		ASSERT_EQ( e.position(), 0u );
		ASSERT_NE( std::string( e.what() ).find( "'x'" ), std::string::npos );
	}

	ASSERT_THROW( compile_equation( "w = a", { "a" } ), unknown_identifier_error );
	ASSERT_THROW( compile_equation( "a + (", { "a" } ), parse_error );
}

TEST( Eqnet, BuildNetwork )
{
	auto const m = compile_model( models::izhikevich::desc() );

	auto net = build_network( { { m, 10, {} }, { m, 5, { { "d", 2.0 } } } }, { { 0, 14, 1.0, 2.0 } } );
	ASSERT_EQ( net->num_neurons(), 15u );
	ASSERT_EQ( net->num_synapses(), 1u );

	net->set_input( 0, 10.0 );
	auto const spikes = net->advance( 1000 );
	ASSERT_FALSE( spikes.empty() );
	ASSERT_EQ( net->inspect( 0 ).model, "izhikevich" );

	ASSERT_THROW( build_network( { { m, 10, {} } }, { { 0, 10, 1.0, 1.0 } } ), unknown_neuron_error );
	ASSERT_THROW( build_network( { { m, 10, {} } }, { { 0, 1, 1.0, -1.0 } } ), invalid_delay_error );
	ASSERT_THROW( build_network( { { m, 10, { { "e", 1.0 } } } }, {} ), definition_error );
	ASSERT_THROW( build_network( topology{}, { -1.0 } ), std::invalid_argument );
}
