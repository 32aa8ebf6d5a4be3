#include <gtest/gtest.h>

#include "model.h"

#include <eqnet/cpu/snn.h>
#include <eqnet/error.h>

#include <cmath>


using namespace eqnet;


TEST_ALL_MODELS( Preset );

TYPED_TEST( Preset, Compile )
{
	auto const desc = TypeParam::desc();
	auto const m = compile_model( desc );

	ASSERT_EQ( m->name(), desc.name );
	ASSERT_EQ( m->num_state(), desc.state.size() );
	ASSERT_EQ( m->num_params(), desc.params.size() );
	ASSERT_EQ( m->num_slots(), desc.state.size() + desc.params.size() + 3 );
	ASSERT_EQ( m->update().size(), desc.update.size() );
	ASSERT_EQ( m->reset().size(), desc.reset.size() );
	ASSERT_EQ( m->input(), 0 );

	for( size_ i = 0; i < desc.state.size(); i++ ) ASSERT_EQ( m->initial_state()[i], desc.state[i].second );
	for( size_ i = 0; i < desc.params.size(); i++ )
	{
		ASSERT_EQ( m->param_index( desc.params[i].first ), static_cast<int_>( i ) );
		ASSERT_EQ( m->defaults()[i], desc.params[i].second );
	}

	ASSERT_EQ( m->symbols()[m->time_slot()].name, "t" );
	ASSERT_EQ( m->symbols()[m->dt_slot()].name, "dt" );
	ASSERT_EQ( m->symbols()[m->external_slot()].name, "I_ext" );

	// compiling twice yields structurally equal models
	auto const n = compile_model( desc );
	ASSERT_EQ( m->threshold(), n->threshold() );
	for( size_ i = 0; i < m->update().size(); i++ ) ASSERT_EQ( m->update()[i].rhs, n->update()[i].rhs );
}

TYPED_TEST( Preset, Quiescent )
{
	topology topo;
	topo.add_neurons( compile_model( TypeParam::desc() ), 10 );
	cpu::snn net( topo, { 0.5 } );

	ASSERT_TRUE( net.advance( 1000 ).empty() );
	for( int_ i = 0; i < 10; i++ ) ASSERT_FALSE( net.inspect( i ).last_spike );
}

TYPED_TEST( Preset, Driven )
{
	topology topo;
	topo.add_neurons( compile_model( TypeParam::desc() ), 2 );
	cpu::snn net( topo, { 0.5 } );

	net.set_input( 0, 20.0 );
	auto const spikes = net.advance( 1000 );

	ASSERT_FALSE( spikes.empty() );
	for( auto const & s : spikes ) ASSERT_EQ( s.neuron, 0 );

	auto const snap = net.inspect( 0 );
	ASSERT_TRUE( snap.last_spike );
	ASSERT_EQ( snap.external, 20.0 );
	ASSERT_FALSE( std::isnan( snap["v"] ) );
	ASSERT_FALSE( net.inspect( 1 ).last_spike );
}


static model_desc minimal()
{
	model_desc m;
	m.name = "minimal";
	m.state = { { "v", 0.0 } };
	m.params = { { "g", 1.0 } };
	m.update = { "v + g" };
	m.threshold = "v > 10";
	m.reset = { "0" };
	return m;
}

TEST( Model, Minimal )
{
	model m( minimal() );
	ASSERT_EQ( m.update()[0].target, 0 );
	ASSERT_EQ( m.update()[0].kind, equation_kind::assignment );
	ASSERT_EQ( m.reset()[0].target, 0 );
	ASSERT_EQ( m.refractory(), 0.0 );
	ASSERT_EQ( m.param_index( "g" ), 0 );
	ASSERT_EQ( m.param_index( "v" ), -1 );
	ASSERT_EQ( m.param_index( "h" ), -1 );
}

TEST( Model, Input )
{
	auto desc = minimal();
	desc.state.push_back( { "i_syn", 0.0 } );
	desc.input = "i_syn";
	ASSERT_EQ( model( desc ).input(), 1 );

	desc.input = "g";
	ASSERT_THROW( model{ desc }, definition_error );
	desc.input = "nope";
	ASSERT_THROW( model{ desc }, definition_error );
}

TEST( Model, Invalid )
{
	auto expect_kind = []( model_desc const & desc, compile_error_kind kind ) {
		try
		{
			model m( desc );
			FAIL() << "expected compile_error";
		}
		catch( compile_error const & e )
		{
			ASSERT_EQ( e.kind(), kind ) << e.what();
		}
	};

	{
		auto d = minimal();
		d.state.clear();
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.refractory = -1.0;
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.params.push_back( { "v", 2.0 } );
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.state.push_back( { "t", 0.0 } );
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.update = { "g = 2" };
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.update = { "w = 2" };
		expect_kind( d, compile_error_kind::unknown_identifier );
	}
	{
		auto d = minimal();
		d.update = { "v = 1", "dv/dt = 2" };
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.reset = { "dv/dt = 1" };
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.threshold = "";
		expect_kind( d, compile_error_kind::definition );
	}
	{
		auto d = minimal();
		d.threshold = "v > x";
		expect_kind( d, compile_error_kind::unknown_identifier );
	}
	{
		auto d = minimal();
		d.update = { "v + exp(1, 2)" };
		expect_kind( d, compile_error_kind::arity );
	}
	{
		auto d = minimal();
		d.update = { "v +" };
		expect_kind( d, compile_error_kind::parse );
	}
	{
		auto d = minimal();
		d.reset = { "v = #" };
		expect_kind( d, compile_error_kind::lex );
	}
}
