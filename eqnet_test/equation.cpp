#include <gtest/gtest.h>

#include <eqnet/equation.h>
#include <eqnet/error.h>


using namespace eqnet;


TEST( Equation, Assignment )
{
	auto const eq = parse_equation( "v = v_reset" );

	ASSERT_EQ( eq.target, "v" );
	ASSERT_EQ( eq.kind, equation_kind::assignment );
	ASSERT_EQ( to_string( eq.rhs ), "v_reset" );
	ASSERT_TRUE( eq.unit.empty() );
	ASSERT_EQ( eq.source, "v = v_reset" );
}

TEST( Equation, Differential )
{
	auto const eq = parse_equation( "dv/dt = (v_rest - v) / tau : mV" );

	ASSERT_EQ( eq.target, "v" );
	ASSERT_EQ( eq.kind, equation_kind::differential );
	ASSERT_EQ( to_string( eq.rhs ), "(/ (- v_rest v) tau)" );
	ASSERT_EQ( eq.unit, "mV" );
	// positions are relative to the equation text
	ASSERT_EQ( eq.rhs.pos, 21u );

	ASSERT_EQ( parse_equation( "dgate/dt = -gate" ).target, "gate" );
}

TEST( Equation, Bare )
{
	auto const eq = parse_equation( "0" );
	ASSERT_TRUE( eq.target.empty() );
	ASSERT_EQ( eq.kind, equation_kind::assignment );
	ASSERT_EQ( eq.rhs, expr::node::literal( 0.0, 0 ) );

	auto const cond = parse_equation( "v >= 30 : volt" );
	ASSERT_TRUE( cond.target.empty() );
	ASSERT_EQ( to_string( cond.rhs ), "(>= v 30)" );
	ASSERT_EQ( cond.unit, "volt" );
}

TEST( Equation, Errors )
{
	ASSERT_THROW( parse_equation( "v + 1 = 2" ), parse_error );
	ASSERT_THROW( parse_equation( "dv/dx = 2" ), parse_error );
	ASSERT_THROW( parse_equation( "d/dt = 2" ), parse_error );
	ASSERT_THROW( parse_equation( "v = " ), parse_error );
	ASSERT_THROW( parse_equation( "v = 1 :" ), parse_error );
	ASSERT_THROW( parse_equation( "v = 1 2" ), parse_error );
	ASSERT_THROW( parse_equation( "v = 1 $" ), lex_error );

	try
	{
		parse_equation( "v = (1 +" );
		FAIL() << "expected parse_error";
	}
	catch( parse_error const & e )
	{
		ASSERT_EQ( e.position(), 8u );
	}
}

TEST( Equation, Multiple )
{
	auto const eqs = parse_equations( "dv/dt = -v + u\n\n  du/dt = -u  \nw = 1" );

	ASSERT_EQ( eqs.size(), 3u );
	ASSERT_EQ( eqs[0].target, "v" );
	ASSERT_EQ( eqs[1].target, "u" );
	ASSERT_EQ( eqs[1].kind, equation_kind::differential );
	ASSERT_EQ( eqs[2].kind, equation_kind::assignment );

	ASSERT_TRUE( parse_equations( "" ).empty() );
	ASSERT_TRUE( parse_equations( "\n \n" ).empty() );
}
