#include <gtest/gtest.h>

#include <eqnet/error.h>
#include <eqnet/expr/expression.h>

#include <cmath>
#include <limits>
#include <string>


using namespace eqnet;
using namespace eqnet::expr;


static std::vector<std::string> const AB{ "a", "b" };


TEST( Expression, Evaluate )
{
	auto const e = compile( "a + b * 2", AB );
	ASSERT_EQ( evaluate( e, { { "a", 1 }, { "b", 3 } } ), 7.0 );

	// re-evaluable any number of times
	ASSERT_EQ( evaluate( e, { { "a", 1 }, { "b", 3 } } ), 7.0 );
	ASSERT_EQ( evaluate( e, { { "a", -1 }, { "b", 0.5 } } ), 0.0 );
}

TEST( Expression, Comparison )
{
	auto const e = compile( "v > threshold", std::vector<std::string>{ "v", "threshold" } );

	ASSERT_EQ( evaluate( e, { { "v", 5 }, { "threshold", 5 } } ), 0.0 );
	ASSERT_EQ( evaluate( e, { { "v", 5.0001 }, { "threshold", 5 } } ), 1.0 );

	std::vector<std::string> const x{ "x" };
	ASSERT_EQ( evaluate( compile( "x >= 1", x ), { { "x", 1 } } ), 1.0 );
	ASSERT_EQ( evaluate( compile( "x <= 1", x ), { { "x", 1 } } ), 1.0 );
	ASSERT_EQ( evaluate( compile( "x < 1", x ), { { "x", 1 } } ), 0.0 );
	ASSERT_EQ( evaluate( compile( "x == 1", x ), { { "x", 1 } } ), 1.0 );
	ASSERT_EQ( evaluate( compile( "x != 1", x ), { { "x", 1 } } ), 0.0 );
}

TEST( Expression, Arithmetic )
{
	std::vector<std::string> const x{ "x" };
	context const ctx{ { "x", 2 } };

	ASSERT_EQ( evaluate( compile( "2 ^ 3 ^ 2", x ), ctx ), 512.0 );
	ASSERT_EQ( evaluate( compile( "-x ^ 2", x ), ctx ), -4.0 );
	ASSERT_EQ( evaluate( compile( "x - 3 - 1", x ), ctx ), -2.0 );
	ASSERT_EQ( evaluate( compile( "12 / x / 3", x ), ctx ), 2.0 );
	ASSERT_EQ( evaluate( compile( "max(x, 3) + min(x, 3)", x ), ctx ), 5.0 );
	ASSERT_EQ( evaluate( compile( "clamp(x * 10, 0, 5)", x ), ctx ), 5.0 );
	ASSERT_DOUBLE_EQ( evaluate( compile( "exp(0) + sin(pi / 2)", x ), ctx ), 2.0 );
}

TEST( Expression, IEEE )
{
	std::vector<std::string> const x{ "x" };
	context const zero{ { "x", 0 } };

	ASSERT_EQ( evaluate( compile( "1 / x", x ), zero ), std::numeric_limits<double>::infinity() );
	ASSERT_EQ( evaluate( compile( "-1 / x", x ), zero ), -std::numeric_limits<double>::infinity() );
	ASSERT_TRUE( std::isnan( evaluate( compile( "x / x", x ), zero ) ) );
	ASSERT_TRUE( std::isnan( evaluate( compile( "sqrt(x - 1)", x ), zero ) ) );
	ASSERT_EQ( evaluate( compile( "log(x)", x ), zero ), -std::numeric_limits<double>::infinity() );

	// comparisons with NaN are false, != is true
	ASSERT_EQ( evaluate( compile( "x / x > 0", x ), zero ), 0.0 );
	ASSERT_EQ( evaluate( compile( "x / x < 0", x ), zero ), 0.0 );
	ASSERT_EQ( evaluate( compile( "x / x != 0", x ), zero ), 1.0 );
}

TEST( Expression, UnknownIdentifier )
{
	try
	{
		compile( "x + 1", std::vector<std::string>{ "a" } );
		FAIL() << "expected unknown_identifier_error";
	}
	catch( unknown_identifier_error const & e )
	{
		ASSERT_EQ( e.kind(), compile_error_kind::unknown_identifier );
		ASSERT_EQ( e.name(), "x" );
		ASSERT_EQ( e.position(), 0u );
	}

	ASSERT_THROW( compile( "a + foo(a)", std::vector<std::string>{ "a" } ), unknown_identifier_error );
}

TEST( Expression, Arity )
{
	try
	{
		compile( "a + max(a)", std::vector<std::string>{ "a" } );
		FAIL() << "expected arity_error";
	}
	catch( arity_error const & e )
	{
		ASSERT_EQ( e.kind(), compile_error_kind::arity );
		ASSERT_EQ( e.name(), "max" );
		ASSERT_EQ( e.expected(), 2 );
		ASSERT_EQ( e.got(), 1 );
		ASSERT_EQ( e.position(), 4u );
	}

	ASSERT_THROW( compile( "exp(1, 2)", std::vector<std::string>{} ), arity_error );
}

TEST( Expression, StructuralEquality )
{
	for( auto src : { "a + b * 2", "-(a ^ b) / max(a, b)", "exp(-a) >= b", "clamp(a, b, 2) != a" } )
	{
		auto const x = compile( src, AB );
		auto const y = compile( src, AB );

		ASSERT_EQ( x, y ) << src;
		ASSERT_EQ( x.ast(), y.ast() ) << src;
		ASSERT_EQ( x.code(), y.code() ) << src;
	}

	ASSERT_NE( compile( "a + b", AB ), compile( "b + a", AB ) );
	// same text, different bindings
	ASSERT_NE( compile( "a", AB ), compile( "a", std::vector<std::string>{ "b", "a" } ) );
}

TEST( Expression, Bindings )
{
	symbol_table symbols;
	symbols.add( "v" );
	symbols.add( "tau", symbol_kind::parameter );
	symbols.add( "unused" );

	auto const e = compile( "-v / tau + v + pi", symbols );

	ASSERT_EQ( e.reads(), ( std::vector<int_>{ 0, 1 } ) );
	ASSERT_EQ( e.ast().args[1].kind, node_kind::literal );
	ASSERT_EQ( e.ast().args[0].args[0].args[1].kind, node_kind::parameter );
	ASSERT_EQ( e.ast().args[0].args[0].args[1].slot, 1 );
	ASSERT_EQ( e.source(), "-v / tau + v + pi" );

	double const slots[] = { 2.0, 4.0, 1000.0 };
	ASSERT_DOUBLE_EQ( e.eval( slots ), -0.5 + 2.0 + 3.14159265358979323846 );
}

TEST( Expression, MissingBinding )
{
	auto const e = compile( "a + b", AB );
	ASSERT_THROW( evaluate( e, { { "a", 1 } } ), eval_error );

	// bindings the expression does not read are not required
	auto const f = compile( "a * 2", AB );
	ASSERT_EQ( evaluate( f, { { "a", 1 } } ), 2.0 );
}

TEST( Expression, DeepNesting )
{
	std::string src = "a";
	for( int i = 0; i < 100; i++ ) src = "(" + src + " + (a";
	for( int i = 0; i < 100; i++ ) src += "))";

	// right-nested sums need a deep stack
	auto const e = compile( src, AB );
	ASSERT_GT( e.stack_depth(), 32u );
	ASSERT_EQ( evaluate( e, { { "a", 1 } } ), 101.0 );
}

TEST( Expression, NestingLimit )
{
	auto const nested = []( int depth ) {
		return std::string( depth, '(' ) + "a" + std::string( depth, ')' );
	};

	ASSERT_EQ( evaluate( compile( nested( 200 ), AB ), { { "a", 2 } } ), 2.0 );

	for( int depth : { 300, 10000 } )
	{
		try
		{
			compile( nested( depth ), AB );
			FAIL() << "expected parse_error";
		}
		catch( parse_error const & e )
		{
			ASSERT_EQ( e.expected(), "shallower nesting" );
			ASSERT_EQ( e.kind(), compile_error_kind::parse );
		}
	}

	ASSERT_THROW( compile( std::string( 10000, '-' ) + "a", AB ), parse_error );
}

TEST( Expression, OperatorLimit )
{
	std::string src = "a";
	for( int i = 0; i < 5000; i++ ) src += " + a";

	try
	{
		compile( src, AB );
		FAIL() << "expected parse_error";
	}
	catch( parse_error const & e )
	{
		ASSERT_EQ( e.expected(), "shorter expression" );
	}
}

TEST( Expression, KnownFunctionNames )
{
	auto const e = compile( "exp(a) + pi * 0", std::vector<std::string>{ "a", "exp", "pi" } );
	ASSERT_EQ( e.symbols().size(), 1u );
	ASSERT_DOUBLE_EQ( evaluate( e, { { "a", 0 } } ), 1.0 );
}

TEST( SymbolTable, Add )
{
	symbol_table s;
	ASSERT_EQ( s.add( "v" ), 0 );
	ASSERT_EQ( s.add( "g", symbol_kind::parameter ), 1 );
	ASSERT_EQ( s.size(), 2u );
	ASSERT_EQ( s[1].kind, symbol_kind::parameter );
	ASSERT_EQ( s.find( "g" )->slot, 1 );
	ASSERT_EQ( s.find( "x" ), nullptr );

	ASSERT_THROW( s.add( "v" ), definition_error );
	ASSERT_THROW( s.add( "1v" ), definition_error );
	ASSERT_THROW( s.add( "" ), definition_error );
	ASSERT_THROW( s.add( "exp" ), definition_error );
	ASSERT_THROW( s.add( "pi" ), definition_error );
}

TEST( Context, SetGet )
{
	context ctx{ { "a", 1 } };
	ctx.set( "b", 2 ).set( "a", 3 );

	ASSERT_EQ( ctx.size(), 2u );
	ASSERT_EQ( *ctx.get( "a" ), 3.0 );
	ASSERT_TRUE( ctx.contains( "b" ) );
	ASSERT_FALSE( ctx.get( "c" ).has_value() );
}
