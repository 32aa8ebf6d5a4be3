#include <gtest/gtest.h>

#include <eqnet/expr/functions.h>

#include <cmath>
#include <set>
#include <string>


using namespace eqnet::expr;


static double call( char const * name, std::initializer_list<double> args )
{
	auto const & f = get_function( *find_function( name ) );
	EXPECT_EQ( static_cast<size_>( f.arity ), args.size() ) << name;
	return f.fn( args.begin() );
}


TEST( Functions, Registry )
{
	ASSERT_GT( num_functions(), 0u );

	std::set<std::string> names;
	for( size_ i = 0; i < num_functions(); i++ )
	{
		auto const & f = get_function( static_cast<int_>( i ) );
		ASSERT_GE( f.arity, 1 );
		ASSERT_EQ( *find_function( f.name ), static_cast<int_>( i ) );
		names.insert( f.name );
	}
	ASSERT_EQ( names.size(), num_functions() );

	for( auto name : { "abs", "exp", "sin", "min", "max" } ) ASSERT_TRUE( find_function( name ) ) << name;
	ASSERT_FALSE( find_function( "foo" ) );
	ASSERT_FALSE( find_function( "" ) );
}

TEST( Functions, Values )
{
	ASSERT_EQ( call( "abs", { -2 } ), 2.0 );
	ASSERT_EQ( call( "exp", { 0 } ), 1.0 );
	ASSERT_EQ( call( "floor", { -1.5 } ), -2.0 );
	ASSERT_EQ( call( "ceil", { -1.5 } ), -1.0 );
	ASSERT_EQ( call( "min", { 1, 2 } ), 1.0 );
	ASSERT_EQ( call( "max", { 1, 2 } ), 2.0 );
	ASSERT_EQ( call( "pow", { 2, 10 } ), 1024.0 );
	ASSERT_EQ( call( "clamp", { -3, -1, 1 } ), -1.0 );
	ASSERT_EQ( call( "clamp", { 0.5, -1, 1 } ), 0.5 );
	ASSERT_DOUBLE_EQ( call( "tanh", { 100 } ), 1.0 );
}

TEST( Functions, OutOfDomain )
{
	ASSERT_TRUE( std::isnan( call( "sqrt", { -1 } ) ) );
	ASSERT_TRUE( std::isnan( call( "log", { -1 } ) ) );
	ASSERT_EQ( call( "exp", { 1000 } ), HUGE_VAL );

	// min/max ignore a single NaN operand
	ASSERT_EQ( call( "max", { NAN, 1 } ), 1.0 );
	ASSERT_EQ( call( "min", { 1, NAN } ), 1.0 );
}

TEST( Functions, Constants )
{
	ASSERT_DOUBLE_EQ( *find_constant( "pi" ), std::acos( -1.0 ) );
	ASSERT_FALSE( find_constant( "e" ) );
}
