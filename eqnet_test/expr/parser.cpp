#include <gtest/gtest.h>

#include <eqnet/error.h>
#include <eqnet/expr/parser.h>


using namespace eqnet;
using namespace eqnet::expr;


static std::string sexpr( std::string_view source ) { return to_string( parse( source ) ); }


TEST( Parser, Precedence )
{
	ASSERT_EQ( sexpr( "a + b * 2" ), "(+ a (* b 2))" );
	ASSERT_EQ( sexpr( "(a + b) * 2" ), "(* (+ a b) 2)" );
	ASSERT_EQ( sexpr( "a - b - c" ), "(- (- a b) c)" );
	ASSERT_EQ( sexpr( "a / b * c" ), "(* (/ a b) c)" );
	ASSERT_EQ( sexpr( "a + b > c * d" ), "(> (+ a b) (* c d))" );
}

TEST( Parser, Power )
{
	// right associative, binds tighter than unary minus on its left
	ASSERT_EQ( sexpr( "a ^ b ^ c" ), "(^ a (^ b c))" );
	ASSERT_EQ( sexpr( "-a ^ 2" ), "(- (^ a 2))" );
	ASSERT_EQ( sexpr( "a ^ -b" ), "(^ a (- b))" );
	ASSERT_EQ( sexpr( "2 * v ^ 2" ), "(* 2 (^ v 2))" );
}

TEST( Parser, Unary )
{
	ASSERT_EQ( sexpr( "--a" ), "(- (- a))" );
	ASSERT_EQ( sexpr( "+a" ), "a" );
	ASSERT_EQ( sexpr( "a * -b" ), "(* a (- b))" );
}

TEST( Parser, Calls )
{
	ASSERT_EQ( sexpr( "exp(-v / tau)" ), "(exp (/ (- v) tau))" );
	ASSERT_EQ( sexpr( "max(a, b + 1)" ), "(max a (+ b 1))" );
	ASSERT_EQ( sexpr( "f()" ), "(f)" );

	auto const n = parse( "min(a, b)" );
	ASSERT_EQ( n.kind, node_kind::call );
	ASSERT_EQ( n.name, "min" );
	ASSERT_EQ( n.args.size(), 2u );
	// not resolved yet
	ASSERT_EQ( n.slot, -1 );
}

TEST( Parser, Positions )
{
	auto const n = parse( "a + b * 2" );
	ASSERT_EQ( n.pos, 2u );
	ASSERT_EQ( n.args[0].pos, 0u );
	ASSERT_EQ( n.args[1].pos, 6u );
	ASSERT_EQ( n.args[1].args[0].pos, 4u );
}

TEST( Parser, Errors )
{
	auto expect_error = []( std::string_view source, size_ pos, std::string const & found ) {
		try
		{
			parse( source );
			FAIL() << "expected parse_error for '" << source << "'";
		}
		catch( parse_error const & e )
		{
			ASSERT_EQ( e.kind(), compile_error_kind::parse );
			ASSERT_EQ( e.position(), pos ) << source;
			ASSERT_EQ( e.found(), found ) << source;
		}
	};

	// missing operand
	expect_error( "a +", 3, "end of input" );
	// unbalanced parentheses
	expect_error( "(a + b", 6, "end of input" );
	expect_error( "a + b)", 5, "')'" );
	// trailing tokens
	expect_error( "a b", 2, "'b'" );
	// empty
	expect_error( "", 0, "end of input" );
	expect_error( "max(a,)", 6, "')'" );

	ASSERT_THROW( parse( "a @ b" ), lex_error );
}

TEST( Parser, Equality )
{
	ASSERT_EQ( parse( "a+b*2" ), parse( "a + b * 2" ) );
	ASSERT_EQ( parse( "(a)" ), parse( "a" ) );
	ASSERT_NE( parse( "a + b" ), parse( "b + a" ) );
	ASSERT_NE( parse( "a + 1" ), parse( "a + 1.5" ) );
}
