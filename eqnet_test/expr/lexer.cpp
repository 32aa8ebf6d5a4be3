#include <gtest/gtest.h>

#include <eqnet/error.h>
#include <eqnet/expr/lexer.h>


using namespace eqnet;
using namespace eqnet::expr;


static std::vector<token_kind> kinds( std::string_view source )
{
	std::vector<token_kind> result;
	for( auto const & t : tokenize( source ) ) result.push_back( t.kind );
	return result;
}


TEST( Lexer, Empty )
{
	auto const tokens = tokenize( "   " );
	ASSERT_EQ( tokens.size(), 1u );
	ASSERT_EQ( tokens[0].kind, token_kind::end );
	ASSERT_EQ( tokens[0].pos, 3u );
}

TEST( Lexer, Numbers )
{
	auto const tokens = tokenize( "1 2.5 .5 3e2 4.5E-1 7e" );

	ASSERT_EQ( tokens[0].value, 1.0 );
	ASSERT_EQ( tokens[1].value, 2.5 );
	ASSERT_EQ( tokens[2].value, 0.5 );
	ASSERT_EQ( tokens[3].value, 300.0 );
	ASSERT_EQ( tokens[4].value, 0.45 );
	ASSERT_EQ( tokens[4].text, "4.5E-1" );

	// a dangling exponent is not part of the literal
	ASSERT_EQ( tokens[5].kind, token_kind::number );
	ASSERT_EQ( tokens[5].value, 7.0 );
	ASSERT_EQ( tokens[6].kind, token_kind::identifier );
	ASSERT_EQ( tokens[6].text, "e" );
}

TEST( Lexer, Identifiers )
{
	auto const tokens = tokenize( "v_rest _x a1 I_ext" );

	ASSERT_EQ( tokens.size(), 5u );
	for( int i = 0; i < 4; i++ ) ASSERT_EQ( tokens[i].kind, token_kind::identifier );
	ASSERT_EQ( tokens[0].text, "v_rest" );
	ASSERT_EQ( tokens[1].text, "_x" );
	ASSERT_EQ( tokens[2].text, "a1" );
	ASSERT_EQ( tokens[3].pos, 13u );

	// identifiers cannot start with a digit
	ASSERT_EQ(
	    kinds( "1a" ),
	    ( std::vector<token_kind>{ token_kind::number, token_kind::identifier, token_kind::end } ) );
}

TEST( Lexer, Operators )
{
	ASSERT_EQ(
	    kinds( "+-*/^(),<<=>>===!=:" ),
	    ( std::vector<token_kind>{ token_kind::plus,
	                               token_kind::minus,
	                               token_kind::star,
	                               token_kind::slash,
	                               token_kind::caret,
	                               token_kind::lparen,
	                               token_kind::rparen,
	                               token_kind::comma,
	                               token_kind::less,
	                               token_kind::less_equal,
	                               token_kind::greater,
	                               token_kind::greater_equal,
	                               token_kind::equal_equal,
	                               token_kind::not_equal,
	                               token_kind::colon,
	                               token_kind::end } ) );

	ASSERT_EQ(
	    kinds( "x = 1" ),
	    ( std::vector<token_kind>{
	        token_kind::identifier, token_kind::assign, token_kind::number, token_kind::end } ) );
}

TEST( Lexer, Error )
{
	try
	{
		tokenize( "a + $b" );
		FAIL() << "expected lex_error";
	}
	catch( lex_error const & e )
	{
		ASSERT_EQ( e.kind(), compile_error_kind::lex );
		ASSERT_EQ( e.position(), 4u );
		ASSERT_EQ( e.unexpected(), '$' );
	}

	ASSERT_THROW( tokenize( "a ! b" ), lex_error );
	ASSERT_THROW( tokenize( "a # b" ), compile_error );
}

TEST( Lexer, Describe )
{
	auto const tokens = tokenize( "foo" );
	ASSERT_EQ( describe( tokens[0] ), "'foo'" );
	ASSERT_EQ( describe( tokens[1] ), "end of input" );
	ASSERT_STREQ( to_string( token_kind::less_equal ), "'<='" );
}
