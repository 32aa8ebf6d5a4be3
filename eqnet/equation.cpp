#include "equation.h"

#include <eqnet/error.h>
#include <eqnet/expr/lexer.h>
#include <eqnet/expr/parser.h>

#include <algorithm>
#include <cctype>


using namespace eqnet::expr;


static std::string_view trim( std::string_view s )
{
	auto const blank = []( char c ) { return std::isspace( static_cast<unsigned char>( c ) ) != 0; };
	while( !s.empty() && blank( s.front() ) ) s.remove_prefix( 1 );
	while( !s.empty() && blank( s.back() ) ) s.remove_suffix( 1 );
	return s;
}

static size_ find_token( std::vector<token> const & tokens, token_kind kind )
{
	auto const it = std::find_if(
	    tokens.begin(), tokens.end(), [&]( token const & t ) { return t.kind == kind; } );
	return static_cast<size_>( it - tokens.begin() );
}


namespace eqnet
{
equation parse_equation( std::string_view text )
{
	auto const tokens = tokenize( text );
	size_ const end = tokens.size() - 1;
	size_ const assign = find_token( tokens, token_kind::assign );
	size_ const colon = find_token( tokens, token_kind::colon );

	equation result;
	result.source = std::string( text );

	size_ rhs_first = 0;
	size_ rhs_last = std::min( colon, end );
	if( assign < rhs_last )
	{
		// x = ...
		if( assign == 1 && tokens[0].kind == token_kind::identifier )
		{
			result.target = std::string( tokens[0].text );
		}
		// dx/dt = ...
		else if(
		    assign == 3 && tokens[0].kind == token_kind::identifier &&
		    tokens[1].kind == token_kind::slash && tokens[2].kind == token_kind::identifier &&
		    tokens[0].text.size() > 1 && tokens[0].text.front() == 'd' && tokens[2].text == "dt" )
		{
			result.target = std::string( tokens[0].text.substr( 1 ) );
			result.kind = equation_kind::differential;
		}
		else
			throw parse_error( tokens[0].pos, "'x =' or 'dx/dt ='", describe( tokens[0] ) );

		rhs_first = assign + 1;
	}

	result.rhs = parse( tokens, rhs_first, rhs_last );

	if( colon < end )
	{
		result.unit = std::string( trim( text.substr( tokens[colon].pos + 1 ) ) );
		if( result.unit.empty() ) throw parse_error( tokens[end].pos, "unit", describe( tokens[end] ) );
	}

	return result;
}

std::vector<equation> parse_equations( std::string_view text )
{
	std::vector<equation> result;

	while( !text.empty() )
	{
		auto const nl = text.find( '\n' );
		auto const line = trim( text.substr( 0, nl ) );
		if( !line.empty() ) result.push_back( parse_equation( line ) );

		if( nl == std::string_view::npos ) break;
		text.remove_prefix( nl + 1 );
	}

	return result;
}
} // namespace eqnet
