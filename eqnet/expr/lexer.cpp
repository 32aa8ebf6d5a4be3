#include "lexer.h"

#include <eqnet/error.h>

#include <cctype>
#include <cstdlib>


static bool is_digit( char c ) { return std::isdigit( static_cast<unsigned char>( c ) ) != 0; }
static bool is_ident_first( char c )
{
	return std::isalpha( static_cast<unsigned char>( c ) ) || c == '_';
}
static bool is_ident( char c ) { return is_ident_first( c ) || is_digit( c ); }


namespace eqnet::expr
{
char const * to_string( token_kind kind )
{
	switch( kind )
	{
		case token_kind::number: return "number";
		case token_kind::identifier: return "identifier";
		case token_kind::plus: return "'+'";
		case token_kind::minus: return "'-'";
		case token_kind::star: return "'*'";
		case token_kind::slash: return "'/'";
		case token_kind::caret: return "'^'";
		case token_kind::less: return "'<'";
		case token_kind::less_equal: return "'<='";
		case token_kind::greater: return "'>'";
		case token_kind::greater_equal: return "'>='";
		case token_kind::equal_equal: return "'=='";
		case token_kind::not_equal: return "'!='";
		case token_kind::lparen: return "'('";
		case token_kind::rparen: return "')'";
		case token_kind::comma: return "','";
		case token_kind::assign: return "'='";
		case token_kind::colon: return "':'";
		case token_kind::end: return "end of input";
	}
	return "token";
}

std::string describe( token const & t )
{
	if( t.kind == token_kind::end ) return to_string( t.kind );
	return "'" + std::string( t.text ) + "'";
}

std::vector<token> tokenize( std::string_view const source )
{
	std::vector<token> result;

	size_ i = 0;
	auto const peek = [&]( size_ ahead ) -> char {
		return i + ahead < source.size() ? source[i + ahead] : '\0';
	};
	auto const emit = [&]( token_kind kind, size_ len ) {
		result.push_back( { kind, source.substr( i, len ), 0.0, i } );
		i += len;
	};

	while( i < source.size() )
	{
		char const c = source[i];

		if( std::isspace( static_cast<unsigned char>( c ) ) )
		{
			++i;
			continue;
		}

		// decimal literal with optional fraction and exponent: 1, 1.5, .5, 2e-3
		if( is_digit( c ) || ( c == '.' && is_digit( peek( 1 ) ) ) )
		{
			size_ len = 0;
			while( is_digit( peek( len ) ) ) ++len;
			if( peek( len ) == '.' )
			{
				++len;
				while( is_digit( peek( len ) ) ) ++len;
			}
			if( peek( len ) == 'e' || peek( len ) == 'E' )
			{
				size_ exp = len + 1;
				if( peek( exp ) == '+' || peek( exp ) == '-' ) ++exp;
				if( is_digit( peek( exp ) ) )
				{
					while( is_digit( peek( exp ) ) ) ++exp;
					len = exp;
				}
			}

			std::string const literal( source.substr( i, len ) );
			result.push_back(
			    { token_kind::number, source.substr( i, len ), std::strtod( literal.c_str(), nullptr ), i } );
			i += len;
			continue;
		}

		if( is_ident_first( c ) )
		{
			size_ len = 1;
			while( is_ident( peek( len ) ) ) ++len;
			emit( token_kind::identifier, len );
			continue;
		}

		switch( c )
		{
			case '+': emit( token_kind::plus, 1 ); break;
			case '-': emit( token_kind::minus, 1 ); break;
			case '*': emit( token_kind::star, 1 ); break;
			case '/': emit( token_kind::slash, 1 ); break;
			case '^': emit( token_kind::caret, 1 ); break;
			case '(': emit( token_kind::lparen, 1 ); break;
			case ')': emit( token_kind::rparen, 1 ); break;
			case ',': emit( token_kind::comma, 1 ); break;
			case ':': emit( token_kind::colon, 1 ); break;
			case '<':
				if( peek( 1 ) == '=' )
					emit( token_kind::less_equal, 2 );
				else
					emit( token_kind::less, 1 );
				break;
			case '>':
				if( peek( 1 ) == '=' )
					emit( token_kind::greater_equal, 2 );
				else
					emit( token_kind::greater, 1 );
				break;
			case '=':
				if( peek( 1 ) == '=' )
					emit( token_kind::equal_equal, 2 );
				else
					emit( token_kind::assign, 1 );
				break;
			case '!':
				if( peek( 1 ) != '=' ) throw lex_error( i, c );
				emit( token_kind::not_equal, 2 );
				break;
			default: throw lex_error( i, c );
		}
	}

	result.push_back( { token_kind::end, source.substr( source.size() ), 0.0, source.size() } );
	return result;
}
} // namespace eqnet::expr
