#include "parser.h"

#include <eqnet/error.h>
#include <eqnet/util/assert.h>

#include <optional>


using namespace eqnet;
using namespace eqnet::expr;


static std::optional<op> comparison_op( token_kind k )
{
	switch( k )
	{
		case token_kind::less: return op::lt;
		case token_kind::less_equal: return op::le;
		case token_kind::greater: return op::gt;
		case token_kind::greater_equal: return op::ge;
		case token_kind::equal_equal: return op::eq;
		case token_kind::not_equal: return op::ne;
		default: return std::nullopt;
	}
}


namespace
{
// Bounds recursion in the parser and in everything that walks the tree.
constexpr int_ max_nesting = 256;
constexpr int_ max_operators = 4096;

class parser
{
public:
	parser( std::vector<token> const & tokens, size_ first, size_ last )
	    : _tokens( tokens )
	    , _i( first )
	    , _last( last )
	{
		eqnet_assert( first <= last && last < tokens.size(), "invalid token range" );
	}

	node parse_all()
	{
		node result = comparison();
		if( _i != _last ) throw parse_error( peek().pos, "operator or end of input", describe( peek() ) );

		return result;
	}

private:
	std::vector<token> const & _tokens;
	size_ _i;
	size_ _last;
	int_ _depth = 0;
	int_ _operators = 0;

	token peek() const
	{
		if( _i < _last ) return _tokens[_i];

		token end = _tokens[_last];
		end.kind = token_kind::end;
		return end;
	}

	token next()
	{
		token t = peek();
		if( _i < _last ) ++_i;
		return t;
	}

	bool accept( token_kind k )
	{
		if( peek().kind != k ) return false;
		next();
		return true;
	}

	size_ count_operator( size_ pos )
	{
		if( ++_operators > max_operators ) throw parse_error( pos, "shorter expression", describe( peek() ) );
		return pos;
	}

	token expect( token_kind k )
	{
		if( peek().kind != k ) throw parse_error( peek().pos, to_string( k ), describe( peek() ) );
		return next();
	}

	node comparison()
	{
		node lhs = additive();
		while( auto o = comparison_op( peek().kind ) )
		{
			size_ const pos = count_operator( next().pos );
			lhs = node::binary( *o, std::move( lhs ), additive(), pos );
		}
		return lhs;
	}

	node additive()
	{
		node lhs = multiplicative();
		for( ;; )
		{
			auto const k = peek().kind;
			if( k != token_kind::plus && k != token_kind::minus ) return lhs;

			size_ const pos = count_operator( next().pos );
			lhs = node::binary(
			    k == token_kind::plus ? op::add : op::sub, std::move( lhs ), multiplicative(), pos );
		}
	}

	node multiplicative()
	{
		node lhs = unary();
		for( ;; )
		{
			auto const k = peek().kind;
			if( k != token_kind::star && k != token_kind::slash ) return lhs;

			size_ const pos = count_operator( next().pos );
			lhs = node::binary(
			    k == token_kind::star ? op::mul : op::div, std::move( lhs ), unary(), pos );
		}
	}

	// Every nested subexpression passes through here.
	node unary()
	{
		if( ++_depth > max_nesting ) throw parse_error( peek().pos, "shallower nesting", describe( peek() ) );

		node result = signed_power();
		_depth--;
		return result;
	}

	node signed_power()
	{
		if( peek().kind == token_kind::minus )
		{
			size_ const pos = count_operator( next().pos );
			return node::unary( op::neg, unary(), pos );
		}
		if( accept( token_kind::plus ) ) return unary();

		return power();
	}

	node power()
	{
		node base = primary();
		if( peek().kind == token_kind::caret )
		{
			size_ const pos = count_operator( next().pos );
			return node::binary( op::pow, std::move( base ), unary(), pos );
		}
		return base;
	}

	node primary()
	{
		token const t = peek();
		switch( t.kind )
		{
			case token_kind::number: next(); return node::literal( t.value, t.pos );

			case token_kind::identifier:
			{
				next();
				if( !accept( token_kind::lparen ) ) return node::identifier( std::string( t.text ), t.pos );

				std::vector<node> args;
				if( !accept( token_kind::rparen ) )
				{
					do
						args.push_back( comparison() );
					while( accept( token_kind::comma ) );

					expect( token_kind::rparen );
				}
				return node::call( std::string( t.text ), std::move( args ), count_operator( t.pos ) );
			}

			case token_kind::lparen:
			{
				next();
				node inner = comparison();
				expect( token_kind::rparen );
				return inner;
			}

			default: throw parse_error( t.pos, "expression", describe( t ) );
		}
	}
};
} // namespace


namespace eqnet::expr
{
node parse( std::string_view source )
{
	auto const tokens = tokenize( source );
	return parse( tokens, 0, tokens.size() - 1 );
}

node parse( std::vector<token> const & tokens, size_ first, size_ last )
{
	return parser( tokens, first, last ).parse_all();
}
} // namespace eqnet::expr
