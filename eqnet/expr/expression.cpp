#include "expression.h"

#include <eqnet/error.h>
#include <eqnet/expr/functions.h>
#include <eqnet/expr/parser.h>
#include <eqnet/util/assert.h>

#include <algorithm>
#include <cmath>


using namespace eqnet;
using namespace eqnet::expr;


static opcode to_opcode( op o )
{
	switch( o )
	{
		case op::neg: return opcode::neg;
		case op::add: return opcode::add;
		case op::sub: return opcode::sub;
		case op::mul: return opcode::mul;
		case op::div: return opcode::div;
		case op::pow: return opcode::pow;
		case op::lt: return opcode::lt;
		case op::le: return opcode::le;
		case op::gt: return opcode::gt;
		case op::ge: return opcode::ge;
		case op::eq: return opcode::eq;
		case op::ne: return opcode::ne;
	}
	return opcode::add;
}

static void resolve( node & n, symbol_table const & symbols )
{
	switch( n.kind )
	{
		case node_kind::variable:
		case node_kind::parameter:
		{
			if( auto const * s = symbols.find( n.name ) )
			{
				n.kind = s->kind == symbol_kind::parameter ? node_kind::parameter : node_kind::variable;
				n.slot = s->slot;
			}
			else if( auto const c = find_constant( n.name ) )
			{
				n = node::literal( *c, n.pos );
			}
			else
				throw unknown_identifier_error( n.name, n.pos );
			return;
		}

		case node_kind::call:
		{
			auto const f = find_function( n.name );
			if( !f ) throw unknown_identifier_error( n.name, n.pos );

			int_ const arity = get_function( *f ).arity;
			if( static_cast<size_>( arity ) != n.args.size() )
				throw arity_error( n.name, arity, static_cast<int_>( n.args.size() ), n.pos );

			n.slot = *f;
			break;
		}

		default: break;
	}

	for( auto & arg : n.args ) resolve( arg, symbols );
}

namespace
{
struct codegen
{
	std::vector<instr> code;
	std::vector<int_> reads;
	size_ depth = 0;
	size_ max_depth = 0;

	void push( instr i, size_ pops, size_ pushes )
	{
		eqnet_assert( depth >= pops );

		code.push_back( i );
		depth = depth - pops + pushes;
		max_depth = std::max( max_depth, depth );
	}

	void emit( node const & n )
	{
		switch( n.kind )
		{
			case node_kind::literal: push( { opcode::constant, 0, n.value }, 0, 1 ); return;
			case node_kind::variable:
			case node_kind::parameter:
				reads.push_back( n.slot );
				push( { opcode::load, n.slot, 0.0 }, 0, 1 );
				return;
			case node_kind::unary:
			case node_kind::binary:
				for( auto const & arg : n.args ) emit( arg );
				push( { to_opcode( n.oper ), 0, 0.0 }, n.args.size(), 1 );
				return;
			case node_kind::call:
				for( auto const & arg : n.args ) emit( arg );
				push( { opcode::call, n.slot, 0.0 }, n.args.size(), 1 );
				return;
		}
	}
};

inline double truth( bool b ) { return b ? 1.0 : 0.0; }

double run( std::vector<instr> const & code, double const * slots, double * stack )
{
	size_ sp = 0;
	for( auto const & i : code )
	{
		switch( i.code )
		{
			case opcode::constant: stack[sp++] = i.value; break;
			case opcode::load: stack[sp++] = slots[i.arg]; break;
			case opcode::neg: stack[sp - 1] = -stack[sp - 1]; break;
			case opcode::add: --sp; stack[sp - 1] += stack[sp]; break;
			case opcode::sub: --sp; stack[sp - 1] -= stack[sp]; break;
			case opcode::mul: --sp; stack[sp - 1] *= stack[sp]; break;
			case opcode::div: --sp; stack[sp - 1] /= stack[sp]; break;
			case opcode::pow: --sp; stack[sp - 1] = std::pow( stack[sp - 1], stack[sp] ); break;
			case opcode::lt: --sp; stack[sp - 1] = truth( stack[sp - 1] < stack[sp] ); break;
			case opcode::le: --sp; stack[sp - 1] = truth( stack[sp - 1] <= stack[sp] ); break;
			case opcode::gt: --sp; stack[sp - 1] = truth( stack[sp - 1] > stack[sp] ); break;
			case opcode::ge: --sp; stack[sp - 1] = truth( stack[sp - 1] >= stack[sp] ); break;
			case opcode::eq: --sp; stack[sp - 1] = truth( stack[sp - 1] == stack[sp] ); break;
			case opcode::ne: --sp; stack[sp - 1] = truth( stack[sp - 1] != stack[sp] ); break;
			case opcode::call:
			{
				auto const & f = get_function( i.arg );
				sp -= f.arity;
				stack[sp] = f.fn( stack + sp );
				++sp;
				break;
			}
		}
	}

	return stack[0];
}
} // namespace


namespace eqnet::expr
{
bool operator==( instr const & a, instr const & b )
{
	return a.code == b.code && a.arg == b.arg && a.value == b.value;
}


std::string const & expression::source() const { return _source; }
node const & expression::ast() const { return _ast; }
symbol_table const & expression::symbols() const { return _symbols; }
std::vector<instr> const & expression::code() const { return _code; }
std::vector<int_> const & expression::reads() const { return _reads; }
size_ expression::stack_depth() const { return _depth; }

double expression::eval( double const * slots ) const
{
	eqnet_assert( !_code.empty(), "evaluating an uncompiled expression" );

	constexpr size_ INLINE_DEPTH = 32;
	if( _depth <= INLINE_DEPTH )
	{
		double stack[INLINE_DEPTH];
		return run( _code, slots, stack );
	}

	std::vector<double> stack( _depth );
	return run( _code, slots, stack.data() );
}


bool operator==( expression const & a, expression const & b )
{
	return a.ast() == b.ast() && a.symbols() == b.symbols() && a.code() == b.code();
}

bool operator!=( expression const & a, expression const & b ) { return !( a == b ); }


expression compile( node ast, std::string source, symbol_table const & symbols )
{
	resolve( ast, symbols );

	codegen gen;
	gen.emit( ast );
	eqnet_assert( gen.depth == 1 );

	std::sort( gen.reads.begin(), gen.reads.end() );
	gen.reads.erase( std::unique( gen.reads.begin(), gen.reads.end() ), gen.reads.end() );

	expression result;
	result._source = std::move( source );
	result._ast = std::move( ast );
	result._symbols = symbols;
	result._code = std::move( gen.code );
	result._reads = std::move( gen.reads );
	result._depth = gen.max_depth;
	return result;
}

expression compile( std::string_view source, symbol_table const & symbols )
{
	return compile( parse( source ), std::string( source ), symbols );
}

expression compile( std::string_view source, std::vector<std::string> const & known_identifiers )
{
	return compile( source, symbol_table( known_identifiers ) );
}


double evaluate( expression const & expr, context const & ctx )
{
	std::vector<double> slots( expr.symbols().size(), 0.0 );
	for( int_ slot : expr.reads() )
	{
		auto const & name = expr.symbols()[slot].name;
		auto const value = ctx.get( name );
		if( !value ) throw eval_error( "no value bound to '" + name + "' in '" + expr.source() + "'" );

		slots[slot] = *value;
	}

	return expr.eval( slots.data() );
}
} // namespace eqnet::expr
