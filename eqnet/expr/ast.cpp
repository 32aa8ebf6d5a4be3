#include "ast.h"

#include <sstream>


static void print( std::ostream & os, eqnet::expr::node const & n )
{
	using namespace eqnet::expr;

	switch( n.kind )
	{
		case node_kind::literal: os << n.value; return;
		case node_kind::variable:
		case node_kind::parameter: os << n.name; return;
		case node_kind::unary:
		case node_kind::binary: os << '(' << op_symbol( n.oper ); break;
		case node_kind::call: os << '(' << n.name; break;
	}

	for( auto const & arg : n.args )
	{
		os << ' ';
		print( os, arg );
	}
	os << ')';
}


namespace eqnet::expr
{
char const * op_symbol( op o )
{
	switch( o )
	{
		case op::neg: return "-";
		case op::add: return "+";
		case op::sub: return "-";
		case op::mul: return "*";
		case op::div: return "/";
		case op::pow: return "^";
		case op::lt: return "<";
		case op::le: return "<=";
		case op::gt: return ">";
		case op::ge: return ">=";
		case op::eq: return "==";
		case op::ne: return "!=";
	}
	return "?";
}


node node::literal( double value, size_ pos )
{
	node n;
	n.kind = node_kind::literal;
	n.value = value;
	n.pos = pos;
	return n;
}

node node::identifier( std::string name, size_ pos )
{
	node n;
	n.kind = node_kind::variable;
	n.name = std::move( name );
	n.pos = pos;
	return n;
}

node node::unary( op o, node operand, size_ pos )
{
	node n;
	n.kind = node_kind::unary;
	n.oper = o;
	n.args.push_back( std::move( operand ) );
	n.pos = pos;
	return n;
}

node node::binary( op o, node lhs, node rhs, size_ pos )
{
	node n;
	n.kind = node_kind::binary;
	n.oper = o;
	n.args.push_back( std::move( lhs ) );
	n.args.push_back( std::move( rhs ) );
	n.pos = pos;
	return n;
}

node node::call( std::string name, std::vector<node> args, size_ pos )
{
	node n;
	n.kind = node_kind::call;
	n.name = std::move( name );
	n.args = std::move( args );
	n.pos = pos;
	return n;
}


bool operator==( node const & a, node const & b )
{
	if( a.kind != b.kind || a.slot != b.slot || a.name != b.name || a.args != b.args ) return false;

	switch( a.kind )
	{
		case node_kind::literal: return a.value == b.value;
		case node_kind::unary:
		case node_kind::binary: return a.oper == b.oper;
		default: return true;
	}
}

bool operator!=( node const & a, node const & b ) { return !( a == b ); }

std::string to_string( node const & n )
{
	std::ostringstream os;
	print( os, n );
	return os.str();
}
} // namespace eqnet::expr
