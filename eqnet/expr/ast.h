#pragma once

#include <eqnet/util/stdint.h>

#include <string>
#include <vector>


namespace eqnet
{
namespace expr
{
enum class node_kind
{
	literal,
	variable,  // state variable or built-in (t, dt, I_ext)
	parameter, // model parameter
	unary,
	binary,
	call
};

enum class op
{
	neg,
	add,
	sub,
	mul,
	div,
	pow,
	lt,
	le,
	gt,
	ge,
	eq,
	ne
};

char const * op_symbol( op o );

// Expression tree. The parser emits identifiers as 'variable' nodes with
// slot -1; compile() resolves them to variable/parameter nodes bound to a slot
// and binds calls to a function index. Never mutated after compile().
struct node
{
	node_kind kind = node_kind::literal;
	op oper = op::add;
	double value = 0.0;     // literal
	std::string name;       // variable, parameter, call
	int_ slot = -1;         // variable/parameter slot, function index for calls
	std::vector<node> args; // operands, call arguments
	size_ pos = 0;          // offset of the first character in the source

	static node literal( double value, size_ pos );
	static node identifier( std::string name, size_ pos );
	static node unary( op o, node operand, size_ pos );
	static node binary( op o, node lhs, node rhs, size_ pos );
	static node call( std::string name, std::vector<node> args, size_ pos );
};

// Structural equality: same shape, operators, literals, names and bindings.
// Source positions are not compared.
bool operator==( node const & a, node const & b );
bool operator!=( node const & a, node const & b );

// Prefix notation, e.g. "(+ a (* b 2))"
std::string to_string( node const & n );
} // namespace expr
} // namespace eqnet
