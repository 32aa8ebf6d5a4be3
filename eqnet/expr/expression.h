#pragma once

#include <eqnet/expr/ast.h>
#include <eqnet/expr/context.h>
#include <eqnet/expr/symbols.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace eqnet
{
namespace expr
{
enum class opcode : std::uint8_t
{
	constant, // push value
	load,     // push slots[arg]
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
	ne,
	call // pop arity args, push get_function( arg ).fn( args )
};

struct instr
{
	opcode code;
	int_ arg;
	double value;
};

bool operator==( instr const & a, instr const & b );


// A validated, resolved expression plus its postfix program. Immutable,
// cheap to share read-only between any number of neurons.
class expression
{
public:
	std::string const & source() const;
	node const & ast() const;
	symbol_table const & symbols() const;
	std::vector<instr> const & code() const;
	// Slots read by the expression, ascending, without duplicates.
	std::vector<int_> const & reads() const;
	size_ stack_depth() const;

	// Evaluates against a dense array laid out like symbols(). Pure: the
	// same slot values always give the same result. Comparisons yield 1 or 0.
	double eval( double const * slots ) const;

private:
	std::string _source;
	node _ast;
	symbol_table _symbols;
	std::vector<instr> _code;
	std::vector<int_> _reads;
	size_ _depth = 0;

	friend expression compile( node ast, std::string source, symbol_table const & symbols );
};

// Structural equality of the resolved tree, the bindings and the program.
bool operator==( expression const & a, expression const & b );
bool operator!=( expression const & a, expression const & b );


// Resolves every identifier of 'ast' against 'symbols' (or a built-in
// constant), binds calls to the function registry and emits the program.
// Throws unknown_identifier_error, arity_error.
expression compile( node ast, std::string source, symbol_table const & symbols );
// Throws lex_error, parse_error, unknown_identifier_error, arity_error.
expression compile( std::string_view source, symbol_table const & symbols );
// Every known identifier becomes a variable.
expression compile( std::string_view source, std::vector<std::string> const & known_identifiers );

// Binds the identifiers expr reads by name from ctx and evaluates.
// Throws eval_error if ctx lacks a binding.
double evaluate( expression const & expr, context const & ctx );
} // namespace expr
} // namespace eqnet
