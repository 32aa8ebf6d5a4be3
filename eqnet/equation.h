#pragma once

#include <eqnet/expr/ast.h>

#include <string>
#include <string_view>
#include <vector>


namespace eqnet
{
enum class equation_kind
{
	assignment,  // x = rhs
	differential // dx/dt = rhs, integrated with forward Euler
};

// One line of equation text: 'lhs = rhs [: unit]'. A bare 'rhs' assigns to the
// primary state variable of the model it belongs to (target is empty).
struct equation
{
	std::string source;
	std::string target;
	equation_kind kind = equation_kind::assignment;
	expr::node rhs; // unresolved, positions relative to source
	std::string unit;
};

// Throws lex_error/parse_error.
equation parse_equation( std::string_view text );
// One equation per non-empty line.
std::vector<equation> parse_equations( std::string_view text );
} // namespace eqnet
