#pragma once

#include <eqnet/expr/ast.h>
#include <eqnet/expr/lexer.h>

#include <string_view>
#include <vector>


namespace eqnet
{
namespace expr
{
// Precedence climbing, lowest to highest binding:
//   comparison  := additive ( ('<'|'<='|'>'|'>='|'=='|'!=') additive )*
//   additive    := multiplicative ( ('+'|'-') multiplicative )*
//   multiplicative := unary ( ('*'|'/') unary )*
//   unary       := ('-'|'+') unary | power
//   power       := primary ( '^' unary )?          right associative
//   primary     := number | identifier | identifier '(' args ')' | '(' comparison ')'
//
// Throws lex_error/parse_error. Identifiers are left unresolved.
node parse( std::string_view source );

// Parses tokens[first, last) as one expression; tokens[last] acts as the end
// of input. Used for the right-hand side of equations.
node parse( std::vector<token> const & tokens, size_ first, size_ last );
} // namespace expr
} // namespace eqnet
