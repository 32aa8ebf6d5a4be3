#pragma once

#include <eqnet/util/stdint.h>

#include <string>
#include <string_view>
#include <vector>


namespace eqnet
{
namespace expr
{
enum class token_kind
{
	number,
	identifier,
	plus,
	minus,
	star,
	slash,
	caret,
	less,
	less_equal,
	greater,
	greater_equal,
	equal_equal,
	not_equal,
	lparen,
	rparen,
	comma,
	// only meaningful in equation text ('dv/dt = ... : volt')
	assign,
	colon,
	end
};

struct token
{
	token_kind kind;
	std::string_view text; // view into the lexed source
	double value;          // numbers only
	size_ pos;             // byte offset into the lexed source
};

// Human readable token class for diagnostics, e.g. "'+'" or "number".
char const * to_string( token_kind kind );
// The token as it appears in diagnostics: its text or "end of input".
std::string describe( token const & t );

// Splits source into tokens. The result always ends with a token_kind::end
// token positioned at source.size(). Throws lex_error.
// The returned tokens reference source, which must outlive them.
std::vector<token> tokenize( std::string_view source );
} // namespace expr
} // namespace eqnet
