#pragma once

#include <eqnet/util/stdint.h>

#include <string>
#include <string_view>
#include <vector>


namespace eqnet
{
namespace expr
{
enum class symbol_kind
{
	variable,
	parameter
};

struct symbol
{
	std::string name;
	symbol_kind kind;
	int_ slot;
};

// The identifiers an expression may reference, each bound to a slot in a
// dense value array. Slots are assigned in insertion order.
class symbol_table
{
public:
	symbol_table() = default;
	// Every name becomes a variable. Names of built-in functions and constants
	// are accepted and skipped: they resolve through their registries.
	explicit symbol_table( std::vector<std::string> const & variables );

	// @return the slot of the new symbol
	// Throws definition_error if 'name' is already declared, is not a valid
	// identifier, or names a built-in function or constant.
	int_ add( std::string name, symbol_kind kind = symbol_kind::variable );

	symbol const * find( std::string_view name ) const;

	size_ size() const;
	symbol const & operator[]( size_ slot ) const;

	std::vector<symbol>::const_iterator begin() const;
	std::vector<symbol>::const_iterator end() const;

private:
	std::vector<symbol> _symbols;
};

bool operator==( symbol_table const & a, symbol_table const & b );
} // namespace expr
} // namespace eqnet
