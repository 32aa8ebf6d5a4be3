#include "symbols.h"

#include <eqnet/error.h>
#include <eqnet/expr/functions.h>
#include <eqnet/util/assert.h>
#include <eqnet/util/type_traits.h>

#include <algorithm>
#include <cctype>


static bool valid_identifier( std::string const & s )
{
	if( s.empty() ) return false;
	if( !std::isalpha( static_cast<unsigned char>( s[0] ) ) && s[0] != '_' ) return false;

	return std::all_of( s.begin(), s.end(), []( char c ) {
		return std::isalnum( static_cast<unsigned char>( c ) ) || c == '_';
	} );
}


namespace eqnet::expr
{
symbol_table::symbol_table( std::vector<std::string> const & variables )
{
	for( auto const & v : variables )
		if( !find_function( v ) && !find_constant( v ) ) add( v );
}

int_ symbol_table::add( std::string name, symbol_kind kind /* = symbol_kind::variable */ )
{
	if( !valid_identifier( name ) ) throw definition_error( "'" + name + "' is not a valid identifier" );
	if( find( name ) ) throw definition_error( "identifier '" + name + "' declared more than once" );
	if( find_function( name ) || find_constant( name ) )
		throw definition_error( "identifier '" + name + "' is reserved" );

	int_ const slot = util::narrow<int_>( _symbols.size() );
	_symbols.push_back( { std::move( name ), kind, slot } );
	return slot;
}

symbol const * symbol_table::find( std::string_view name ) const
{
	auto const it = std::find_if(
	    _symbols.begin(), _symbols.end(), [&]( symbol const & s ) { return s.name == name; } );

	return it == _symbols.end() ? nullptr : &*it;
}

size_ symbol_table::size() const { return _symbols.size(); }

symbol const & symbol_table::operator[]( size_ slot ) const
{
	eqnet_assert( slot < size(), "index out of bounds" );
	return _symbols[slot];
}

std::vector<symbol>::const_iterator symbol_table::begin() const { return _symbols.begin(); }
std::vector<symbol>::const_iterator symbol_table::end() const { return _symbols.end(); }


bool operator==( symbol_table const & a, symbol_table const & b )
{
	return std::equal( a.begin(), a.end(), b.begin(), b.end(), []( auto const & x, auto const & y ) {
		return x.name == y.name && x.kind == y.kind && x.slot == y.slot;
	} );
}
} // namespace eqnet::expr
