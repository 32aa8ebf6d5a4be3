#include "context.h"


namespace eqnet::expr
{
context::context( std::initializer_list<std::pair<std::string const, double>> values )
    : _values( values )
{
}

context & context::set( std::string name, double value )
{
	_values[std::move( name )] = value;
	return *this;
}

std::optional<double> context::get( std::string_view name ) const
{
	auto const it = _values.find( name );
	if( it == _values.end() ) return std::nullopt;
	return it->second;
}

bool context::contains( std::string_view name ) const { return _values.find( name ) != _values.end(); }

std::size_t context::size() const { return _values.size(); }
} // namespace eqnet::expr
