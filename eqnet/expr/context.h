#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>


namespace eqnet
{
namespace expr
{
// Identifier -> value bindings for evaluate(). Built by the caller, never
// retained by the expression.
class context
{
public:
	context() = default;
	context( std::initializer_list<std::pair<std::string const, double>> values );

	context & set( std::string name, double value );
	std::optional<double> get( std::string_view name ) const;
	bool contains( std::string_view name ) const;

	std::size_t size() const;

private:
	std::map<std::string, double, std::less<>> _values;
};
} // namespace expr
} // namespace eqnet
