#pragma once

#include <eqnet/util/stdint.h>

#include <stdexcept>
#include <string>


namespace eqnet
{
enum class compile_error_kind
{
	lex,
	parse,
	unknown_identifier,
	arity,
	definition
};

char const * to_string( compile_error_kind kind );


// Base of everything that can go wrong while turning equation text into a
// compiled expression or a compiled neuron model. Always recoverable: the
// offending model is simply not instantiable.
class compile_error : public std::runtime_error
{
public:
	static constexpr size_ npos = static_cast<size_>( -1 );

	compile_error( compile_error_kind kind, std::string const & msg, size_ position = npos );

	compile_error_kind kind() const;
	// Byte offset into the source text, npos if not tied to a location.
	size_ position() const;

private:
	compile_error_kind _kind;
	size_ _position;
};

class lex_error : public compile_error
{
public:
	lex_error( size_ position, char unexpected );

	char unexpected() const;

private:
	char _unexpected;
};

class parse_error : public compile_error
{
public:
	parse_error( size_ position, std::string expected, std::string found );

	std::string const & expected() const;
	std::string const & found() const;

private:
	std::string _expected;
	std::string _found;
};

class unknown_identifier_error : public compile_error
{
public:
	explicit unknown_identifier_error( std::string name, size_ position = npos );

	std::string const & name() const;

private:
	std::string _name;
};

class arity_error : public compile_error
{
public:
	arity_error( std::string name, int_ expected, int_ got, size_ position = npos );

	std::string const & name() const;
	int_ expected() const;
	int_ got() const;

private:
	std::string _name;
	int_ _expected;
	int_ _got;
};

// Structurally valid equations that do not form a valid neuron model
// (duplicate names, assignments to parameters, ...).
class definition_error : public compile_error
{
public:
	explicit definition_error( std::string const & msg );
};


// Rejected network construction. The network is not created.
class topology_error : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

class unknown_neuron_error : public topology_error
{
public:
	explicit unknown_neuron_error( long_ id );

	long_ id() const;

private:
	long_ _id;
};

class invalid_delay_error : public topology_error
{
public:
	explicit invalid_delay_error( double delay );

	double delay() const;

private:
	double _delay;
};


// Raised by evaluate() if the context does not bind every identifier the
// expression reads. The simulation loop never raises it: all per-tick
// arithmetic yields a double, NaN and inf included.
class eval_error : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};
} // namespace eqnet
