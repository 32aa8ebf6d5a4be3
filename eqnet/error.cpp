#include "error.h"

#include <cctype>
#include <sstream>


static std::string describe( char c )
{
	if( std::isprint( static_cast<unsigned char>( c ) ) ) return std::string( "'" ) + c + "'";

	std::ostringstream s;
	s << "byte 0x" << std::hex << static_cast<int>( static_cast<unsigned char>( c ) );
	return s.str();
}

static std::string at( size_ position )
{
	if( position == eqnet::compile_error::npos ) return "";
	return " at position " + std::to_string( position );
}


namespace eqnet
{
char const * to_string( compile_error_kind kind )
{
	switch( kind )
	{
		case compile_error_kind::lex: return "lex error";
		case compile_error_kind::parse: return "parse error";
		case compile_error_kind::unknown_identifier: return "unknown identifier";
		case compile_error_kind::arity: return "arity error";
		case compile_error_kind::definition: return "definition error";
	}
	return "compile error";
}


compile_error::compile_error(
    compile_error_kind kind, std::string const & msg, size_ position /* = npos */ )
    : std::runtime_error( msg )
    , _kind( kind )
    , _position( position )
{
}

compile_error_kind compile_error::kind() const { return _kind; }
size_ compile_error::position() const { return _position; }


lex_error::lex_error( size_ position, char unexpected )
    : compile_error(
          compile_error_kind::lex,
          "unexpected character " + describe( unexpected ) + at( position ),
          position )
    , _unexpected( unexpected )
{
}

char lex_error::unexpected() const { return _unexpected; }


parse_error::parse_error( size_ position, std::string expected, std::string found )
    : compile_error(
          compile_error_kind::parse,
          "expected " + expected + " but found " + found + at( position ),
          position )
    , _expected( std::move( expected ) )
    , _found( std::move( found ) )
{
}

std::string const & parse_error::expected() const { return _expected; }
std::string const & parse_error::found() const { return _found; }


unknown_identifier_error::unknown_identifier_error( std::string name, size_ position /* = npos */ )
    : compile_error(
          compile_error_kind::unknown_identifier,
          "unknown identifier '" + name + "'" + at( position ),
          position )
    , _name( std::move( name ) )
{
}

std::string const & unknown_identifier_error::name() const { return _name; }


arity_error::arity_error( std::string name, int_ expected, int_ got, size_ position /* = npos */ )
    : compile_error(
          compile_error_kind::arity,
          "function '" + name + "' takes " + std::to_string( expected ) + " argument(s), " +
              std::to_string( got ) + " given" + at( position ),
          position )
    , _name( std::move( name ) )
    , _expected( expected )
    , _got( got )
{
}

std::string const & arity_error::name() const { return _name; }
int_ arity_error::expected() const { return _expected; }
int_ arity_error::got() const { return _got; }


definition_error::definition_error( std::string const & msg )
    : compile_error( compile_error_kind::definition, msg )
{
}


unknown_neuron_error::unknown_neuron_error( long_ id )
    : topology_error( "unknown neuron " + std::to_string( id ) )
    , _id( id )
{
}

long_ unknown_neuron_error::id() const { return _id; }


invalid_delay_error::invalid_delay_error( double delay )
    : topology_error( "invalid synaptic delay " + std::to_string( delay ) + " (must be >= 0)" )
    , _delay( delay )
{
}

double invalid_delay_error::delay() const { return _delay; }
} // namespace eqnet
