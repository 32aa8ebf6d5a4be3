#include <eqnet/util/assert.h>

#include <cstdio>
#include <cstring>
#include <stdexcept>


static char const * file_name( char const * path )
{
#ifdef _WIN32
	char const * sep = std::strrchr( path, '\\' );
#else
	char const * sep = std::strrchr( path, '/' );
#endif
	return sep ? sep + 1 : path;
}


namespace eqnet::util
{
void _assert( char const * cond, char const * file, int line, char const * msg /* = nullptr */ )
{
	char buffer[1024];
	std::snprintf(
	    buffer,
	    sizeof( buffer ),
	    msg ? "[%s: %d] assertion '%s' failed: %s" : "[%s: %d] assertion '%s' failed",
	    file_name( file ),
	    line,
	    cond,
	    msg );

	throw std::invalid_argument( buffer );
}
} // namespace eqnet::util
