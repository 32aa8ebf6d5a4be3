#pragma once


namespace eqnet
{
namespace util
{
// Throws std::invalid_argument describing the failed condition.
[[noreturn]] void _assert( char const * cond, char const * file, int line, char const * msg = nullptr );
} // namespace util
} // namespace eqnet


// Precondition checks for programmer errors (bad indices, broken internal state).
// Domain errors (malformed equations, invalid topologies) are reported through the
// exception types in <eqnet/error.h> and are never compiled out.
#if defined( EQNET_ASSERT_RELEASE ) || !defined( NDEBUG )
#define eqnet_assert( X, ... ) \
	(void)( ( X ) || ( ::eqnet::util::_assert( #X, __FILE__, __LINE__, ##__VA_ARGS__ ), 0 ) )
#else
#define eqnet_assert( X, ... )
#endif
