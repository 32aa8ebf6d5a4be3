#pragma once

#include <eqnet/util/stdint.h>

#include <limits>


namespace eqnet
{
namespace util
{
// splitmix64 finalizer, turns consecutive seeds into well distributed states
ulong_ hash( ulong_ x );

// http://prng.di.unimi.it/xoshiro256starstar.c
class xoroshiro256ss
{
public:
	using result_type = ulong_;
	static constexpr result_type min() { return 0; }
	static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

	explicit xoroshiro256ss( ulong_ seed );

	result_type operator()();

private:
	ulong_ s0, s1, s2, s3;
};

// @return rand no. in [0, 1)
double uniform_left_inc( xoroshiro256ss & gen );
} // namespace util
} // namespace eqnet
