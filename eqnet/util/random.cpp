#include "random.h"


static ulong_ rotl64( ulong_ x, int k ) { return ( x << k ) | ( x >> ( 64 - k ) ); }


namespace eqnet::util
{
ulong_ hash( ulong_ x )
{
	x = ( x ^ ( x >> 30 ) ) * 0xbf58476d1ce4e5b9llu;
	x = ( x ^ ( x >> 27 ) ) * 0x94d049bb133111ebllu;
	x = x ^ ( x >> 31 );

	return x;
}


xoroshiro256ss::xoroshiro256ss( ulong_ seed )
{
	// splitmix64 stream: never all zero, any seed (0 included) is valid
	ulong_ const golden = 0x9e3779b97f4a7c15llu;

	s0 = hash( seed + golden );
	s1 = hash( seed + 2 * golden );
	s2 = hash( seed + 3 * golden );
	s3 = hash( seed + 4 * golden );
}

xoroshiro256ss::result_type xoroshiro256ss::operator()()
{
	auto const result = rotl64( s1 * 5, 7 ) * 9;

	auto const t = s1 << 17;

	s2 ^= s0;
	s3 ^= s1;
	s1 ^= s2;
	s0 ^= s3;

	s2 ^= t;

	s3 = rotl64( s3, 45 );

	return result;
}


double uniform_left_inc( xoroshiro256ss & gen )
{
	// top 53 bits fill the mantissa of a double in [0, 1)
	return static_cast<double>( gen() >> 11 ) * 0x1.0p-53;
}
} // namespace eqnet::util
