#include <gtest/gtest.h>

#include <eqnet/util/random.h>


using namespace eqnet::util;


TEST( Random, Determinism )
{
	xoroshiro256ss a( 1337 );
	xoroshiro256ss b( 1337 );
	xoroshiro256ss c( 1338 );

	bool differs = false;
	for( int_ i = 0; i < 100; i++ )
	{
		auto const x = a();
		ASSERT_EQ( x, b() );
		differs |= x != c();
	}
	ASSERT_TRUE( differs );
}

TEST( Random, uniform )
{
	xoroshiro256ss rng( 42 );

	double m = 0.0;
	for( int_ i = 0; i < 10000; i++ )
	{
		auto x = uniform_left_inc( rng );
		ASSERT_GE( x, 0.0 );
		ASSERT_LT( x, 1.0 );
		m += x;
	}
	EXPECT_NEAR( m / 10000, 0.5, 0.01 ) << "Test depends on rng, repeat it.";
}

TEST( Random, Hash )
{
	ASSERT_EQ( hash( 1 ), hash( 1 ) );
	ASSERT_NE( hash( 1 ), hash( 2 ) );
}

TEST( Random, ZeroSeed )
{
	xoroshiro256ss rng( 0 );

	int_ low = 0;
	for( int_ i = 0; i < 1000; i++ ) low += uniform_left_inc( rng ) < 0.02;

	ASSERT_LT( low, 100 );
}
