#include <gtest/gtest.h>

#include <eqnet/util/numeric.h>

#include <cmath>


using namespace eqnet::util;


TEST( KahanSum, Ctor )
{
	{
		kahan_sum<float> x;
		ASSERT_EQ( (float)x, 0.0f );
	}

	{
		kahan_sum<double> x( 2.5 );
		ASSERT_EQ( x.value(), 2.5 );
	}
}

TEST( KahanSum, Add )
{
	int const ITER = 1000;
	float const DELTA = 0.001f;

	kahan_sum<float> ksum;
	for( int i = 0; i < ITER; i++ )
	{
		ASSERT_FLOAT_EQ( (float)ksum, i * DELTA );

		float const total = ksum.add( DELTA );
		ASSERT_EQ( total, ksum.value() );
	}

	// would fail with 'float ksum':
	ASSERT_FLOAT_EQ( (float)ksum, 1 );
}

TEST( KahanSum, Drift )
{
	kahan_sum<double> ksum;
	double naive = 0.0;
	for( int i = 0; i < 1000000; i++ )
	{
		ksum.add( 0.1 );
		naive += 0.1;
	}

	ASSERT_LT( std::abs( ksum.value() - 100000.0 ), std::abs( naive - 100000.0 ) );
	ASSERT_DOUBLE_EQ( ksum.value(), 100000.0 );
}
