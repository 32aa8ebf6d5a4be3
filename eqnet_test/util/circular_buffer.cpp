#include <gtest/gtest.h>

#include <eqnet/util/circular_buffer.h>


using namespace eqnet::util;


TEST( CircBuffer, Ctor )
{
	{
		circular_buffer<int> x( 0 );
		ASSERT_EQ( x.capacity(), 0u );
		ASSERT_EQ( x.size(), 0u );
		ASSERT_TRUE( x.empty() );
	}

	{
		circular_buffer<int> x( 10 );
		ASSERT_EQ( x.capacity(), 10u );
		ASSERT_EQ( x.size(), 0u );
		ASSERT_TRUE( x.empty() );
		ASSERT_FALSE( x.full() );
	}
}

TEST( CircBuffer, CircIdx )
{
	ASSERT_EQ( circidx( 0, 3 ), 0 );
	ASSERT_EQ( circidx( 4, 3 ), 1 );
	ASSERT_EQ( circidx( -2, 3 ), 1 );
	ASSERT_EQ( circidx( -3, 3 ), 0 );

	ASSERT_THROW( circidx( 0, 0 ), std::invalid_argument );
}

TEST( CircBuffer, PushBack )
{
	circular_buffer<int> x( 3 );

	x.push_back( 1 );
	x.push_back( 2 );
	ASSERT_EQ( x.size(), 2u );
	ASSERT_EQ( x.front(), 1 );
	ASSERT_EQ( x.back(), 2 );

	x.push_back( 3 );
	ASSERT_TRUE( x.full() );
	ASSERT_EQ( x.to_vector(), ( std::vector<int>{ 1, 2, 3 } ) );

	// overwrites the oldest
	x.push_back( 4 );
	x.push_back( 5 );
	ASSERT_EQ( x.size(), 3u );
	ASSERT_EQ( x[0], 3 );
	ASSERT_EQ( x[1], 4 );
	ASSERT_EQ( x[2], 5 );
	ASSERT_THROW( x[3], std::invalid_argument );

	x[1] = 7;
	ASSERT_EQ( x.to_vector(), ( std::vector<int>{ 3, 7, 5 } ) );

	x.clear();
	ASSERT_TRUE( x.empty() );
	x.push_back( 6 );
	ASSERT_EQ( x.to_vector(), std::vector<int>{ 6 } );
}
