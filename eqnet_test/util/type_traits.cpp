#include <gtest/gtest.h>

#include <eqnet/util/stdint.h>
#include <eqnet/util/type_traits.h>

#include <limits>


using namespace eqnet::util;


TEST( TypeTraits, Narrow )
{
	ASSERT_EQ( narrow<int_>( 5_sz ), 5 );
	ASSERT_EQ( narrow<size_>( 5 ), 5u );
	ASSERT_EQ( narrow<int_>( long_( -7 ) ), -7 );

	ASSERT_THROW( narrow<size_>( -1 ), std::bad_cast );
	ASSERT_THROW( narrow<std::uint32_t>( long_( -1 ) ), std::bad_cast );
	ASSERT_THROW(
	    narrow<int_>( static_cast<long_>( std::numeric_limits<int_>::max() ) + 1 ), std::bad_cast );
	ASSERT_THROW(
	    narrow<int_>( static_cast<long_>( std::numeric_limits<int_>::min() ) - 1 ), std::bad_cast );
	ASSERT_THROW( narrow<int_>( std::numeric_limits<size_>::max() ), std::bad_cast );
}

TEST( TypeTraits, NarrowCast )
{
	ASSERT_EQ( narrow_cast<int_>( 3.7 ), 3 );
	ASSERT_EQ( narrow_cast<size_>( int_( 12 ) ), 12u );
}
