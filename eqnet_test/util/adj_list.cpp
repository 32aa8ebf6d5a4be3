#include <gtest/gtest.h>

#include <eqnet/util/adj_list.h>

#include <vector>


using namespace eqnet::util;


TEST( AdjList, Ctor )
{
	{
		adj_list x;
		ASSERT_EQ( x.num_nodes(), 0u );
		ASSERT_EQ( x.num_edges(), 0u );
	}

	{
		adj_list x( 100, {} );

		ASSERT_EQ( x.num_nodes(), 100u );
		ASSERT_EQ( x.num_edges(), 0u );

		for( int i = 0; i < 100; i++ ) ASSERT_EQ( x.neighbors( i ).size(), 0u );
	}
}

TEST( AdjList, Neighbors )
{
	// edge i has source sources[i]
	std::vector<int_> const sources{ 2, 0, 2, 1, 0, 2 };
	adj_list x( 4, sources );

	ASSERT_EQ( x.num_nodes(), 4u );
	ASSERT_EQ( x.num_edges(), 6u );

	ASSERT_EQ( x.degree( 0 ), 2u );
	ASSERT_EQ( x.degree( 1 ), 1u );
	ASSERT_EQ( x.degree( 2 ), 3u );
	ASSERT_EQ( x.degree( 3 ), 0u );

	// insertion order is preserved per node
	auto const n0 = x.neighbors( 0 );
	ASSERT_EQ( std::vector<int_>( n0.begin(), n0.end() ), ( std::vector<int_>{ 1, 4 } ) );

	auto const n2 = x.neighbors( 2 );
	ASSERT_EQ( std::vector<int_>( n2.begin(), n2.end() ), ( std::vector<int_>{ 0, 2, 5 } ) );

	ASSERT_TRUE( x.neighbors( 3 ).empty() );

	for( size_ i = 0; i < x.num_nodes(); i++ )
		for( int_ e : x.neighbors( i ) ) ASSERT_EQ( static_cast<size_>( sources[e] ), i );
}
