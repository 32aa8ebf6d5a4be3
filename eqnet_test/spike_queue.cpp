#include <gtest/gtest.h>

#include <eqnet/spike_queue.h>


using namespace eqnet;


TEST( SpikeQueue, Order )
{
	spike_queue q;
	ASSERT_TRUE( q.empty() );

	q.push( { 0, 3.0, 1.0 } );
	q.push( { 1, 1.0, 2.0 } );
	q.push( { 2, 3.0, 3.0 } );
	q.push( { 3, 2.0, 4.0 } );
	q.push( { 4, 3.0, 5.0 } );

	ASSERT_EQ( q.size(), 5u );

	ASSERT_TRUE( q.pop_due( 0.5 ).empty() );

	auto due = q.pop_due( 2.0 );
	ASSERT_EQ( due.size(), 2u );
	ASSERT_EQ( due[0].target, 1 );
	ASSERT_EQ( due[1].target, 3 );

	// ties come out in insertion order
	due = q.pop_due( 10.0 );
	ASSERT_EQ( due.size(), 3u );
	ASSERT_EQ( due[0].target, 0 );
	ASSERT_EQ( due[1].target, 2 );
	ASSERT_EQ( due[2].target, 4 );
	ASSERT_EQ( due[2].magnitude, 5.0 );

	ASSERT_TRUE( q.empty() );
}

TEST( SpikeQueue, ManyTies )
{
	spike_queue q;
	for( int_ i = 0; i < 1000; i++ ) q.push( { i, ( i % 2 ) ? 1.0 : 0.0, 0.0 } );

	auto const due = q.pop_due( 1.0 );
	ASSERT_EQ( due.size(), 1000u );
	for( int_ i = 0; i < 500; i++ ) ASSERT_EQ( due[i].target, 2 * i );
	for( int_ i = 0; i < 500; i++ ) ASSERT_EQ( due[500 + i].target, 2 * i + 1 );
}

TEST( SpikeQueue, Capacity )
{
	spike_queue q( 2 );
	ASSERT_EQ( q.capacity(), 2u );

	ASSERT_TRUE( q.push( { 0, 1.0, 1.0 } ) );
	ASSERT_TRUE( q.push( { 1, 1.0, 1.0 } ) );
	ASSERT_FALSE( q.push( { 2, 0.5, 1.0 } ) );
	ASSERT_EQ( q.size(), 2u );
	ASSERT_EQ( q.dropped(), 1u );

	std::vector<spike_event> out;
	q.pop_due( 1.0, out );
	ASSERT_EQ( out.size(), 2u );
	ASSERT_TRUE( q.push( { 2, 2.0, 1.0 } ) );
	ASSERT_EQ( q.dropped(), 1u );
}
