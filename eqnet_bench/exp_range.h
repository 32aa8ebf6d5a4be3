#pragma once

#include <benchmark/benchmark.h>

#include <cstdint>


// Registers start, start * mul, start * mul^2, ... <= stop
inline void exp_range( benchmark::internal::Benchmark * b, int64_t start, int64_t stop, double mul = 2 )
{
	for( ; start <= stop; start = ( int64_t )( start * mul ) ) b->Args( { start } );
}

#define ExpRange( start, stop, ... )                        \
	Apply( []( benchmark::internal::Benchmark * b ) {       \
		exp_range( b, ( start ), ( stop ), ##__VA_ARGS__ ); \
	} )
