#pragma once

#include <eqnet/util/assert.h>
#include <eqnet/util/stdint.h>

#include <vector>


namespace eqnet
{
namespace util
{
template <typename int_t>
int_t circidx( int_t i, int_t size )
{
	eqnet_assert( size > 0 );
	eqnet_assert( i >= -size );

	return ( i + size ) % size;
}

// Fixed-capacity ring. push_back() overwrites the oldest element once full.
// Element 0 is always the oldest element still held.
template <typename T, typename Container = std::vector<T>>
class circular_buffer
{
public:
	explicit circular_buffer( size_ capacity = 0 )
	    : _cont( capacity )
	{
	}

	size_ capacity() const { return _cont.size(); }
	size_ size() const { return _size; }
	bool empty() const { return _size == 0; }
	bool full() const { return _size == capacity(); }

	void push_back( T x )
	{
		eqnet_assert( capacity() > 0, "push_back() on a zero-capacity buffer" );

		_cont[_head] = std::move( x );
		_head = ( _head + 1 ) % capacity();
		if( !full() ) ++_size;
	}

	void clear()
	{
		_head = 0;
		_size = 0;
	}

	T & operator[]( size_ i ) { return _cont[_index( i )]; }
	T const & operator[]( size_ i ) const { return _cont[_index( i )]; }

	T const & front() const { return ( *this )[0]; }
	T const & back() const { return ( *this )[size() - 1]; }

	std::vector<T> to_vector() const
	{
		std::vector<T> result;
		result.reserve( size() );
		for( size_ i = 0; i < size(); i++ ) result.push_back( ( *this )[i] );
		return result;
	}

private:
	Container _cont;
	size_ _head = 0;
	size_ _size = 0;

	size_ _index( size_ i ) const
	{
		eqnet_assert( i < size(), "index out of bounds" );

		auto const first = static_cast<long_>( _head ) - static_cast<long_>( size() );
		return static_cast<size_>(
		    circidx<long_>( first + static_cast<long_>( i ), static_cast<long_>( capacity() ) ) );
	}
};
} // namespace util
} // namespace eqnet
