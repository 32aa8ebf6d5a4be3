#include "spike_queue.h"


namespace eqnet
{
spike_queue::spike_queue( size_ capacity /* = 0 */ )
    : _capacity( capacity )
{
}

bool spike_queue::push( spike_event const & e )
{
	if( _capacity > 0 && size() >= _capacity )
	{
		++_dropped;
		return false;
	}

	_heap.push( { e, _seq++ } );
	return true;
}

void spike_queue::pop_due( double now, std::vector<spike_event> & out )
{
	while( !_heap.empty() && _heap.top().e.time <= now )
	{
		out.push_back( _heap.top().e );
		_heap.pop();
	}
}

std::vector<spike_event> spike_queue::pop_due( double now )
{
	std::vector<spike_event> result;
	pop_due( now, result );
	return result;
}

size_ spike_queue::size() const { return _heap.size(); }
bool spike_queue::empty() const { return _heap.empty(); }
size_ spike_queue::capacity() const { return _capacity; }
size_ spike_queue::dropped() const { return _dropped; }
} // namespace eqnet
