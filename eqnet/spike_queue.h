#pragma once

#include <eqnet/util/stdint.h>

#include <queue>
#include <vector>


namespace eqnet
{
struct spike_event
{
	int_ target;
	double time; // scheduled delivery
	double magnitude;
};

// Pending spike deliveries, ordered by delivery time. Events with equal times
// come out in the order they were pushed.
class spike_queue
{
public:
	// capacity == 0: unbounded
	explicit spike_queue( size_ capacity = 0 );

	// @return false if the event was dropped because the queue is at capacity
	bool push( spike_event const & e );

	// Removes all events with time <= now and appends them to out in delivery order.
	void pop_due( double now, std::vector<spike_event> & out );
	std::vector<spike_event> pop_due( double now );

	size_ size() const;
	bool empty() const;
	size_ capacity() const;
	// total no. of events rejected by push()
	size_ dropped() const;

private:
	struct entry
	{
		spike_event e;
		ulong_ seq;
	};

	struct later
	{
		bool operator()( entry const & a, entry const & b ) const
		{
			return a.e.time > b.e.time || ( a.e.time == b.e.time && a.seq > b.seq );
		}
	};

	std::priority_queue<entry, std::vector<entry>, later> _heap;
	ulong_ _seq = 0;
	size_ _capacity;
	size_ _dropped = 0;
};
} // namespace eqnet
