#include <eqnet/util/adj_list.h>

#include <eqnet/util/assert.h>
#include <eqnet/util/type_traits.h>

#include <limits>


namespace eqnet::util
{
adj_list::adj_list( size_ num_nodes, std::vector<int_> const & sources )
    : _offsets( num_nodes + 1, 0 )
    , _edges( sources.size() )
{
	eqnet_assert(
	    sources.size() <= static_cast<size_>( std::numeric_limits<int_>::max() ),
	    "no. of edges out of bounds" );

	for( int_ src : sources )
	{
		eqnet_assert( src >= 0 && static_cast<size_>( src ) < num_nodes, "invalid source node" );
		_offsets[src + 1]++;
	}

	for( size_ i = 0; i < num_nodes; i++ ) _offsets[i + 1] += _offsets[i];

	// counting sort, stable w.r.t. edge insertion order
	std::vector<size_> fill( _offsets.begin(), _offsets.end() - 1 );
	for( size_ i = 0; i < sources.size(); i++ ) _edges[fill[sources[i]]++] = narrow<int_>( i );
}


nonstd::span<int_ const> adj_list::neighbors( size_ i_node ) const
{
	eqnet_assert( i_node < num_nodes(), "index out of bounds" );

	return { _edges.data() + _offsets[i_node], degree( i_node ) };
}

size_ adj_list::degree( size_ i_node ) const
{
	eqnet_assert( i_node < num_nodes(), "index out of bounds" );

	return _offsets[i_node + 1] - _offsets[i_node];
}

size_ adj_list::num_nodes() const { return _offsets.size() - 1; }
size_ adj_list::num_edges() const { return _edges.size(); }
} // namespace eqnet::util
