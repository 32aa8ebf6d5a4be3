#pragma once

#include <eqnet/util/stdint.h>

#include <nonstd/span.hpp>

#include <vector>


namespace eqnet
{
namespace util
{
// Compressed sparse row adjacency: for every node the indices of its outgoing
// edges, in the order the edges were added.
class adj_list
{
public:
	adj_list() = default;
	// sources[i] is the source node of edge i
	adj_list( size_ num_nodes, std::vector<int_> const & sources );

	nonstd::span<int_ const> neighbors( size_ i_node ) const;
	size_ degree( size_ i_node ) const;

	size_ num_nodes() const;
	size_ num_edges() const;

private:
	std::vector<size_> _offsets{ 0 };
	std::vector<int_> _edges;
};
} // namespace util
} // namespace eqnet
