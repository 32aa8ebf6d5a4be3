#include "eqnet.h"

#include <utility>


namespace eqnet
{
compiled_equation compile_equation( std::string_view text, std::vector<std::string> const & known )
{
	auto eq = parse_equation( text );

	expr::symbol_table symbols( known );
	if( !eq.target.empty() && !symbols.find( eq.target ) ) throw unknown_identifier_error( eq.target, 0 );

	return { eq.target, eq.kind, eq.unit, expr::compile( std::move( eq.rhs ), eq.source, symbols ) };
}

std::unique_ptr<snn> build_network(
    std::vector<population> const & populations,
    std::vector<synapse> const & synapses,
    sim_config const & cfg /* = {} */ )
{
	topology topo;
	for( auto const & pop : populations ) topo.add_neurons( pop );
	for( auto const & syn : synapses ) topo.connect( syn.src, syn.dst, syn.weight, syn.delay, syn.type );

	return build_network( std::move( topo ), cfg );
}

std::unique_ptr<snn> build_network( topology topo, sim_config const & cfg /* = {} */ )
{
	validate( cfg );
	return std::make_unique<cpu::snn>( std::move( topo ), cfg );
}
} // namespace eqnet
