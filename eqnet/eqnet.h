#pragma once

#include <eqnet/config.h>
#include <eqnet/cpu/snn.h>
#include <eqnet/equation.h>
#include <eqnet/error.h>
#include <eqnet/expr/expression.h>
#include <eqnet/generate.h>
#include <eqnet/model.h>
#include <eqnet/recorder.h>
#include <eqnet/snn.h>
#include <eqnet/topology.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>


namespace eqnet
{
struct compiled_equation
{
	std::string target; // empty for a bare expression
	equation_kind kind;
	std::string unit;
	expr::expression rhs;
};

// Compiles 'x = ...', 'dx/dt = ...' or a bare expression whose identifiers
// are all among 'known'.
// Throws compile_error (lex, parse, unknown_identifier, arity).
compiled_equation compile_equation( std::string_view text, std::vector<std::string> const & known );

// Validates and instantiates a network. Neuron ids are assigned in
// population order, starting at 0.
// Throws compile_error (definition), topology_error, std::invalid_argument.
std::unique_ptr<snn> build_network(
    std::vector<population> const & populations,
    std::vector<synapse> const & synapses,
    sim_config const & cfg = {} );
std::unique_ptr<snn> build_network( topology topo, sim_config const & cfg = {} );
} // namespace eqnet
