#pragma once

#include <eqnet/equation.h>
#include <eqnet/expr/expression.h>
#include <eqnet/expr/symbols.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace eqnet
{
// Textual definition of a neuron model as supplied by the host.
struct model_desc
{
	std::string name;
	// (name, initial value). The first entry is the primary state variable
	// (membrane potential): bare update/reset expressions assign to it.
	std::vector<std::pair<std::string, double>> state;
	// (name, default value)
	std::vector<std::pair<std::string, double>> params;
	// 'x = ...', 'dx/dt = ...' or a bare expression, applied simultaneously
	std::vector<std::string> update;
	// spike condition, satisfied iff its value is non-zero and not NaN
	std::string threshold;
	// 'x = ...' or a bare expression, applied simultaneously after a spike
	std::vector<std::string> reset;
	// duration after a spike during which update and threshold are skipped
	double refractory = 0.0;
	// state variable that accumulates synaptic input, empty: primary variable
	std::string input;
};


// A compiled neuron model. Immutable; shared read-only by every neuron that
// uses it. Expressions are evaluated against a slot array laid out as
//   [ state variables | parameters | t | dt | I_ext ]
class model
{
public:
	struct rule
	{
		int_ target; // state slot
		equation_kind kind;
		std::string unit;
		expr::expression rhs;
	};

	// Throws compile_error (any kind).
	explicit model( model_desc const & desc );

	std::string const & name() const;
	expr::symbol_table const & symbols() const;

	size_ num_state() const;
	size_ num_params() const;
	size_ num_slots() const;

	int_ time_slot() const;
	int_ dt_slot() const;
	int_ external_slot() const;
	// state slot that receives synaptic deliveries
	int_ input() const;

	std::vector<double> const & initial_state() const;
	std::vector<double> const & defaults() const;
	// index into defaults(), -1 if there is no such parameter
	int_ param_index( std::string_view name ) const;

	std::vector<rule> const & update() const;
	expr::expression const & threshold() const;
	std::vector<rule> const & reset() const;
	double refractory() const;

private:
	std::string _name;
	expr::symbol_table _symbols;
	std::vector<double> _initial;
	std::vector<double> _defaults;
	std::vector<rule> _update;
	expr::expression _threshold;
	std::vector<rule> _reset;
	double _refractory;
	int_ _input;
};

using model_ptr = std::shared_ptr<model const>;

// Compiles desc once, the result can back any number of neurons.
model_ptr compile_model( model_desc const & desc );

// Names bound in every model in addition to its state and parameters.
std::vector<std::string> const & builtin_identifiers();
} // namespace eqnet
