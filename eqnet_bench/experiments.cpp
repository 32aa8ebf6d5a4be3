#include <benchmark/benchmark.h>

#include <eqnet/cpu/snn.h>
#include <eqnet/expr/expression.h>
#include <eqnet/generate.h>
#include <eqnet/models/izhikevich.h>
#include <eqnet/models/lif.h>
#include <eqnet/util/type_traits.h>
#include <eqnet_bench/exp_range.h>

#include <utility>
#include <vector>


using namespace eqnet;
using namespace eqnet::util;


static void compile_expr( benchmark::State & state )
{
	std::vector<std::string> const known{ "v", "u", "a", "b", "I_ext" };

	for( auto _ : state )
		benchmark::DoNotOptimize( expr::compile( "0.04 * v^2 + 5 * v + 140 - u + I_ext", known ) );
}
BENCHMARK( compile_expr );

static void eval_expr( benchmark::State & state )
{
	auto const e = expr::compile(
	    "0.04 * v^2 + 5 * v + 140 - u + I_ext + max(a, b) * exp(-v / 10)",
	    std::vector<std::string>{ "v", "u", "a", "b", "I_ext" } );
	double const slots[] = { -65.0, -13.0, 0.02, 0.2, 10.0 };

	for( auto _ : state ) benchmark::DoNotOptimize( e.eval( slots ) );
}
BENCHMARK( eval_expr );

template <typename Model>
static void step( benchmark::State & state )
{
	double const P = 0.02;
	size_ const N = narrow_cast<size_>( state.range( 0 ) );

	topology topo;
	topo.add_neurons( compile_model( Model::desc() ), N );
	generate_random( topo, 0, N, P, 2.0, 1.0 );

	cpu::snn net( std::move( topo ), { 0.5 } );
	for( size_ i = 0; i < N; i += 10 ) net.set_input( i, 15.0 );

	state.counters["num_neurons"] = narrow_cast<double>( N );
	state.counters["num_syn"] = narrow_cast<double>( net.num_synapses() );

	size_ nspikes = 0;
	for( auto _ : state ) nspikes += net.step().size();

	state.counters["spikes_per_step"] =
	    benchmark::Counter( narrow_cast<double>( nspikes ), benchmark::Counter::kAvgIterations );
}
BENCHMARK_TEMPLATE( step, models::izhikevich )->Unit( benchmark::kMicrosecond )->ExpRange( 100, 3200 );
BENCHMARK_TEMPLATE( step, models::lif )->Unit( benchmark::kMicrosecond )->ExpRange( 100, 3200 );
