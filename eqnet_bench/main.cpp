#include <benchmark/benchmark.h>

#include <spdlog/spdlog.h>


int main( int argc, char ** argv )
{
	// keep per-network construction messages out of the timings
	spdlog::set_level( spdlog::level::warn );

	::benchmark::Initialize( &argc, argv );
	if( ::benchmark::ReportUnrecognizedArguments( argc, argv ) ) return 1;

	::benchmark::RunSpecifiedBenchmarks();
	return 0;
}
