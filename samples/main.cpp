#include <eqnet/cpu/snn.h>
#include <eqnet/generate.h>
#include <eqnet/models/izhikevich.h>
#include <eqnet/models/lif.h>
#include <eqnet/recorder.h>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <utility>


using namespace eqnet;


// Usage: eqnet_samples {izhikevich|lif} [neuron-count] [iter-count] [out-file]
int main( int const argc, char const ** argv )
{
	if( argc != 5 )
	{
		std::printf( "Usage: eqnet_samples {izhikevich|lif} [neuron-count] [iter-count] [out-file]\n" );
		return EXIT_FAILURE;
	}

	if( char const * level = std::getenv( "EQNET_LOG_LEVEL" ) )
		spdlog::set_level( spdlog::level::from_str( level ) );

	size_ const NNEURON = std::strtoul( argv[2], nullptr, 10 );
	size_ const NITER = std::strtoul( argv[3], nullptr, 10 );

	if( NNEURON == 0 )
	{
		spdlog::error( "neuron-count must be > 0" );
		return EXIT_FAILURE;
	}

	try
	{
		model_desc desc;
		if( !std::strcmp( argv[1], "izhikevich" ) )
			desc = models::izhikevich::desc();
		else if( !std::strcmp( argv[1], "lif" ) )
			desc = models::lif::desc();
		else
		{
			spdlog::error( "unknown model '{}'", argv[1] );
			return EXIT_FAILURE;
		}

		// 80% excitatory, 20% inhibitory, sparse random recurrence
		size_ const NEXC = NNEURON * 4 / 5;
		topology topo;
		topo.add_neurons( compile_model( desc ), NNEURON );
		generate_random( topo, 0, NEXC, 0.02, 2.0, 1.0 );
		if( NNEURON > NEXC )
			generate_random(
			    topo, static_cast<int_>( NEXC ), NNEURON - NEXC, 0.02, 4.0, 1.0, 1338, synapse_type::inhibitory );

		cpu::snn net( std::move( topo ), { 0.5 } );
		for( size_ i = 0; i < NNEURON; i += 5 ) net.set_input( i, 15.0 );

		std::ofstream file( argv[4] );
		file << net.num_neurons() << std::endl;

		spike_recorder rec( net.num_neurons() );
		for( size_ i = 0; i < NITER; i++ )
		{
			// Advance by a single step, write out the ids of all neurons that fired.
			auto const spikes = net.advance( 1 );
			rec.record( spikes );

			auto delim = "";
			for( auto const & s : spikes )
			{
				file << delim << s.neuron;
				delim = ",";
			}
			file << std::endl;

			if( i % 100 == 99 ) std::cout << "\r" << 100 * ( i + 1 ) / NITER << "% done" << std::flush;
		}

		std::cout << "\nAvg. ratio of neurons firing: "
		          << ( NITER ? (double)rec.total() / NITER / net.num_neurons() * 100 : 0.0 ) << "%"
		          << std::endl;
	}
	catch( std::exception & e )
	{
		spdlog::error( "{}", e.what() );
		return EXIT_FAILURE;
	}

	return 0;
}
