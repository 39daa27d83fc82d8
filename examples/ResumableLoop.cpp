#include <Kokkos_Core.hpp>
#include <failsafe/FailSafe.hpp>

#include <fmt/core.h>

#include <cstdlib>
#include <stdexcept>
#include <vector>

//Fails part way through the first run; run it again to finish from where it stopped
int
main( int argc, char **argv )
{
  Kokkos::initialize( argc, argv );
  {
    FailSafe::LocalFileStore disk( "." );

    FailSafe::CheckpointSession session( "resumable_loop" );
    session.attach( "step", "field" ).uses( disk );

    int step = 0;
    std::vector< double > field( 16, 0.0 );

    FailSafe::ReferenceScope scope;
    scope.bind( "step", step ).bind( "field", field );

    const int fail_at = argc > 1 ? std::atoi( argv[1] ) : 7;

    try
    {
      session.run( scope, [&]() {
        if ( step > 0 )
          fmt::print( "resuming at step {}\n", step );

        for ( ; step < 20; ++step )
        {
          if ( step == fail_at )
            throw std::runtime_error( fmt::format( "simulated failure at step {}", step ) );

          for ( auto &v : field )
            v += 0.5 * step;
        }
      } );

      fmt::print( "finished, field[0] = {}\n", field.front() );
    } catch ( const std::runtime_error &e ) {
      fmt::print( stderr, "{}; state saved, run again to resume\n", e.what() );
    }
  }
  Kokkos::finalize();
}
