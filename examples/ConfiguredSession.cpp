#include <Kokkos_Core.hpp>
#include <failsafe/FailSafe.hpp>

#include <fmt/core.h>

int
main( int argc, char **argv )
{
  Kokkos::initialize( argc, argv );
  {
    auto session = FailSafe::make_session( argc > 1 ? argv[1] : "failsafe.json" );

    FailSafe::MapScope scope( { { "iteration", 0 }, { "residual", 1.0 } } );

    session->run( scope, [&]() {
      auto it = scope.get_as< int >( "iteration" );
      auto res = scope.get_as< double >( "residual" );

      for ( ; it < 100 && res > 1e-6; ++it )
        res *= 0.8;

      scope.set( "iteration", it );
      scope.set( "residual", res );
    } );

    fmt::print( "{}: {} iterations, residual {:.3e}\n", session->name(),
                scope.get_as< int >( "iteration" ), scope.get_as< double >( "residual" ) );
  }
  Kokkos::finalize();
}
