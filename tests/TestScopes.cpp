/*
 *
 *                        Kokkos v. 3.0
 *       Copyright (2020) National Technology & Engineering
 *               Solutions of Sandia, LLC (NTESS).
 *
 * Under the terms of Contract DE-NA0003525 with NTESS,
 * the U.S. Government retains certain rights in this software.
 *
 * Kokkos is licensed under 3-clause BSD terms of use:
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * 1. Redistributions of source code must retain the above copyright
 * notice, this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright
 * notice, this list of conditions and the following disclaimer in the
 * documentation and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the Corporation nor the names of the
 * contributors may be used to endorse or promote products derived from
 * this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY NTESS "AS IS" AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL NTESS OR THE
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * Questions? Contact Christian R. Trott (crtrott@sandia.gov)
 */
#include "TestCommon.hpp"

#include <vector>

using FailSafe::MapScope;
using FailSafe::ReferenceScope;
using FailSafe::VariableMapping;

TEST( TestMapScope, restore_merges )
{
  MapScope scope( { { "a", 1 }, { "b", std::string{ "keep" } } } );

  scope.restore_bindings( { { "a", 10 }, { "c", 2.5 } } );

  EXPECT_EQ( scope.get_as< int >( "a" ), 10 );
  EXPECT_EQ( scope.get_as< std::string >( "b" ), "keep" );
  EXPECT_DOUBLE_EQ( scope.get_as< double >( "c" ), 2.5 );
  EXPECT_EQ( scope.vars().size(), 3u );
}

TEST( TestMapScope, accessors )
{
  MapScope scope;
  scope.set( "x", 3 );

  EXPECT_TRUE( scope.contains( "x" ) );
  EXPECT_THROW( scope.get( "y" ), std::out_of_range );
  EXPECT_THROW( scope.get_as< double >( "x" ), FailSafe::ValueTypeMismatch );

  auto captured = scope.capture_bindings();
  scope.erase( "x" );
  EXPECT_FALSE( scope.contains( "x" ) );
  EXPECT_EQ( captured.at( "x" ).as< int >(), 3 );
}

TEST( TestReferenceScope, capture_and_restore )
{
  int step = 4;
  std::vector< double > field{ 1.0, 2.0 };

  ReferenceScope scope;
  scope.bind( "step", step ).bind( "field", field );

  auto captured = scope.capture_bindings();
  EXPECT_EQ( captured.at( "step" ).as< int >(), 4 );

  step = 0;
  field.clear();
  scope.restore_bindings( captured );

  EXPECT_EQ( step, 4 );
  EXPECT_EQ( field, ( std::vector< double >{ 1.0, 2.0 } ) );
}

TEST( TestReferenceScope, ignores_unbound_names )
{
  int step = 1;
  ReferenceScope scope;
  scope.bind( "step", step );

  EXPECT_NO_THROW( scope.restore_bindings( { { "step", 9 }, { "other", 2 } } ) );
  EXPECT_EQ( step, 9 );

  scope.unbind( "step" );
  EXPECT_FALSE( scope.is_bound( "step" ) );
  EXPECT_TRUE( scope.capture_bindings().empty() );
}

TEST( TestReferenceScope, type_mismatch )
{
  int step = 1;
  ReferenceScope scope;
  scope.bind( "step", step );

  try {
    scope.restore_bindings( { { "step", std::string{ "nine" } } } );
    FAIL() << "expected ValueTypeMismatch";
  } catch ( const FailSafe::ValueTypeMismatch &e ) {
    EXPECT_NE( std::string( e.what() ).find( "step" ), std::string::npos );
  }
  EXPECT_EQ( step, 1 );
}
