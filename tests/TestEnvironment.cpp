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

#include <cstdlib>

using FailSafe::Env::get_flag;
using FailSafe::Env::parse_flag;

TEST( TestEnvironment, parse_flag )
{
  EXPECT_TRUE( parse_flag( "true", false ) );
  EXPECT_TRUE( parse_flag( " TRUE\n", false ) );
  EXPECT_FALSE( parse_flag( "False", true ) );
  EXPECT_TRUE( parse_flag( "1", false ) );
  EXPECT_TRUE( parse_flag( "42", false ) );
  EXPECT_FALSE( parse_flag( "0", true ) );
  EXPECT_FALSE( parse_flag( "000", true ) );
  EXPECT_TRUE( parse_flag( "yes", false ) );
  EXPECT_TRUE( parse_flag( "", true ) );
  EXPECT_FALSE( parse_flag( "   ", false ) );
}

TEST( TestEnvironment, get_flag )
{
  const char *key = "FAILSAFE_TEST_FLAG";

  unsetenv( key );
  EXPECT_TRUE( get_flag( key, true ) );
  EXPECT_FALSE( get_flag( key, false ) );

  setenv( key, "0", 1 );
  EXPECT_FALSE( get_flag( key, true ) );

  setenv( key, "on", 1 );
  EXPECT_TRUE( get_flag( key, false ) );
  EXPECT_EQ( FailSafe::Env::get_string( key ), std::optional< std::string >( "on" ) );

  unsetenv( key );
  EXPECT_FALSE( FailSafe::Env::get_string( key ).has_value() );
}
