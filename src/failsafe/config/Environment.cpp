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
#include "Environment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace FailSafe
{
  namespace Env
  {
    std::optional< std::string > get_string( const std::string &key )
    {
      const char *value = std::getenv( key.c_str() );
      if ( !value )
        return std::nullopt;

      return std::string{ value };
    }

    bool parse_flag( const std::string &value, bool default_value ) noexcept
    {
      auto first = value.find_first_not_of( " \t\r\n" );
      if ( first == std::string::npos )
        return default_value;
      auto last = value.find_last_not_of( " \t\r\n" );

      std::string trimmed = value.substr( first, last - first + 1 );
      std::transform( trimmed.begin(), trimmed.end(), trimmed.begin(),
                      []( unsigned char c ) { return static_cast< char >( std::tolower( c ) ); } );

      if ( trimmed == "true" )
        return true;
      if ( trimmed == "false" )
        return false;

      if ( std::all_of( trimmed.begin(), trimmed.end(),
                        []( unsigned char c ) { return std::isdigit( c ); } ) )
        return trimmed.find_first_not_of( '0' ) != std::string::npos;

      return true;
    }

    bool get_flag( const std::string &key, bool default_value ) noexcept
    {
      const char *value = std::getenv( key.c_str() );
      if ( !value )
        return default_value;

      return parse_flag( value, default_value );
    }
  }
}
