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
#include "Config.hpp"

#include <picojson.h>

#include <fstream>
#include <iterator>

namespace FailSafe
{
  namespace
  {
    Config::Entry parse_json( const picojson::value &json );

    Config::Entry parse_json( const picojson::object &json )
    {
      Config::Entry e;
      for ( auto &&entry : json )
      {
        if ( entry.second.is< picojson::null >() )
          continue;

        e.emplace( entry.first, parse_json( entry.second ) );
      }

      return e;
    }

    Config::Entry parse_json( const picojson::value &json )
    {
      if ( json.is< picojson::object >() )
      {
        return parse_json( json.get< picojson::object >() );
      } else if ( json.is< picojson::array >() ) {
        auto e = Config::Entry::make_array();
        for ( auto &&element : json.get< picojson::array >() )
          e.push_back( parse_json( element ) );
        return e;
      } else if ( json.is< std::string >() ) {
        return Config::Entry( Config::Value( json.get< std::string >() ) );
      } else if ( json.is< bool >() ) {
        return Config::Entry( Config::Value( json.get< bool >() ) );
      } else if ( json.is< double >() ) {
        return Config::Entry( Config::Value( json.get< double >() ) );
      }

      throw ConfigValueError( "unsupported json value " + json.serialize() );
    }

    Config::Entry parse_root( std::istream &instrm, const std::string &source )
    {
      using iter_type = std::istreambuf_iterator< char >;

      picojson::value v;
      std::string err;

      picojson::parse( v, iter_type( instrm ), iter_type{}, &err );
      if ( !err.empty() )
        throw ConfigValueError( source + ": " + err );

      if ( !v.is< picojson::object >() )
        throw ConfigValueError( source + ": top level must be an object" );

      return parse_json( v.get< picojson::object >() );
    }
  }

  Config::Config( const std::filesystem::path &p )
  {
    std::ifstream instrm{ p.string() };
    if ( !instrm )
      throw ConfigValueError( "cannot open configuration file " + p.string() );

    m_root = parse_root( instrm, p.string() );
  }

  Config::Config( std::istream &json )
    : m_root( parse_root( json, "<stream>" ) )
  {}
}
