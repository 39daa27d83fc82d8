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
#include "LocalFile.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>

#include "failsafe/util/Log.hpp"

namespace FailSafe
{
  namespace
  {
    std::mt19937 &random_engine()
    {
      thread_local std::mt19937 engine{ std::random_device{}() };
      return engine;
    }

    std::string random_tag()
    {
      std::uniform_int_distribution< unsigned > dist( 0, 0xffff );
      return fmt::format( "{:04x}", dist( random_engine() ) );
    }

    std::string random_uuid()
    {
      thread_local boost::uuids::random_generator gen;
      return boost::uuids::to_string( gen() );
    }

    std::string timestamp( bool utc, bool date_only )
    {
      auto now = std::chrono::system_clock::now();
      auto tt = std::chrono::system_clock::to_time_t( now );
      auto micros = std::chrono::duration_cast< std::chrono::microseconds >(
          now.time_since_epoch() ).count() % 1000000;

      std::tm tm{};
      if ( utc )
        gmtime_r( &tt, &tm );
      else
        localtime_r( &tt, &tm );

      std::ostringstream str;
      if ( date_only )
      {
        str << std::put_time( &tm, "%Y-%m-%d" );
      } else {
        str << std::put_time( &tm, "%Y-%m-%d %H:%M:%S" ) << '.'
            << std::setw( 6 ) << std::setfill( '0' ) << micros;
      }

      return str.str();
    }

    std::optional< std::string > substitute( const std::string &token )
    {
      if ( token == "now" )
        return timestamp( false, false );
      if ( token == "utcnow" )
        return timestamp( true, false );
      if ( token == "today" )
        return timestamp( false, true );
      if ( token == "dir" )
        return std::filesystem::current_path().parent_path().filename().string();
      if ( token == "rand" )
        return random_tag();
      if ( token == "uuid" )
        return random_uuid();

      return std::nullopt;
    }

    bool ends_with( const std::string &str, const std::string &suffix )
    {
      return str.size() >= suffix.size()
          && str.compare( str.size() - suffix.size(), suffix.size(), suffix ) == 0;
    }
  }

  LocalFileStore::LocalFileStore( path directory, std::string extension )
    : m_directory( std::move( directory ) ), m_extension( std::move( extension ) )
  {
    if ( !m_extension.empty() && m_extension.front() != '.' )
      m_extension.insert( m_extension.begin(), '.' );
  }

  std::string LocalFileStore::expand_tokens( const std::string &name )
  {
    std::string result;
    result.reserve( name.size() );

    std::size_t pos = 0;
    while ( pos < name.size() )
    {
      auto open = name.find( '{', pos );
      if ( open == std::string::npos )
      {
        result.append( name, pos, std::string::npos );
        break;
      }

      auto close = name.find( '}', open + 1 );
      if ( close == std::string::npos )
      {
        result.append( name, pos, std::string::npos );
        break;
      }

      result.append( name, pos, open - pos );

      auto replacement = substitute( name.substr( open + 1, close - open - 1 ) );
      if ( replacement )
        result += *replacement;
      else
        result.append( name, open, close - open + 1 );

      pos = close + 1;
    }

    for ( auto &c : result )
    {
      if ( c == ' ' )
        c = '_';
    }

    return result;
  }

  LocalFileStore::path LocalFileStore::resolve( const std::string &name ) const
  {
    using namespace std::filesystem;

    std::error_code err;
    auto st = status( m_directory, err );
    if ( !exists( st ) )
      throw InvalidStorageTarget( "directory " + absolute( m_directory ).string() + " does not exist" );
    if ( !is_directory( st ) )
      throw InvalidStorageTarget( absolute( m_directory ).string() + " must be a directory" );

    auto filename = expand_tokens( name );
    if ( !ends_with( filename, m_extension ) )
      filename += m_extension;

    return absolute( m_directory / filename );
  }

  std::string LocalFileStore::label() const
  {
    return "local:" + m_directory.string();
  }

  std::optional< std::string > LocalFileStore::load_data( const std::string &name )
  {
    auto filename = resolve( name );

    std::error_code err;
    if ( !std::filesystem::is_regular_file( filename, err ) )
      return std::nullopt;

    std::ifstream file( filename, std::ios::binary );
    if ( !file )
      throw StoreError( label(), "cannot open " + filename.string() + " for reading" );

    std::string bytes{ std::istreambuf_iterator< char >( file ), std::istreambuf_iterator< char >() };
    if ( file.bad() )
      throw StoreError( label(), "error reading " + filename.string() );

    Log::debug( "read {} bytes from {}", bytes.size(), filename.string() );
    return bytes;
  }

  void LocalFileStore::save_data( const std::string &name, const std::string &bytes )
  {
    auto filename = resolve( name );

    //Written beside the target and renamed over it, so readers never see a partial file
    auto staging = filename;
    staging += ".tmp-" + random_tag();

    {
      std::ofstream file( staging, std::ios::binary | std::ios::trunc );
      if ( !file )
        throw StoreError( label(), "cannot open " + staging.string() + " for writing" );

      file.write( bytes.data(), bytes.size() );
      file.flush();
      if ( !file )
      {
        file.close();
        std::error_code ignored;
        std::filesystem::remove( staging, ignored );
        throw StoreError( label(), "error writing " + staging.string() );
      }
    }

    std::error_code err;
    std::filesystem::rename( staging, filename, err );
    if ( err )
    {
      std::error_code ignored;
      std::filesystem::remove( staging, ignored );
      throw StoreError( label(), "cannot move snapshot into place at " + filename.string() + ": " + err.message() );
    }

    Log::debug( "wrote {} bytes to {}", bytes.size(), filename.string() );
  }

  void LocalFileStore::wipe( const std::string &name )
  {
    auto filename = resolve( name );

    std::error_code err;
    std::filesystem::remove( filename, err );
    if ( err )
      throw StoreError( label(), "cannot remove " + filename.string() + ": " + err.message() );
  }
}
