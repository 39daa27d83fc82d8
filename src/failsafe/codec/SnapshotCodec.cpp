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
#include "SnapshotCodec.hpp"

#include <cstring>
#include <istream>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <vector>

#include <boost/crc.hpp>

namespace FailSafe
{
  namespace
  {
    constexpr char snapshot_magic[4] = { 'F', 'S', 'N', 'P' };
    constexpr std::size_t header_size = sizeof( snapshot_magic ) + 2 * sizeof( std::uint32_t );

    struct TypeRegistry
    {
      std::mutex mutex;
      std::unordered_map< std::type_index, std::string > tags;
      std::unordered_map< std::string, std::pair< std::type_index, SnapshotCodec::decoder_t > > decoders;

      template< typename T >
      void add( const std::string &tag )
      {
        tags.emplace( typeid( T ), tag );
        decoders.emplace( tag, std::make_pair( std::type_index( typeid( T ) ), Impl::make_decoder< T >() ) );
      }

      TypeRegistry()
      {
        add< bool >( "bool" );
        add< char >( "char" );
        add< int >( "int" );
        add< unsigned int >( "uint" );
        add< long >( "long" );
        add< unsigned long >( "ulong" );
        add< long long >( "longlong" );
        add< unsigned long long >( "ulonglong" );
        add< float >( "float" );
        add< double >( "double" );
        add< std::string >( "string" );
        add< std::vector< int > >( "vector<int>" );
        add< std::vector< long > >( "vector<long>" );
        add< std::vector< double > >( "vector<double>" );
        add< std::vector< std::string > >( "vector<string>" );
        add< std::map< std::string, int > >( "map<string,int>" );
        add< std::map< std::string, double > >( "map<string,double>" );
        add< std::map< std::string, std::string > >( "map<string,string>" );
      }
    };

    TypeRegistry &registry()
    {
      static TypeRegistry reg;
      return reg;
    }

    std::string tag_for( const std::string &name, const std::type_info &type )
    {
      auto &reg = registry();
      std::lock_guard< std::mutex > lock( reg.mutex );

      auto pos = reg.tags.find( type );
      if ( pos == reg.tags.end() )
        throw EncodeError( "variable '" + name + "' has unregistered type " + type.name() );

      return pos->second;
    }

    SnapshotCodec::decoder_t decoder_for( const std::string &name, const std::string &tag )
    {
      auto &reg = registry();
      std::lock_guard< std::mutex > lock( reg.mutex );

      auto pos = reg.decoders.find( tag );
      if ( pos == reg.decoders.end() )
        throw DecodeError( "variable '" + name + "' has unknown type tag '" + tag + "'" );

      return pos->second.second;
    }

    template< typename T >
    void write_pod( std::ostream &out, T val )
    {
      out.write( reinterpret_cast< const char * >( &val ), sizeof( T ) );
    }

    void write_string( std::ostream &out, const std::string &str )
    {
      write_pod< std::uint64_t >( out, str.size() );
      out.write( str.data(), str.size() );
    }

    template< typename T >
    T read_pod( std::istream &in )
    {
      T val{};
      if ( !in.read( reinterpret_cast< char * >( &val ), sizeof( T ) ) )
        throw DecodeError( "truncated snapshot" );

      return val;
    }

    std::string read_string( std::istream &in, std::size_t total_size )
    {
      auto len = read_pod< std::uint64_t >( in );
      auto pos = static_cast< std::size_t >( in.tellg() );
      if ( len > total_size - pos )
        throw DecodeError( "field length " + std::to_string( len ) + " runs past the end of the snapshot" );

      std::string str( len, '\0' );
      if ( len > 0 && !in.read( &str[0], len ) )
        throw DecodeError( "truncated snapshot" );

      return str;
    }

    std::uint32_t checksum( const char *data, std::size_t size )
    {
      boost::crc_32_type crc;
      crc.process_bytes( data, size );
      return crc.checksum();
    }
  }

  void SnapshotCodec::register_decoder( std::type_index type, const std::string &tag, decoder_t decoder )
  {
    auto &reg = registry();
    std::lock_guard< std::mutex > lock( reg.mutex );

    auto by_type = reg.tags.find( type );
    auto by_tag = reg.decoders.find( tag );

    if ( by_type != reg.tags.end() && by_tag != reg.decoders.end() && by_type->second == tag )
      return;

    if ( by_type != reg.tags.end() )
      throw Error( "type already registered with the snapshot codec as '" + by_type->second + "'" );
    if ( by_tag != reg.decoders.end() )
      throw Error( "snapshot codec tag '" + tag + "' is already taken by another type" );

    reg.tags.emplace( type, tag );
    reg.decoders.emplace( tag, std::make_pair( type, std::move( decoder ) ) );
  }

  bool SnapshotCodec::is_registered( const std::type_info &type )
  {
    auto &reg = registry();
    std::lock_guard< std::mutex > lock( reg.mutex );

    return reg.tags.find( type ) != reg.tags.end();
  }

  std::string SnapshotCodec::encode( const VariableMapping &vars )
  {
    std::ostringstream body( std::ios::binary );
    write_pod< std::uint64_t >( body, vars.size() );

    for ( auto &&entry : vars )
    {
      auto &name = entry.first;
      if ( !entry.second.has_value() )
        throw EncodeError( "variable '" + name + "' holds no value" );

      auto tag = tag_for( name, entry.second.type() );

      std::ostringstream payload( std::ios::binary );
      try {
        entry.second.holder().serialize( payload );
      } catch ( const EncodeError &e ) {
        throw EncodeError( "variable '" + name + "': " + e.what() );
      }
      if ( !payload )
        throw EncodeError( "variable '" + name + "' could not be written" );

      write_string( body, name );
      write_string( body, tag );
      write_string( body, payload.str() );
    }

    auto bytes = body.str();

    std::ostringstream out( std::ios::binary );
    out.write( snapshot_magic, sizeof( snapshot_magic ) );
    write_pod< std::uint32_t >( out, format_version );
    write_pod< std::uint32_t >( out, checksum( bytes.data(), bytes.size() ) );
    out.write( bytes.data(), bytes.size() );

    return out.str();
  }

  VariableMapping SnapshotCodec::decode( const std::string &bytes )
  {
    if ( bytes.size() < header_size )
      throw DecodeError( "snapshot of " + std::to_string( bytes.size() ) + " bytes is too short" );

    if ( std::memcmp( bytes.data(), snapshot_magic, sizeof( snapshot_magic ) ) != 0 )
      throw DecodeError( "not a snapshot (bad magic)" );

    std::uint32_t version, crc;
    std::memcpy( &version, bytes.data() + sizeof( snapshot_magic ), sizeof( version ) );
    std::memcpy( &crc, bytes.data() + sizeof( snapshot_magic ) + sizeof( version ), sizeof( crc ) );

    if ( version != format_version )
      throw DecodeError( "unsupported snapshot format version " + std::to_string( version ) );

    auto body_size = bytes.size() - header_size;
    if ( checksum( bytes.data() + header_size, body_size ) != crc )
      throw DecodeError( "checksum mismatch" );

    std::istringstream body( bytes.substr( header_size ), std::ios::binary );

    VariableMapping vars;
    auto count = read_pod< std::uint64_t >( body );
    for ( std::uint64_t i = 0; i < count; ++i )
    {
      auto name = read_string( body, body_size );
      auto tag = read_string( body, body_size );
      auto payload = read_string( body, body_size );

      auto decoder = decoder_for( name, tag );

      std::istringstream in( payload, std::ios::binary );
      Value value;
      try {
        value = decoder( in );
      } catch ( const std::exception &e ) {
        throw DecodeError( "variable '" + name + "': " + e.what() );
      }

      if ( in.fail() || static_cast< std::size_t >( in.tellg() ) != payload.size() )
        throw DecodeError( "variable '" + name + "' did not consume its " + std::to_string( payload.size() )
                           + " byte payload" );

      vars.emplace( std::move( name ), std::move( value ) );
    }

    if ( body.peek() != std::char_traits< char >::eof() )
      throw DecodeError( "trailing bytes after the last variable" );

    return vars;
  }
}
