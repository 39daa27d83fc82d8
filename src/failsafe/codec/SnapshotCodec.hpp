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
#ifndef INC_FAILSAFE_CODEC_SNAPSHOTCODEC_HPP
#define INC_FAILSAFE_CODEC_SNAPSHOTCODEC_HPP

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <typeindex>

#include <checkpoint/checkpoint.h>

#include "failsafe/Value.hpp"

namespace FailSafe
{
  namespace Impl
  {
    template< typename T >
    std::function< Value( std::istream & ) > make_decoder()
    {
      static_assert( checkpoint::SerializableTraits< T >::is_traversable,
                     "FailSafe: registered types must be serializable by magistrate" );

      return []( std::istream &in ) {
        T value{};
        checkpoint::deserializeInPlaceFromStream( in, &value );
        return Value( std::move( value ) );
      };
    }
  }

  /**
   * Turns a VariableMapping into a self-describing byte blob and back.
   *
   * Each value is written with magistrate, tagged with the name its type was
   * registered under so that decode knows what to rebuild. Scalars, strings
   * and the common std containers of them are registered up front; other
   * types must be registered with register_type() before they are saved or
   * loaded.
   *
   * Layout: "FSNP" | u32 format version | u32 crc32(body) | body, with
   * body = u64 entry count, then name, type tag and payload of each entry,
   * each one a u64 length followed by that many bytes.
   */
  class SnapshotCodec
  {
  public:
    using decoder_t = std::function< Value( std::istream & ) >;

    static constexpr std::uint32_t format_version = 1;

    //Registering the same type under the same tag twice is a no-op
    template< typename T >
    static void register_type( const std::string &tag )
    {
      register_decoder( typeid( T ), tag, Impl::make_decoder< T >() );
    }

    static bool is_registered( const std::type_info &type );

    static std::string encode( const VariableMapping &vars );
    static VariableMapping decode( const std::string &bytes );

  private:
    static void register_decoder( std::type_index type, const std::string &tag, decoder_t decoder );
  };
}

#endif  // INC_FAILSAFE_CODEC_SNAPSHOTCODEC_HPP
