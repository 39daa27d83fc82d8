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
#ifndef INC_FAILSAFE_ATTACHMENTFILTER_HPP
#define INC_FAILSAFE_ATTACHMENTFILTER_HPP

#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "failsafe/Error.hpp"
#include "failsafe/Value.hpp"

namespace FailSafe
{
  /**
   * The names of the variables a session persists and restores.
   *
   * With no names attached every variable passes through project(); once a
   * name is attached only attached names do.
   */
  class AttachmentFilter
  {
  public:
    //Every argument must be a name; anything else throws BadAttachmentArgument
    template< typename... Names >
    void attach( Names &&... names )
    {
      ( attach_one( std::forward< Names >( names ) ), ... );
    }

    template< typename... Names >
    void detach( Names &&... names )
    {
      ( detach_one( std::forward< Names >( names ) ), ... );
    }

    void attach_all( const std::vector< std::string > &names );

    VariableMapping project( const VariableMapping &vars ) const;

    bool empty() const noexcept { return m_names.empty(); }
    bool contains( std::string_view name ) const noexcept;

    //In attachment order
    const std::vector< std::string > &names() const noexcept { return m_names; }

  private:
    template< typename T >
    void attach_one( T &&name )
    {
      if constexpr ( std::is_convertible_v< T &&, std::string_view > )
      {
        add( std::string_view( name ) );
      } else {
        throw BadAttachmentArgument( std::string{ "expected a variable name, got a value of type " }
                                     + typeid( std::decay_t< T > ).name() );
      }
    }

    template< typename T >
    void detach_one( T &&name )
    {
      if constexpr ( std::is_convertible_v< T &&, std::string_view > )
        remove( std::string_view( name ) );
    }

    void add( std::string_view name );
    void remove( std::string_view name ) noexcept;

    std::vector< std::string > m_names;
  };
}

#endif  // INC_FAILSAFE_ATTACHMENTFILTER_HPP
