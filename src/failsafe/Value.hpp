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
#ifndef INC_FAILSAFE_VALUE_HPP
#define INC_FAILSAFE_VALUE_HPP

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <checkpoint/checkpoint.h>

#include "failsafe/Error.hpp"

namespace FailSafe
{
  namespace Impl
  {
    class ValueBase
    {
    public:
      virtual ~ValueBase() = default;

      virtual const std::type_info &type() const noexcept = 0;

      //Throws EncodeError when the held type has no serializer
      virtual void serialize( std::ostream &out ) = 0;
    };

    template< typename T >
    class ValueHolder : public ValueBase
    {
    public:
      template< typename U >
      explicit ValueHolder( U &&val )
        : m_value( std::forward< U >( val ) )
      {}

      const std::type_info &type() const noexcept override { return typeid( T ); }

      void serialize( std::ostream &out ) override
      {
        if constexpr ( checkpoint::SerializableTraits< T >::is_traversable )
        {
          checkpoint::serializeToStream( m_value, out );
        } else {
          throw EncodeError( std::string{ "no serializer for type " } + typeid( T ).name() );
        }
      }

      const T &value() const noexcept { return m_value; }

    private:
      T m_value;
    };

    //String literals are kept as std::string
    template< typename T >
    using stored_type_t = std::conditional_t<
        std::is_convertible_v< std::decay_t< T >, const char * >,
        std::string,
        std::decay_t< T > >;
  }

  class Value;

  template< typename T >
  inline constexpr bool is_value_v = std::is_same_v< std::decay_t< T >, Value >;

  /**
   * Copyable, type-erased value of one variable.
   *
   * Copies share the held object, which is never modified after construction.
   */
  class Value
  {
  public:
    Value() = default;

    template< typename T, typename = std::enable_if_t< !is_value_v< T > > >
    Value( T &&val )
      : m_holder( std::make_shared< Impl::ValueHolder< Impl::stored_type_t< T > > >(
            std::forward< T >( val ) ) )
    {}

    bool has_value() const noexcept { return static_cast< bool >( m_holder ); }

    const std::type_info &type() const noexcept
    {
      return m_holder ? m_holder->type() : typeid( void );
    }

    template< typename T >
    bool is() const noexcept
    {
      return type() == typeid( T );
    }

    template< typename T >
    const T &as() const
    {
      if ( !is< T >() )
        throw ValueTypeMismatch( type().name(), typeid( T ).name() );

      return static_cast< const Impl::ValueHolder< T > & >( *m_holder ).value();
    }

    Impl::ValueBase &holder() const
    {
      if ( !m_holder )
        throw EncodeError( "empty value" );

      return *m_holder;
    }

  private:
    std::shared_ptr< Impl::ValueBase > m_holder;
  };

  using VariableMapping = std::map< std::string, Value >;
}

#endif  // INC_FAILSAFE_VALUE_HPP
