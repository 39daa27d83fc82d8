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
#ifndef INC_FAILSAFE_SCOPE_REFERENCESCOPE_HPP
#define INC_FAILSAFE_SCOPE_REFERENCESCOPE_HPP

#include <functional>
#include <map>
#include <string>
#include <type_traits>

#include "failsafe/Scope.hpp"

namespace FailSafe
{
  /**
   * Binds names to variables owned by the caller.
   *
   * capture_bindings() copies the current value of every bound variable and
   * restore_bindings() assigns snapshot values back to them. The variables
   * must outlive the scope.
   */
  class ReferenceScope : public Scope
  {
  public:
    template< typename T >
    ReferenceScope &bind( const std::string &name, T &member )
    {
      static_assert( std::is_copy_assignable_v< T >, "FailSafe: bound variables must be copy-assignable" );

      Binding b;
      b.capture = [&member]() { return Value( member ); };
      b.restore = [&member]( const Value &val ) {
        member = val.as< T >();
      };

      m_bindings[name] = std::move( b );
      return *this;
    }

    ReferenceScope &unbind( const std::string &name );

    bool is_bound( const std::string &name ) const;

    VariableMapping capture_bindings() override;

    //Throws ValueTypeMismatch when a snapshot value has another type than its variable
    void restore_bindings( const VariableMapping &vars ) override;

  private:
    struct Binding
    {
      std::function< Value() > capture;
      std::function< void( const Value & ) > restore;
    };

    std::map< std::string, Binding > m_bindings;
  };
}

#endif  // INC_FAILSAFE_SCOPE_REFERENCESCOPE_HPP
