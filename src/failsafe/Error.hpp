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
#ifndef INC_FAILSAFE_ERROR_HPP
#define INC_FAILSAFE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace FailSafe
{
  struct Error : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  struct NoStorageConfigured : Error
  {
    explicit NoStorageConfigured( const std::string &session )
      : Error( "no storage registered for session '" + session
               + "'; nowhere to store state on failure, add stores with uses()" )
    {}
  };

  struct InvalidStorageTarget : Error
  {
    explicit InvalidStorageTarget( const std::string &what )
      : Error( "invalid storage target: " + what )
    {}
  };

  struct SessionAlreadyOpen : Error
  {
    explicit SessionAlreadyOpen( const std::string &session )
      : Error( "session '" + session + "' is already open" )
    {}
  };

  struct SessionNotOpen : Error
  {
    explicit SessionNotOpen( const std::string &session )
      : Error( "session '" + session + "' is not open" )
    {}
  };

  //Usually the variable itself was passed instead of its name
  struct BadAttachmentArgument : Error
  {
    explicit BadAttachmentArgument( const std::string &what )
      : Error( "bad attachment argument: " + what
               + "; attach() takes variable names, not the variables themselves" )
    {}
  };

  struct EncodeError : Error
  {
    explicit EncodeError( const std::string &what )
      : Error( "encode error: " + what )
    {}
  };

  struct DecodeError : Error
  {
    explicit DecodeError( const std::string &what )
      : Error( "decode error: " + what )
    {}
  };

  struct ValueTypeMismatch : Error
  {
    explicit ValueTypeMismatch( const std::string &what )
      : Error( what )
    {}

    ValueTypeMismatch( const std::string &held, const std::string &requested )
      : Error( "value holds " + held + ", requested " + requested )
    {}
  };

  struct StoreError : Error
  {
    StoreError( const std::string &store, const std::string &what )
      : Error( store + ": " + what ), m_store( store )
    {}

    const std::string &store() const noexcept { return m_store; }

  private:
    std::string m_store;
  };

  struct StoreFailure
  {
    std::string store;
    std::string message;
  };

  //Raised once every store of a save or wipe has finished, listing each store that failed
  class FanOutError : public Error
  {
  public:
    FanOutError( const std::string &session, const std::string &operation,
                 std::vector< StoreFailure > failures, std::size_t store_count );

    const std::string &session() const noexcept { return m_session; }
    const std::string &operation() const noexcept { return m_operation; }
    const std::vector< StoreFailure > &failures() const noexcept { return m_failures; }

  private:
    std::string m_session;
    std::string m_operation;
    std::vector< StoreFailure > m_failures;
  };
}

#endif  // INC_FAILSAFE_ERROR_HPP
