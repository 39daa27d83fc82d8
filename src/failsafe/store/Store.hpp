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
#ifndef INC_FAILSAFE_STORE_STORE_HPP
#define INC_FAILSAFE_STORE_STORE_HPP

#include <optional>
#include <string>

#include "failsafe/Value.hpp"

namespace FailSafe
{
  /**
   * A single durable backend holding at most one snapshot per session name.
   *
   * Derived stores only move bytes; encoding and decoding happen here so that
   * every backend treats a corrupt snapshot the same way. Stores may be
   * driven from several threads at once by a session's save/wipe fan-out.
   */
  class Store
  {
  public:
    virtual ~Store() = default;

    //Empty when nothing is stored under name or the stored bytes do not decode
    std::optional< VariableMapping > load( const std::string &name );

    //Throws EncodeError before anything is written
    void save( const std::string &name, const VariableMapping &vars );

    //Stores a blob produced by SnapshotCodec::encode
    void save_encoded( const std::string &name, const std::string &snapshot );

    //Removing a snapshot that does not exist is not an error
    virtual void wipe( const std::string &name ) = 0;

    //Identifies the store in diagnostics
    virtual std::string label() const = 0;

    //Delete potentially problematic functions for maintaining consistent state
    Store( const Store & ) = delete;
    Store &operator=( const Store & ) = delete;

  protected:
    Store() = default;

    virtual std::optional< std::string > load_data( const std::string &name ) = 0;

    //Must replace any previous snapshot atomically
    virtual void save_data( const std::string &name, const std::string &bytes ) = 0;
  };
}

#endif  // INC_FAILSAFE_STORE_STORE_HPP
