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
#include "Memory.hpp"

namespace FailSafe
{
  MemoryStore::MemoryStore( std::string name )
    : m_name( std::move( name ) )
  {}

  std::string MemoryStore::label() const
  {
    return "memory:" + m_name;
  }

  bool MemoryStore::contains( const std::string &name ) const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_snapshots.find( name ) != m_snapshots.end();
  }

  std::size_t MemoryStore::size() const
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_snapshots.size();
  }

  std::optional< std::string > MemoryStore::load_data( const std::string &name )
  {
    std::lock_guard< std::mutex > lock( m_mutex );

    auto pos = m_snapshots.find( name );
    if ( pos == m_snapshots.end() )
      return std::nullopt;

    return pos->second;
  }

  void MemoryStore::save_data( const std::string &name, const std::string &bytes )
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    m_snapshots[name] = bytes;
  }

  void MemoryStore::wipe( const std::string &name )
  {
    std::lock_guard< std::mutex > lock( m_mutex );
    m_snapshots.erase( name );
  }
}
