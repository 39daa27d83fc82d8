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
#ifndef INC_FAILSAFE_STORE_LOCALFILE_HPP
#define INC_FAILSAFE_STORE_LOCALFILE_HPP

#include <filesystem>
#include <string>

#include "failsafe/store/Store.hpp"

namespace FailSafe
{
  /**
   * Keeps each snapshot in its own file under a directory.
   *
   * The session name is a template. These tokens are replaced every time a
   * name is resolved, so volatile ones ({now}, {utcnow}, {rand}, {uuid})
   * point the same name at a new file on each call:
   *
   *   {now}     local time, "YYYY-MM-DD HH:MM:SS.ffffff"
   *   {utcnow}  UTC time, same format
   *   {today}   local date, "YYYY-MM-DD"
   *   {dir}     name of the parent of the working directory
   *   {rand}    4 lowercase hex digits
   *   {uuid}    a random UUID
   *
   * Other braces are left alone. Spaces become underscores and the extension
   * is appended when the name does not already end with it.
   */
  class LocalFileStore : public Store
  {
  public:
    using path = std::filesystem::path;

    static constexpr const char *default_extension = ".snapshot";

    explicit LocalFileStore( path directory = ".", std::string extension = default_extension );

    void wipe( const std::string &name ) override;

    std::string label() const override;

    //Throws InvalidStorageTarget unless the directory exists
    path resolve( const std::string &name ) const;

    static std::string expand_tokens( const std::string &name );

    const path &directory() const noexcept { return m_directory; }
    const std::string &extension() const noexcept { return m_extension; }

  protected:
    std::optional< std::string > load_data( const std::string &name ) override;
    void save_data( const std::string &name, const std::string &bytes ) override;

  private:
    path m_directory;
    std::string m_extension;
  };
}

#endif  // INC_FAILSAFE_STORE_LOCALFILE_HPP
