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
#ifndef INC_FAILSAFE_SESSION_CHECKPOINTSESSION_HPP
#define INC_FAILSAFE_SESSION_CHECKPOINTSESSION_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "failsafe/AttachmentFilter.hpp"
#include "failsafe/Scope.hpp"
#include "failsafe/config/Config.hpp"
#include "failsafe/store/Store.hpp"

namespace FailSafe
{
  //What happens to the snapshot when the enclosed work completes without error
  enum class ExitPolicy
  {
    delete_on_success,
    retain_on_success
  };

  /**
   * Saves the attached variables of a scope when a unit of work fails and
   * restores them on the next attempt.
   *
   * open() loads the first snapshot found, in the order stores were added,
   * and restores it into the scope. close() either saves the scope's current
   * variables to every store (the work failed, or the policy retains
   * snapshots) or wipes the snapshot from every store. Saves and wipes run
   * concurrently on the Kokkos host execution space; Kokkos must be
   * initialized before a session is opened.
   *
   * Stores are not owned and must outlive the session. A session must not be
   * opened or closed from several threads at once.
   */
  class CheckpointSession
  {
  public:
    using ResetPredicate = std::function< bool() >;

    static constexpr const char *default_name = "savedstate";

    explicit CheckpointSession( std::string name = default_name );
    CheckpointSession( std::string name, const std::vector< std::string > &attached,
                       const std::vector< Store * > &stores );

    virtual ~CheckpointSession() = default;

    template< typename... Names >
    CheckpointSession &attach( Names &&... names )
    {
      m_filter.attach( std::forward< Names >( names )... );
      return *this;
    }

    template< typename... Names >
    CheckpointSession &detach( Names &&... names )
    {
      m_filter.detach( std::forward< Names >( names )... );
      return *this;
    }

    //Earlier stores take priority when loading; adding a store twice has no effect
    template< typename... Stores >
    CheckpointSession &uses( Stores &... stores )
    {
      static_assert( ( std::is_base_of_v< Store, Stores > && ... ),
                     "FailSafe: uses() takes Store instances" );
      ( add_store( &stores ), ... );
      return *this;
    }

    CheckpointSession &uses_all( const std::vector< Store * > &stores );

    CheckpointSession &when_complete( ExitPolicy policy ) noexcept;

    CheckpointSession &reset_if( bool reset );

    //Evaluated again on every open()
    template< typename Predicate,
              typename = std::enable_if_t< std::is_invocable_r_v< bool, Predicate & > > >
    CheckpointSession &reset_if( Predicate &&pred )
    {
      m_reset = ResetPredicate( std::forward< Predicate >( pred ) );
      return *this;
    }

    void open( Scope &scope );
    void close( bool work_failed );

    /**
     * Runs one attempt of work inside the session.
     *
     * An exception from work propagates unchanged once its state is saved; a
     * failure to save it is reported as a warning instead of replacing it.
     */
    template< typename Work >
    void run( Scope &scope, Work &&work )
    {
      open( scope );
      try {
        std::forward< Work >( work )();
      } catch ( ... ) {
        close_after_failure();
        throw;
      }
      close( false );
    }

    //First snapshot found in store order, projected onto the attached names
    std::optional< VariableMapping > load_state() const;

    //Projects vars onto the attached names and saves them to every store
    void save_state( const VariableMapping &vars );

    void wipe_state();

    const std::string &name() const noexcept { return m_name; }
    bool is_open() const noexcept { return m_open; }
    ExitPolicy exit_policy() const noexcept { return m_policy; }
    const std::vector< Store * > &stores() const noexcept { return m_stores; }
    const AttachmentFilter &filter() const noexcept { return m_filter; }

  private:
    void add_store( Store *store );
    void close_after_failure();

    std::string m_name;
    std::vector< Store * > m_stores;
    AttachmentFilter m_filter;
    ExitPolicy m_policy = ExitPolicy::delete_on_success;
    std::optional< ResetPredicate > m_reset;

    bool m_open = false;
    Scope *m_scope = nullptr;
  };

  //The returned session owns the stores the configuration describes
  std::unique_ptr< CheckpointSession > make_session( const Config &cfg );
  std::unique_ptr< CheckpointSession > make_session( const std::filesystem::path &config );
}

#endif  // INC_FAILSAFE_SESSION_CHECKPOINTSESSION_HPP
