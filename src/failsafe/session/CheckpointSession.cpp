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
#include "CheckpointSession.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>

#include <Kokkos_Core.hpp>

#include "failsafe/codec/SnapshotCodec.hpp"
#include "failsafe/config/Environment.hpp"
#include "failsafe/store/LocalFile.hpp"
#include "failsafe/store/Memory.hpp"
#include "failsafe/util/Log.hpp"

namespace FailSafe
{
  namespace
  {
    void require_kokkos( const std::string &session )
    {
      if ( !Kokkos::is_initialized() )
        throw Error( "session '" + session + "' needs Kokkos to be initialized" );
    }

    //Runs op once per store, concurrently, and only raises after every store has finished
    template< typename Op >
    void fan_out( const std::string &session, const char *operation,
                  const std::vector< Store * > &stores, Op &&op )
    {
      require_kokkos( session );

      std::vector< std::optional< std::string > > errors( stores.size() );
      auto start = std::chrono::steady_clock::now();

      Kokkos::parallel_for( "FailSafe::fan_out",
          Kokkos::RangePolicy< Kokkos::DefaultHostExecutionSpace >( 0, static_cast< int >( stores.size() ) ),
          [&]( const int i ) {
            try {
              op( *stores[i] );
            } catch ( const std::exception &e ) {
              errors[i] = e.what();
            } catch ( ... ) {
              errors[i] = "unknown error";
            }
          } );
      Kokkos::fence();

      std::vector< StoreFailure > failures;
      for ( std::size_t i = 0; i < stores.size(); ++i )
      {
        if ( errors[i] )
          failures.push_back( StoreFailure{ stores[i]->label(), *errors[i] } );
      }

      auto elapsed = std::chrono::duration< double >( std::chrono::steady_clock::now() - start );
      Log::debug( "{} of '{}' across {} stores took {:.6f}s, {} failed", operation, session,
                  stores.size(), elapsed.count(), failures.size() );

      if ( !failures.empty() )
        throw FanOutError( session, operation, std::move( failures ), stores.size() );
    }

    class OwningSession : public CheckpointSession
    {
    public:
      using CheckpointSession::CheckpointSession;

      void own( std::unique_ptr< Store > store )
      {
        uses( *store );
        m_owned.emplace_back( std::move( store ) );
      }

    private:
      std::vector< std::unique_ptr< Store > > m_owned;
    };

    std::unique_ptr< Store > make_store( const Config::Entry &cfg )
    {
      using fun_type = std::function< std::unique_ptr< Store >( const Config::Entry & ) >;
      static const std::unordered_map< std::string, fun_type > store_types = {
          { "local", []( const Config::Entry &c ) -> std::unique_ptr< Store > {
             auto dir = c.get( "directory" );
             auto ext = c.get( "extension" );
             return std::make_unique< LocalFileStore >(
                 dir ? dir->as< std::string >() : std::string{ "." },
                 ext ? ext->as< std::string >() : std::string{ LocalFileStore::default_extension } );
           } },
          { "memory", []( const Config::Entry &c ) -> std::unique_ptr< Store > {
             auto label = c.get( "label" );
             return std::make_unique< MemoryStore >( label ? label->as< std::string >() : std::string{ "memory" } );
           } } };

      auto &type = cfg["type"].as< std::string >();
      auto pos = store_types.find( type );
      if ( pos == store_types.end() )
        throw ConfigValueError( "stores: unknown store type '" + type + "'" );

      return pos->second( cfg );
    }
  }

  CheckpointSession::CheckpointSession( std::string name )
    : m_name( name.empty() ? std::string{ default_name } : std::move( name ) )
  {}

  CheckpointSession::CheckpointSession( std::string name, const std::vector< std::string > &attached,
                                        const std::vector< Store * > &stores )
    : CheckpointSession( std::move( name ) )
  {
    m_filter.attach_all( attached );
    uses_all( stores );
  }

  void CheckpointSession::add_store( Store *store )
  {
    if ( !store )
      throw InvalidStorageTarget( "null store given to session '" + m_name + "'" );

    if ( std::find( m_stores.begin(), m_stores.end(), store ) == m_stores.end() )
      m_stores.push_back( store );
  }

  CheckpointSession &CheckpointSession::uses_all( const std::vector< Store * > &stores )
  {
    for ( auto *store : stores )
      add_store( store );

    return *this;
  }

  CheckpointSession &CheckpointSession::when_complete( ExitPolicy policy ) noexcept
  {
    m_policy = policy;
    return *this;
  }

  CheckpointSession &CheckpointSession::reset_if( bool reset )
  {
    m_reset = [reset]() { return reset; };
    return *this;
  }

  void CheckpointSession::open( Scope &scope )
  {
    if ( m_stores.empty() )
      throw NoStorageConfigured( m_name );

    if ( m_open )
      throw SessionAlreadyOpen( m_name );

    require_kokkos( m_name );

    if ( m_reset && ( *m_reset )() )
    {
      Log::debug( "reset requested for '{}', discarding stored state", m_name );
      wipe_state();
    }

    auto loaded = load_state();
    if ( loaded )
      scope.restore_bindings( *loaded );

    m_scope = &scope;
    m_open = true;
  }

  void CheckpointSession::close( bool work_failed )
  {
    if ( !m_open )
      throw SessionNotOpen( m_name );

    auto *scope = m_scope;
    m_open = false;
    m_scope = nullptr;

    if ( work_failed || m_policy == ExitPolicy::retain_on_success )
      save_state( scope->capture_bindings() );
    else
      wipe_state();
  }

  void CheckpointSession::close_after_failure()
  {
    try {
      close( true );
    } catch ( const std::exception &e ) {
      Log::warning( "session '{}' could not save state after a failure: {}", m_name, e.what() );
    } catch ( ... ) {
      Log::warning( "session '{}' could not save state after a failure: unknown error", m_name );
    }
  }

  std::optional< VariableMapping > CheckpointSession::load_state() const
  {
    if ( m_stores.empty() )
      throw NoStorageConfigured( m_name );

    for ( auto *store : m_stores )
    {
      auto loaded = store->load( m_name );
      if ( loaded )
      {
        Log::debug( "restoring '{}' from {} ({} variables)", m_name, store->label(), loaded->size() );
        return m_filter.project( *loaded );
      }
    }

    return std::nullopt;
  }

  void CheckpointSession::save_state( const VariableMapping &vars )
  {
    if ( m_stores.empty() )
      throw NoStorageConfigured( m_name );

    //Encoded once, so an unencodable value fails before any store is written
    auto snapshot = SnapshotCodec::encode( m_filter.project( vars ) );

    fan_out( m_name, "save", m_stores, [this, &snapshot]( Store &store ) {
      store.save_encoded( m_name, snapshot );
    } );
  }

  void CheckpointSession::wipe_state()
  {
    if ( m_stores.empty() )
      throw NoStorageConfigured( m_name );

    fan_out( m_name, "wipe", m_stores, [this]( Store &store ) {
      store.wipe( m_name );
    } );
  }

  std::unique_ptr< CheckpointSession > make_session( const Config &cfg )
  {
    auto name = cfg.get( "name" );
    auto session = std::make_unique< OwningSession >(
        name ? name->as< std::string >() : std::string{ CheckpointSession::default_name } );

    if ( auto attach = cfg.get( "attach" ) )
    {
      for ( auto &&entry : attach->elements() )
        session->attach( entry.as< std::string >() );
    }

    if ( auto on_success = cfg.get( "on_success" ) )
    {
      auto &policy = on_success->as< std::string >();
      if ( policy == "delete" )
        session->when_complete( ExitPolicy::delete_on_success );
      else if ( policy == "retain" )
        session->when_complete( ExitPolicy::retain_on_success );
      else
        throw ConfigValueError( "on_success must be \"delete\" or \"retain\", not \"" + policy + "\"" );
    }

    bool reset = false;
    if ( auto reset_cfg = cfg.get( "reset" ) )
    {
      reset = reset_cfg->as< bool >();
      session->reset_if( reset );
    }

    if ( auto reset_env = cfg.get( "reset_env" ) )
    {
      auto var = reset_env->as< std::string >();
      session->reset_if( [reset, var]() { return reset || Env::get_flag( var, false ); } );
    }

    if ( auto verbose = cfg.get( "verbose" ) )
      Log::set_verbose( verbose->as< bool >() );

    for ( auto &&store_cfg : cfg["stores"].elements() )
      session->own( make_store( store_cfg ) );

    return session;
  }

  std::unique_ptr< CheckpointSession > make_session( const std::filesystem::path &config )
  {
    return make_session( Config{ config } );
  }
}
