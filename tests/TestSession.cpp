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
#include "TestCommon.hpp"

#include <stdexcept>

using FailSafe::CheckpointSession;
using FailSafe::ExitPolicy;
using FailSafe::MemoryStore;

namespace
{
  struct WorkFailed : std::runtime_error
  {
    WorkFailed() : std::runtime_error( "work failed" ) {}
  };

  //Capturing throws something that is not a std::exception
  class UncapturableScope : public FailSafe::MapScope
  {
  public:
    FailSafe::VariableMapping capture_bindings() override
    {
      throw 42;
    }
  };
}

TEST( TestSession, open_without_stores )
{
  CheckpointSession session( "job" );
  RecordingScope scope;

  EXPECT_THROW( session.open( scope ), FailSafe::NoStorageConfigured );
  EXPECT_FALSE( session.is_open() );
  EXPECT_EQ( scope.restore_calls, 0 );
}

TEST( TestSession, state_operations_without_stores )
{
  CheckpointSession session( "job" );

  EXPECT_THROW( session.save_state( { { "count", 6 } } ), FailSafe::NoStorageConfigured );
  EXPECT_THROW( session.wipe_state(), FailSafe::NoStorageConfigured );
  EXPECT_THROW( session.load_state(), FailSafe::NoStorageConfigured );
}

TEST( TestSession, open_and_close_pairing )
{
  MemoryStore store;
  CheckpointSession session( "job" );
  session.uses( store );

  FailSafe::MapScope scope;

  EXPECT_THROW( session.close( false ), FailSafe::SessionNotOpen );

  session.open( scope );
  EXPECT_TRUE( session.is_open() );
  EXPECT_THROW( session.open( scope ), FailSafe::SessionAlreadyOpen );

  session.close( false );
  EXPECT_FALSE( session.is_open() );
  EXPECT_THROW( session.close( false ), FailSafe::SessionNotOpen );
}

TEST( TestSession, empty_name_uses_default )
{
  CheckpointSession session( "" );

  EXPECT_EQ( session.name(), "savedstate" );
}

TEST( TestSession, failed_work_resumes_next_attempt )
{
  MemoryStore store;
  store.save( "job-42", { { "count", 5 } } );

  CheckpointSession session( "job-42" );
  session.attach( "count" ).uses( store );

  FailSafe::MapScope scope;
  EXPECT_THROW( session.run( scope, [&]() {
                  EXPECT_EQ( scope.get_as< int >( "count" ), 5 );
                  scope.set( "count", scope.get_as< int >( "count" ) + 1 );
                  scope.set( "scratch", 1.0 );
                  throw WorkFailed{};
                } ),
                WorkFailed );

  EXPECT_FALSE( session.is_open() );

  auto saved = store.load( "job-42" );
  ASSERT_TRUE( saved.has_value() );
  EXPECT_EQ( saved->size(), 1u );
  EXPECT_EQ( saved->at( "count" ).as< int >(), 6 );

  FailSafe::MapScope next;
  session.open( next );
  EXPECT_EQ( next.get_as< int >( "count" ), 6 );
  session.close( false );
}

TEST( TestSession, success_wipes_snapshot )
{
  MemoryStore store;
  store.save( "job", { { "i", 1 } } );

  CheckpointSession session( "job" );
  session.uses( store );

  RecordingScope scope;
  session.run( scope, [&]() { scope.set( "i", 2 ); } );

  EXPECT_EQ( scope.restore_calls, 1 );
  EXPECT_FALSE( store.contains( "job" ) );
}

TEST( TestSession, success_retains_snapshot )
{
  MemoryStore store;

  CheckpointSession session( "job" );
  session.uses( store ).when_complete( ExitPolicy::retain_on_success );

  RecordingScope scope;
  session.run( scope, [&]() { scope.set( "i", 2 ); } );

  //Nothing to restore on the first attempt
  EXPECT_EQ( scope.restore_calls, 0 );
  ASSERT_TRUE( store.contains( "job" ) );
  EXPECT_EQ( store.load( "job" )->at( "i" ).as< int >(), 2 );
}

TEST( TestSession, reset_discards_snapshot )
{
  MemoryStore store;
  store.save( "job", { { "i", 7 } } );

  CheckpointSession session( "job" );
  session.uses( store ).reset_if( true );

  RecordingScope scope;
  session.open( scope );

  EXPECT_EQ( scope.restore_calls, 0 );
  EXPECT_FALSE( store.contains( "job" ) );
  session.close( false );
}

TEST( TestSession, reset_predicate_evaluated_on_every_open )
{
  MemoryStore store;
  int calls = 0;

  CheckpointSession session( "job" );
  session.uses( store ).reset_if( [&calls]() { return ++calls == 2; } );

  store.save( "job", { { "i", 1 } } );

  RecordingScope first;
  session.open( first );
  EXPECT_EQ( first.restore_calls, 1 );
  session.close( true );

  RecordingScope second;
  session.open( second );
  EXPECT_EQ( second.restore_calls, 0 );
  session.close( true );

  RecordingScope third;
  session.open( third );
  EXPECT_EQ( third.restore_calls, 1 );
  session.close( false );

  EXPECT_EQ( calls, 3 );
}

TEST( TestSession, earlier_store_wins )
{
  MemoryStore primary( "primary" ), secondary( "secondary" );
  primary.save( "job", { { "i", 1 } } );
  secondary.save( "job", { { "i", 2 } } );

  CheckpointSession session( "job" );
  session.uses( primary, secondary );

  auto loaded = session.load_state();
  ASSERT_TRUE( loaded.has_value() );
  EXPECT_EQ( loaded->at( "i" ).as< int >(), 1 );
}

TEST( TestSession, falls_through_to_later_stores )
{
  MemoryStore empty( "empty" ), corrupt( "corrupt" ), good( "good" );
  corrupt.save_encoded( "job", "not a snapshot" );
  good.save( "job", { { "i", 3 } } );

  CheckpointSession session( "job" );
  session.uses( empty, corrupt, good );

  auto loaded = session.load_state();
  ASSERT_TRUE( loaded.has_value() );
  EXPECT_EQ( loaded->at( "i" ).as< int >(), 3 );
}

TEST( TestSession, attached_names_filter_both_ways )
{
  MemoryStore store;
  store.save( "job", { { "keep", 1 }, { "drop", 2 } } );

  CheckpointSession session( "job" );
  session.attach( "keep", "other" ).uses( store );

  RecordingScope scope;
  session.open( scope );
  EXPECT_EQ( scope.last_restored.size(), 1u );
  EXPECT_TRUE( scope.contains( "keep" ) );
  EXPECT_FALSE( scope.contains( "drop" ) );

  scope.set( "other", 5 );
  scope.set( "unrelated", 6 );
  session.close( true );

  auto saved = store.load( "job" );
  ASSERT_TRUE( saved.has_value() );
  EXPECT_EQ( saved->size(), 2u );
  EXPECT_EQ( saved->count( "unrelated" ), 0u );
}

TEST( TestSession, no_attachments_keeps_everything )
{
  MemoryStore store;
  CheckpointSession session( "job" );
  session.uses( store );

  session.save_state( { { "a", 1 }, { "b", std::string{ "two" } } } );

  EXPECT_EQ( session.load_state()->size(), 2u );
}

TEST( TestSession, detach_and_duplicate_stores )
{
  MemoryStore store;
  CheckpointSession session( "job" );
  session.attach( "a", "b" ).detach( "a" ).uses( store, store );
  session.uses_all( { &store } );

  EXPECT_EQ( session.stores().size(), 1u );
  EXPECT_EQ( session.filter().names(), std::vector< std::string >{ "b" } );
  EXPECT_THROW( session.attach( 3 ), FailSafe::BadAttachmentArgument );
}

TEST( TestSession, one_failing_store_does_not_block_others )
{
  FailingStore broken;
  MemoryStore store;

  CheckpointSession session( "job" );
  session.uses( broken, store );

  try {
    session.save_state( { { "i", 9 } } );
    FAIL() << "expected FanOutError";
  } catch ( const FailSafe::FanOutError &e ) {
    EXPECT_EQ( e.session(), "job" );
    EXPECT_EQ( e.operation(), "save" );
    ASSERT_EQ( e.failures().size(), 1u );
    EXPECT_EQ( e.failures().front().store, "failing" );
  }

  EXPECT_EQ( store.load( "job" )->at( "i" ).as< int >(), 9 );

  EXPECT_THROW( session.wipe_state(), FailSafe::FanOutError );
  EXPECT_FALSE( store.contains( "job" ) );
}

TEST( TestSession, unencodable_state_writes_nothing )
{
  struct Opaque
  {
    int handle;
  };

  MemoryStore first( "first" ), second( "second" );
  CheckpointSession session( "job" );
  session.uses( first, second );

  EXPECT_THROW( session.save_state( { { "h", Opaque{ 1 } }, { "i", 2 } } ), FailSafe::EncodeError );
  EXPECT_EQ( first.size(), 0u );
  EXPECT_EQ( second.size(), 0u );
}

TEST( TestSession, failure_to_save_keeps_original_error )
{
  FailingStore broken;
  CheckpointSession session( "job" );
  session.uses( broken );

  FailSafe::MapScope scope;
  EXPECT_THROW( session.run( scope, []() { throw WorkFailed{}; } ), WorkFailed );
  EXPECT_FALSE( session.is_open() );

  //On success the wipe failure is not hidden
  EXPECT_THROW( session.run( scope, []() {} ), FailSafe::FanOutError );
}

TEST( TestSession, unknown_capture_failure_keeps_original_error )
{
  MemoryStore store;
  CheckpointSession session( "job" );
  session.uses( store );

  UncapturableScope scope;
  EXPECT_THROW( session.run( scope, []() { throw WorkFailed{}; } ), WorkFailed );
  EXPECT_FALSE( session.is_open() );
  EXPECT_FALSE( store.contains( "job" ) );
}

TEST( TestSession, constructor_shortcut )
{
  MemoryStore store;
  CheckpointSession session( "job", { "x" }, { &store } );

  EXPECT_EQ( session.filter().names(), std::vector< std::string >{ "x" } );
  ASSERT_EQ( session.stores().size(), 1u );
  EXPECT_EQ( session.stores().front(), &store );
}

class TestSessionOnDisk : public ScratchDirTest
{
};

TEST_F( TestSessionOnDisk, resumes_loop_through_references )
{
  FailSafe::LocalFileStore disk( m_dir );
  FailSafe::MemoryStore mem;

  CheckpointSession session( "loop" );
  session.attach( "i", "sum" ).uses( disk, mem );

  int i = 0;
  long sum = 0;
  FailSafe::ReferenceScope scope;
  scope.bind( "i", i ).bind( "sum", sum );

  auto attempt = [&]( int fail_at ) {
    session.run( scope, [&]() {
      for ( ; i < 10; ++i )
      {
        if ( i == fail_at )
          throw WorkFailed{};
        sum += i;
      }
    } );
  };

  EXPECT_THROW( attempt( 4 ), WorkFailed );
  EXPECT_TRUE( std::filesystem::exists( m_dir / "loop.snapshot" ) );
  EXPECT_TRUE( mem.contains( "loop" ) );

  i = 0;
  sum = 0;
  attempt( -1 );

  EXPECT_EQ( i, 10 );
  EXPECT_EQ( sum, 45 );
  EXPECT_EQ( file_count(), 0u );
  EXPECT_FALSE( mem.contains( "loop" ) );
}
