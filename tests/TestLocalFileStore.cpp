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

#include <regex>

using FailSafe::LocalFileStore;

class TestLocalFileStore : public ScratchDirTest
{
};

TEST_F( TestLocalFileStore, appends_extension )
{
  LocalFileStore store( m_dir );

  EXPECT_EQ( store.resolve( "job" ), std::filesystem::absolute( m_dir / "job.snapshot" ) );
  EXPECT_EQ( store.resolve( "job.snapshot" ), std::filesystem::absolute( m_dir / "job.snapshot" ) );
}

TEST_F( TestLocalFileStore, normalizes_extension )
{
  LocalFileStore store( m_dir, "pickle" );

  EXPECT_EQ( store.extension(), ".pickle" );
  EXPECT_EQ( store.resolve( "job" ).filename(), "job.pickle" );
}

TEST_F( TestLocalFileStore, spaces_become_underscores )
{
  LocalFileStore store( m_dir );

  EXPECT_EQ( store.resolve( "my long job" ).filename(), "my_long_job.snapshot" );
}

TEST( TestNameTemplate, expands_tokens )
{
  EXPECT_TRUE( std::regex_match( LocalFileStore::expand_tokens( "run-{today}" ),
                                 std::regex( R"(run-\d{4}-\d{2}-\d{2})" ) ) );
  EXPECT_TRUE( std::regex_match( LocalFileStore::expand_tokens( "{now}" ),
                                 std::regex( R"(\d{4}-\d{2}-\d{2}_\d{2}:\d{2}:\d{2}\.\d{6})" ) ) );
  EXPECT_TRUE( std::regex_match( LocalFileStore::expand_tokens( "{utcnow}" ),
                                 std::regex( R"(\d{4}-\d{2}-\d{2}_\d{2}:\d{2}:\d{2}\.\d{6})" ) ) );
  EXPECT_TRUE( std::regex_match( LocalFileStore::expand_tokens( "r{rand}" ), std::regex( "r[0-9a-f]{4}" ) ) );
  EXPECT_TRUE( std::regex_match( LocalFileStore::expand_tokens( "{uuid}" ),
                                 std::regex( "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}" ) ) );

  auto parent = std::filesystem::current_path().parent_path().filename().string();
  EXPECT_EQ( LocalFileStore::expand_tokens( "in-{dir}" ), "in-" + parent );
}

TEST( TestNameTemplate, keeps_unknown_tokens )
{
  EXPECT_EQ( LocalFileStore::expand_tokens( "a{bogus}b" ), "a{bogus}b" );
  EXPECT_EQ( LocalFileStore::expand_tokens( "open{brace" ), "open{brace" );
  EXPECT_EQ( LocalFileStore::expand_tokens( "plain" ), "plain" );
}

TEST( TestNameTemplate, volatile_tokens_change_per_call )
{
  EXPECT_NE( LocalFileStore::expand_tokens( "{uuid}" ), LocalFileStore::expand_tokens( "{uuid}" ) );
}

TEST_F( TestLocalFileStore, rejects_missing_directory )
{
  LocalFileStore store( m_dir / "nope" );

  EXPECT_THROW( store.resolve( "job" ), FailSafe::InvalidStorageTarget );
  EXPECT_THROW( store.load( "job" ), FailSafe::InvalidStorageTarget );
  EXPECT_THROW( store.save( "job", { { "i", 1 } } ), FailSafe::InvalidStorageTarget );
}

TEST_F( TestLocalFileStore, rejects_file_as_directory )
{
  write_file( m_dir / "plain.txt", "hello" );
  LocalFileStore store( m_dir / "plain.txt" );

  EXPECT_THROW( store.resolve( "job" ), FailSafe::InvalidStorageTarget );
}

TEST_F( TestLocalFileStore, load_missing )
{
  LocalFileStore store( m_dir );

  EXPECT_FALSE( store.load( "job" ).has_value() );
}

TEST_F( TestLocalFileStore, save_and_overwrite )
{
  LocalFileStore store( m_dir );

  store.save( "job", { { "i", 1 }, { "name", std::string{ "first" } } } );
  store.save( "job", { { "i", 2 } } );

  auto loaded = store.load( "job" );
  ASSERT_TRUE( loaded.has_value() );
  EXPECT_EQ( loaded->size(), 1u );
  EXPECT_EQ( loaded->at( "i" ).as< int >(), 2 );

  //Only the snapshot itself remains, no staging files
  EXPECT_EQ( file_count(), 1u );
  EXPECT_TRUE( std::filesystem::exists( m_dir / "job.snapshot" ) );
}

TEST_F( TestLocalFileStore, wipe )
{
  LocalFileStore store( m_dir );

  EXPECT_NO_THROW( store.wipe( "job" ) );

  store.save( "job", { { "i", 1 } } );
  ASSERT_EQ( file_count(), 1u );

  store.wipe( "job" );
  EXPECT_EQ( file_count(), 0u );
  EXPECT_FALSE( store.load( "job" ).has_value() );
}

TEST_F( TestLocalFileStore, corrupt_file_reads_as_absent )
{
  LocalFileStore store( m_dir );
  write_file( m_dir / "job.snapshot", "this is not a snapshot" );

  EXPECT_FALSE( store.load( "job" ).has_value() );

  //Saving again repairs it
  store.save( "job", { { "i", 3 } } );
  EXPECT_EQ( store.load( "job" )->at( "i" ).as< int >(), 3 );
}

TEST_F( TestLocalFileStore, unencodable_value_writes_nothing )
{
  struct Opaque
  {
    int handle;
  };

  LocalFileStore store( m_dir );

  EXPECT_THROW( store.save( "job", { { "h", Opaque{ 1 } } } ), FailSafe::EncodeError );
  EXPECT_EQ( file_count(), 0u );
}

TEST_F( TestLocalFileStore, label_names_directory )
{
  LocalFileStore store( m_dir );

  EXPECT_EQ( store.label(), "local:" + m_dir.string() );
}
