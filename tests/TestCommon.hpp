#ifndef INC_TEST_COMMON_HPP
#define INC_TEST_COMMON_HPP

#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <failsafe/FailSafe.hpp>

//Gives every test an empty directory of its own under FS_TEST_DATADIR
class ScratchDirTest : public ::testing::Test
{
protected:

  void SetUp() override
  {
    auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    m_dir = std::filesystem::path( FS_TEST_DATADIR )
        / ( std::string( info->test_suite_name() ) + "." + info->name() );

    std::filesystem::remove_all( m_dir );
    std::filesystem::create_directories( m_dir );
  }

  void TearDown() override
  {
    std::error_code err;
    std::filesystem::remove_all( m_dir, err );
  }

  std::size_t file_count() const
  {
    return std::distance( std::filesystem::directory_iterator( m_dir ),
                          std::filesystem::directory_iterator{} );
  }

  static std::string read_file( const std::filesystem::path &p )
  {
    std::ifstream file( p, std::ios::binary );
    return std::string{ std::istreambuf_iterator< char >( file ), std::istreambuf_iterator< char >() };
  }

  static void write_file( const std::filesystem::path &p, const std::string &bytes )
  {
    std::ofstream file( p, std::ios::binary | std::ios::trunc );
    file.write( bytes.data(), bytes.size() );
  }

  std::filesystem::path m_dir;
};

//A dictionary scope that counts how often it was restored into
class RecordingScope : public FailSafe::MapScope
{
public:
  using FailSafe::MapScope::MapScope;

  void restore_bindings( const FailSafe::VariableMapping &vars ) override
  {
    ++restore_calls;
    last_restored = vars;
    FailSafe::MapScope::restore_bindings( vars );
  }

  int restore_calls = 0;
  FailSafe::VariableMapping last_restored;
};

//Fails every save and wipe, for exercising fan-out error collection
class FailingStore : public FailSafe::Store
{
public:
  void wipe( const std::string & ) override
  {
    throw FailSafe::StoreError( label(), "disk on fire" );
  }

  std::string label() const override { return "failing"; }

protected:
  std::optional< std::string > load_data( const std::string & ) override
  {
    return std::nullopt;
  }

  void save_data( const std::string &, const std::string & ) override
  {
    throw FailSafe::StoreError( label(), "disk on fire" );
  }
};

#endif // INC_TEST_COMMON_HPP
