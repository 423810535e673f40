#include <boost/test/unit_test.hpp>
#include <boost/algorithm/string.hpp>

#include <abstract_account/exceptions.hpp>
#include <abstract_account/log.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

struct log_fixture
{
   log_fixture()
   {
      temp = std::filesystem::temp_directory_path() / ( "abstract_account_log_test_" + std::to_string( std::random_device{}() ) );
      std::filesystem::create_directory( temp );
   }

   ~log_fixture()
   {
      abstract_account::initialize_logging( "abstract_account_tests", "info", {}, false );
      std::error_code ec;
      std::filesystem::remove_all( temp, ec );
   }

   void log_all_levels()
   {
      LOG( trace )   << "test";
      LOG( debug )   << "test";
      LOG( info )    << "test";
      LOG( warning ) << "test";
      LOG( error )   << "test";
      LOG( fatal )   << "test";

      // We go around our macro in order to invoke an unknown log level
      BOOST_LOG_SEV(::boost::log::trivial::logger::get(), boost::log::trivial::severity_level(10))
         << boost::log::add_value("Line", __LINE__)
         << boost::log::add_value("File", std::filesystem::path(__FILE__).filename().string()) << "test";
   }

   std::vector< std::string > read_log_file()
   {
      std::ifstream file( ( temp / "log_test_000.log" ).string() );
      BOOST_REQUIRE( file.is_open() );

      std::vector< std::string > log_lines;
      std::string line;

      while ( std::getline( file, line ) )
         log_lines.push_back( line );

      return log_lines;
   }

   static std::vector< std::string > split_lines( const std::string& s )
   {
      std::vector< std::string > results;
      boost::split( results, s, boost::is_any_of( "\n" ) );
      results.pop_back();
      return results;
   }

   std::filesystem::path temp;
};

BOOST_FIXTURE_TEST_SUITE( log_tests, log_fixture )

BOOST_AUTO_TEST_CASE( log_color_tests )
{
   BOOST_TEST_MESSAGE( "Testing logging library with color" );
   std::stringstream stream;
   auto buf = std::cout.rdbuf();
   std::cout.rdbuf( stream.rdbuf() );

   std::vector< std::string > logtypes {
      "<\033[32mtrace\033[0m>",
      "<\033[32mdebug\033[0m>",
      "<\033[32minfo\033[0m>",
      "<\033[33mwarning\033[0m>",
      "<\033[31merror\033[0m>",
      "<\033[31mfatal\033[0m>",
      "<\033[31munknown\033[0m>"
   };

   abstract_account::initialize_logging( "log_test", "trace", temp );
   log_all_levels();

   auto log_lines = read_log_file();
   auto results = split_lines( stream.str() );

   // Setting std::cout back to normal
   std::cout.rdbuf( buf );

   BOOST_REQUIRE( log_lines.size() > 0 );
   BOOST_REQUIRE_EQUAL( "<trace>: test", log_lines[0].substr( log_lines[0].find( "<" ) ) );

   BOOST_REQUIRE_EQUAL( results.size(), logtypes.size() );
   for ( std::size_t i = 0; i < results.size(); i++ )
   {
      auto pos = results[i].find( "<" );
      BOOST_REQUIRE_EQUAL( logtypes[i] + ": test", results[i].substr( pos ) );
   }
}

BOOST_AUTO_TEST_CASE( log_no_color_tests )
{
   BOOST_TEST_MESSAGE( "Testing logging library without color" );
   std::stringstream stream;
   auto buf = std::cout.rdbuf();
   std::cout.rdbuf( stream.rdbuf() );

   std::vector< std::string > logtypes {
      "<trace>",
      "<debug>",
      "<info>",
      "<warning>",
      "<error>",
      "<fatal>",
      "<unknown>"
   };

   abstract_account::initialize_logging( "log_test", "trace", temp, false /* no color */ );
   log_all_levels();

   auto log_lines = read_log_file();
   auto results = split_lines( stream.str() );

   // Setting std::cout back to normal
   std::cout.rdbuf( buf );

   BOOST_REQUIRE( log_lines.size() > 0 );
   BOOST_REQUIRE_EQUAL( "<trace>: test", log_lines[0].substr( log_lines[0].find( "<" ) ) );

   BOOST_REQUIRE_EQUAL( results.size(), logtypes.size() );
   for ( std::size_t i = 0; i < results.size(); i++ )
   {
      auto pos = results[i].find( "<" );
      BOOST_REQUIRE_EQUAL( logtypes[i] + ": test", results[i].substr( pos ) );
   }
}

BOOST_AUTO_TEST_CASE( log_filter_tests )
{
   BOOST_TEST_MESSAGE( "Records below the filter level are dropped" );
   std::stringstream stream;
   auto buf = std::cout.rdbuf();
   std::cout.rdbuf( stream.rdbuf() );

   abstract_account::initialize_logging( "log_test", "warning", {}, false );
   log_all_levels();

   auto results = split_lines( stream.str() );
   std::cout.rdbuf( buf );

   std::vector< std::string > logtypes { "<warning>", "<error>", "<fatal>", "<unknown>" };

   BOOST_REQUIRE_EQUAL( results.size(), logtypes.size() );
   for ( std::size_t i = 0; i < results.size(); i++ )
      BOOST_REQUIRE_EQUAL( logtypes[i] + ": test", results[i].substr( results[i].find( "<" ) ) );

   BOOST_TEST_MESSAGE( "An unknown level is rejected" );
   try
   {
      abstract_account::initialize_logging( "log_test", "verbose" );
      BOOST_FAIL( "expected config_exception" );
   }
   catch ( const abstract_account::config_exception& e )
   {
      BOOST_REQUIRE_EQUAL( std::string( e.what() ), "invalid log level: verbose" );
   }
}

BOOST_AUTO_TEST_SUITE_END()
