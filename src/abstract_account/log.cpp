#include <abstract_account/exceptions.hpp>
#include <abstract_account/log.hpp>

#include <iomanip>
#include <iostream>
#include <string>

#include <boost/log/expressions.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>

namespace abstract_account {

namespace {

constexpr const char* ansi_green  = "\033[32m";
constexpr const char* ansi_yellow = "\033[33m";
constexpr const char* ansi_red    = "\033[31m";
constexpr const char* ansi_reset  = "\033[0m";

struct level_style
{
   const char* label;
   const char* color;
};

level_style style_of( const boost::log::value_ref< boost::log::trivial::severity_level, boost::log::trivial::tag::severity >& level )
{
   if ( level )
   {
      switch ( level.get() )
      {
         case boost::log::trivial::trace:   return { "trace", ansi_green };
         case boost::log::trivial::debug:   return { "debug", ansi_green };
         case boost::log::trivial::info:    return { "info", ansi_green };
         case boost::log::trivial::warning: return { "warning", ansi_yellow };
         case boost::log::trivial::error:   return { "error", ansi_red };
         case boost::log::trivial::fatal:   return { "fatal", ansi_red };
         default: break;
      }
   }

   return { "unknown", ansi_red };
}

/**
 * Writes "<date> <time> [file:line] <level>: message" to stdout, with the
 * level optionally wrapped in an ANSI color.
 */
class console_backend final :
   public boost::log::sinks::basic_formatted_sink_backend< char, boost::log::sinks::synchronized_feeding >
{
public:
   explicit console_backend( bool color ) : _color( color ) {}

   void consume( const boost::log::record_view& rec, const string_type& message )
   {
      const auto& values = rec.attribute_values();
      auto& out = std::cout;

      if ( auto timestamp = values[ "TimeStamp" ].extract< boost::posix_time::ptime >() )
      {
         const auto& t = timestamp.get();
         out << boost::gregorian::to_iso_extended_string( t.date() ) << " "
             << std::setfill( '0' )
             << std::setw( 2 ) << t.time_of_day().hours() << ":"
             << std::setw( 2 ) << t.time_of_day().minutes() << ":"
             << std::setw( 2 ) << t.time_of_day().seconds() << "."
             << std::setw( 6 ) << t.time_of_day().fractional_seconds() << " ";
      }

      out << "[" << values[ "File" ].extract_or_default( std::string() )
          << ":" << values[ "Line" ].extract_or_default( int( 0 ) ) << "] ";

      auto style = style_of( rec[ boost::log::trivial::severity ] );

      out << "<";
      if ( _color )
         out << style.color << style.label << ansi_reset;
      else
         out << style.label;
      out << ">: " << message << std::endl;
   }

private:
   bool _color;
};

} // anonymous

void initialize_logging(
   const std::string& application_name,
   const std::string& filter_level,
   const std::optional< std::filesystem::path >& log_dir,
   bool color )
{
   boost::log::trivial::severity_level level;
   ABSTRACT_ACCOUNT_ASSERT(
      boost::log::trivial::from_string( filter_level.data(), filter_level.size(), level ),
      config_exception,
      "invalid log level: ${level}",
      ("level", filter_level)
   );

   auto core = boost::log::core::get();

   // Reinitializing replaces the previous sinks
   core->remove_all_sinks();
   auto backend = boost::make_shared< console_backend >( color );
   core->add_sink( boost::make_shared< boost::log::sinks::synchronous_sink< console_backend > >( backend ) );

   boost::log::register_simple_formatter_factory< boost::log::trivial::severity_level, char >( "Severity" );

   if ( log_dir )
   {
      // Rotates at 1mb or at midnight, keeping at most 20mb of logs
      boost::log::add_file_log(
         boost::log::keywords::file_name = ( *log_dir / ( application_name + "_%3N.log" ) ).string(),
         boost::log::keywords::rotation_size = 1 * 1024 * 1024,
         boost::log::keywords::max_size = 20 * 1024 * 1024,
         boost::log::keywords::time_based_rotation = boost::log::sinks::file::rotation_at_time_point( 0, 0, 0 ),
         boost::log::keywords::format = "%TimeStamp% [%File%:%Line%] <%Severity%>: %Message%",
         boost::log::keywords::auto_flush = true
      );
   }

   boost::log::add_common_attributes();
   core->set_filter( boost::log::trivial::severity >= level );
}

} // abstract_account
