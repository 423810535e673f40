#include <abstract_account/exception.hpp>

#include <sstream>

namespace abstract_account { namespace detail {

namespace {

std::string to_message_string( const nlohmann::json& value )
{
   if ( value.is_string() )
      return value.get< std::string >();

   return value.dump();
}

} // anonymous

/*
 * Replaces each ${key} in format_str with the value of key in j. Keys missing
 * from j and unterminated keys are copied through unchanged. ${$ is a literal.
 */
std::string json_strpolate( const std::string& format_str, const nlohmann::json& j )
{
   std::string result;
   result.reserve( format_str.size() );

   std::size_t pos = 0;

   while ( pos < format_str.size() )
   {
      auto open = format_str.find( "${", pos );
      if ( open == std::string::npos )
         break;

      result.append( format_str, pos, open - pos );

      auto key_start = open + 2;
      if ( key_start < format_str.size() && format_str[ key_start ] == '$' )
      {
         result.append( "${$" );
         pos = key_start + 1;
         continue;
      }

      auto close = format_str.find( '}', key_start );
      if ( close == std::string::npos )
      {
         result.append( format_str, open, 2 );
         pos = key_start;
         continue;
      }

      auto itr = j.find( format_str.substr( key_start, close - key_start ) );
      if ( itr != j.end() )
         result += to_message_string( *itr );
      else
         result.append( format_str, open, close - open + 1 );

      pos = close + 1;
   }

   if ( pos < format_str.size() )
      result.append( format_str, pos, std::string::npos );

   return result;
}

json_initializer::json_initializer( exception& e ) :
   _e( e ),
   _j( *boost::get_error_info< json_info >( e ) )
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[ key ] = c;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()()
{
   return *this;
}

} // detail

exception::exception()
{
   *this << detail::json_info( nlohmann::json::object() );
}

exception::exception( const std::string& m ) : exception()
{
   msg = m;
}

exception::exception( std::string&& m ) : exception()
{
   msg = std::move( m );
}

exception::~exception() {}

const char* exception::what() const noexcept
{
   return msg.c_str();
}

std::string exception::get_stacktrace() const
{
   std::stringstream ss;

   if ( const auto* st = boost::get_error_info< detail::exception_stacktrace >( *this ) )
      ss << *st;

   return ss.str();
}

const nlohmann::json& exception::get_json() const
{
   return *boost::get_error_info< detail::json_info >( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

void exception::do_message_substitution()
{
   msg = detail::json_strpolate( msg, get_json() );
}

} // abstract_account
