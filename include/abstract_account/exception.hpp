#pragma once

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <nlohmann/json.hpp>

#include <abstract_account/log.hpp>

#include <string>

// Macro locals are prefixed so capture lists can name the caller's own variables
#define _DETAIL_ABSTRACT_ACCOUNT_INIT_VA_ARGS( ... ) _abstract_account_init __VA_ARGS__

#define ABSTRACT_ACCOUNT_THROW( exception, msg, ... )                                  \
do {                                                                                   \
   exception _abstract_account_exc( msg );                                             \
   abstract_account::detail::json_initializer _abstract_account_init( _abstract_account_exc ); \
   _DETAIL_ABSTRACT_ACCOUNT_INIT_VA_ARGS( __VA_ARGS__ );                               \
   BOOST_THROW_EXCEPTION(                                                              \
      _abstract_account_exc                                                            \
      << abstract_account::detail::exception_stacktrace( boost::stacktrace::stacktrace() ) \
   );                                                                                  \
} while( 0 )

#define ABSTRACT_ACCOUNT_ASSERT( cond, exc_name, msg, ... )   \
   do {                                                       \
      if( !(cond) )                                           \
      {                                                       \
         ABSTRACT_ACCOUNT_THROW( exc_name, msg, __VA_ARGS__ ); \
      }                                                       \
   } while( 0 )

#define ABSTRACT_ACCOUNT_CAPTURE_CATCH_AND_RETHROW( ... )                                \
catch( abstract_account::exception& _abstract_account_exc )                              \
{                                                                                        \
   abstract_account::detail::json_initializer _abstract_account_init( _abstract_account_exc ); \
   _DETAIL_ABSTRACT_ACCOUNT_INIT_VA_ARGS( __VA_ARGS__ );                                 \
   throw;                                                                                \
}

#define ABSTRACT_ACCOUNT_CATCH_LOG_AND_RETHROW( log_level )  \
catch( abstract_account::exception& e )                     \
{                                                           \
   LOG( log_level ) << boost::diagnostic_information( e );  \
   throw;                                                   \
}

#define ABSTRACT_ACCOUNT_CATCH_AND_LOG( log_level )          \
catch( abstract_account::exception& e )                     \
{                                                           \
   LOG( log_level ) << boost::diagnostic_information( e );  \
}

#define ABSTRACT_ACCOUNT_DECLARE_EXCEPTION( exc_name )                          \
   struct exc_name : public abstract_account::exception                         \
   {                                                                            \
      exc_name() {}                                                             \
      exc_name( const std::string& m ) : abstract_account::exception( m ) {}    \
      exc_name( std::string&& m ) : abstract_account::exception( m ) {}         \
                                                                                \
      virtual ~exc_name() {};                                                   \
   };

#define ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( exc_name, base ) \
   struct exc_name : public base                                    \
   {                                                                \
      exc_name() {}                                                 \
      exc_name( const std::string& m ) : base( m ) {}               \
      exc_name( std::string&& m ) : base( m ) {}                    \
                                                                    \
      virtual ~exc_name() {};                                       \
   };

namespace abstract_account {

// Forward declaration
namespace detail { struct json_initializer; }

struct exception : virtual boost::exception, virtual std::exception
{
   private:
      std::string msg;

   public:
      exception();
      exception( const std::string& m );
      exception( std::string&& m );

      virtual ~exception();

      virtual const char* what() const noexcept override;

      std::string get_stacktrace() const;
      const nlohmann::json& get_json() const;
      const std::string& get_message() const;

   private:
      friend struct detail::json_initializer;

      void do_message_substitution();
};

namespace detail {

using json_info = boost::error_info< struct json_tag, nlohmann::json >;
using exception_stacktrace = boost::error_info< struct stacktrace_tag, boost::stacktrace::stacktrace >;

std::string json_strpolate( const std::string& format_str, const nlohmann::json& j );

/**
 * Initializes a json object using a bubble list of key value pairs.
 */
struct json_initializer
{
   exception& _e;
   nlohmann::json& _j;

   json_initializer() = delete;
   json_initializer( exception& e );

   json_initializer& operator()( const std::string& key, const char* c );
   json_initializer& operator()();

   template< typename T >
   json_initializer& operator()( const std::string& key, const T& t )
   {
      _j[key] = t;
      _e.do_message_substitution();
      return *this;
   }
};

} } // abstract_account::detail
