#include <abstract_account/exceptions.hpp>
#include <abstract_account/log.hpp>
#include <abstract_account/params.hpp>

namespace abstract_account {

namespace detail {

template< typename T >
T get_option( const std::string& key, const T& default_value, const YAML::Node& section, const YAML::Node& global )
{
   if ( section && section[ key ] )
      return section[ key ].as< T >();

   if ( global && global[ key ] )
      return global[ key ].as< T >();

   return default_value;
}

} // detail

#define MAX_GAS_BEFORE_OPTION "max-gas-before"
#define MAX_GAS_AFTER_OPTION  "max-gas-after"

void validate_params( const params& p )
{
   ABSTRACT_ACCOUNT_ASSERT( p.max_gas_before > 0, invalid_params_exception, "${option} must be greater than 0", ("option", MAX_GAS_BEFORE_OPTION) );
   ABSTRACT_ACCOUNT_ASSERT( p.max_gas_after > 0, invalid_params_exception, "${option} must be greater than 0", ("option", MAX_GAS_AFTER_OPTION) );
}

params params_from_yaml( const YAML::Node& section, const YAML::Node& global )
{
   params p;

   try
   {
      p.max_gas_before = detail::get_option< uint64_t >( MAX_GAS_BEFORE_OPTION, default_max_gas_before, section, global );
      p.max_gas_after  = detail::get_option< uint64_t >( MAX_GAS_AFTER_OPTION, default_max_gas_after, section, global );
   }
   catch ( const YAML::Exception& e )
   {
      ABSTRACT_ACCOUNT_THROW( invalid_params_exception, "unable to read parameters: ${what}", ("what", e.what()) );
   }

   validate_params( p );

   return p;
}

params load_params( const std::filesystem::path& basedir )
{
   auto yaml_config = basedir / "config.yml";
   if ( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

   if ( !std::filesystem::exists( yaml_config ) )
   {
      LOG(warning) << "Could not find config (config.yml or config.yaml expected). Using default values";
      return params();
   }

   YAML::Node config;

   try
   {
      config = YAML::LoadFile( yaml_config.string() );
   }
   catch ( const YAML::Exception& e )
   {
      ABSTRACT_ACCOUNT_THROW( invalid_params_exception, "unable to parse ${file}: ${what}", ("file", yaml_config.string())("what", e.what()) );
   }

   auto p = params_from_yaml( config[ config_section ], config[ "global" ] );
   LOG(info) << "Loaded parameters from " << yaml_config.string()
             << " (max gas before: " << p.max_gas_before << ", max gas after: " << p.max_gas_after << ")";

   return p;
}

} // abstract_account
