#include <abstract_account/exceptions.hpp>
#include <abstract_account/sign_mode_handler.hpp>
#include <abstract_account/transcoder.hpp>

namespace abstract_account {

protocol::sign_mode direct_sign_mode_handler::default_mode() const
{
   return protocol::sign_mode_direct;
}

std::vector< protocol::sign_mode > direct_sign_mode_handler::modes() const
{
   return { protocol::sign_mode_direct };
}

std::string direct_sign_mode_handler::get_sign_bytes( protocol::sign_mode mode, const signer_data& data, const tx& t ) const
{
   ABSTRACT_ACCOUNT_ASSERT(
      mode == protocol::sign_mode_direct,
      unsupported_sign_mode_exception,
      "expected ${expected}, got ${mode}",
      ("expected", protocol::sign_mode_Name( protocol::sign_mode_direct ))("mode", protocol::sign_mode_Name( mode ))
   );

   const auto* wtx = dynamic_cast< const wrapped_tx* >( &t );
   ABSTRACT_ACCOUNT_ASSERT( wtx != nullptr, encoding_exception, "transaction does not carry its body and auth info bytes" );

   protocol::sign_doc doc;
   doc.set_body_bytes( wtx->raw().body_bytes() );
   doc.set_auth_info_bytes( wtx->raw().auth_info_bytes() );
   doc.set_chain_id( data.chain_id );
   doc.set_account_number( data.account_number );

   return encode_msg( doc );
}

sign_mode_handler_map::sign_mode_handler_map( protocol::sign_mode default_mode, const std::vector< std::shared_ptr< sign_mode_handler > >& handlers ) :
   _default_mode( default_mode )
{
   for ( const auto& handler : handlers )
   {
      ABSTRACT_ACCOUNT_ASSERT( handler, invalid_params_exception, "sign mode handler must not be null" );

      for ( auto mode : handler->modes() )
      {
         ABSTRACT_ACCOUNT_ASSERT(
            _handlers.find( mode ) == _handlers.end(),
            invalid_params_exception,
            "duplicate handler for ${mode}",
            ("mode", protocol::sign_mode_Name( mode ))
         );

         _handlers[ mode ] = handler;
      }
   }

   ABSTRACT_ACCOUNT_ASSERT(
      _handlers.find( _default_mode ) != _handlers.end(),
      invalid_params_exception,
      "no handler for default mode ${mode}",
      ("mode", protocol::sign_mode_Name( _default_mode ))
   );
}

protocol::sign_mode sign_mode_handler_map::default_mode() const
{
   return _default_mode;
}

std::vector< protocol::sign_mode > sign_mode_handler_map::modes() const
{
   std::vector< protocol::sign_mode > modes;
   modes.reserve( _handlers.size() );

   for ( const auto& [ mode, handler ] : _handlers )
      modes.push_back( mode );

   return modes;
}

std::string sign_mode_handler_map::get_sign_bytes( protocol::sign_mode mode, const signer_data& data, const tx& t ) const
{
   auto itr = _handlers.find( mode );
   ABSTRACT_ACCOUNT_ASSERT( itr != _handlers.end(), unsupported_sign_mode_exception, "unsupported sign mode ${mode}", ("mode", protocol::sign_mode_Name( mode )) );

   return itr->second->get_sign_bytes( mode, data, t );
}

} // abstract_account
