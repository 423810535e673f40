#include <abstract_account/ante.hpp>

namespace abstract_account {

ante_handler chain_ante_decorators( const std::vector< std::shared_ptr< ante_decorator > >& decorators )
{
   ante_handler next = []( tx_context&, const tx&, bool ) {};

   for ( auto itr = decorators.rbegin(); itr != decorators.rend(); ++itr )
   {
      next = [ decorator = *itr, next ]( tx_context& ctx, const tx& t, bool simulate )
      {
         decorator->ante_handle( ctx, t, simulate, next );
      };
   }

   return next;
}

post_handler chain_post_decorators( const std::vector< std::shared_ptr< post_decorator > >& decorators )
{
   post_handler next = []( tx_context&, const tx&, bool, bool ) {};

   for ( auto itr = decorators.rbegin(); itr != decorators.rend(); ++itr )
   {
      next = [ decorator = *itr, next ]( tx_context& ctx, const tx& t, bool simulate, bool success )
      {
         decorator->post_handle( ctx, t, simulate, success, next );
      };
   }

   return next;
}

} // abstract_account
