#pragma once

#include <abstract_account/tx.hpp>
#include <abstract_account/tx_context.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace abstract_account {

using ante_handler = std::function< void( tx_context&, const tx&, bool /* simulate */ ) >;
using post_handler = std::function< void( tx_context&, const tx&, bool /* simulate */, bool /* success */ ) >;

struct ante_decorator
{
   virtual ~ante_decorator() = default;

   virtual void ante_handle( tx_context& ctx, const tx& t, bool simulate, const ante_handler& next ) = 0;
};

struct post_decorator
{
   virtual ~post_decorator() = default;

   virtual void post_handle( tx_context& ctx, const tx& t, bool simulate, bool success, const post_handler& next ) = 0;
};

ante_handler chain_ante_decorators( const std::vector< std::shared_ptr< ante_decorator > >& decorators );
post_handler chain_post_decorators( const std::vector< std::shared_ptr< post_decorator > >& decorators );

} // abstract_account
