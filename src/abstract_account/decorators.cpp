#include <abstract_account/classifier.hpp>
#include <abstract_account/credentials.hpp>
#include <abstract_account/decorators.hpp>
#include <abstract_account/exceptions.hpp>
#include <abstract_account/log.hpp>
#include <abstract_account/sudo_msg.hpp>
#include <abstract_account/transcoder.hpp>

namespace abstract_account {

namespace detail {

void sudo( contract_keeper& contracts, tx_context& ctx, const std::string& contract, const std::string& msg, uint64_t gas_limit )
{
   sudo_result result;

   try
   {
      result = contracts.sudo( ctx, contract, msg, gas_limit );
   }
   catch ( const contract_invocation_exception& )
   {
      throw;
   }
   catch ( const std::exception& e )
   {
      LOG(warning) << "Sudo call to contract " << contract << " failed: " << e.what();
      ABSTRACT_ACCOUNT_THROW( contract_invocation_exception, "sudo call to contract ${contract} failed: ${what}", ("contract", contract)("what", e.what()) );
   }

   if ( result.code != 0 )
   {
      LOG(warning) << "Contract " << contract << " rejected sudo call with code " << result.code << ": " << result.error;
      ABSTRACT_ACCOUNT_THROW(
         contract_invocation_exception,
         "contract ${contract} returned code ${code}: ${error}",
         ("contract", contract)("code", result.code)("error", result.error)
      );
   }
}

} // detail

before_tx_decorator::before_tx_decorator(
   std::shared_ptr< account_keeper > accounts,
   std::shared_ptr< contract_keeper > contracts,
   std::shared_ptr< sign_mode_handler > sign_modes,
   std::shared_ptr< ante_decorator > default_verifier,
   const params& p ) :
   _accounts( accounts ),
   _contracts( contracts ),
   _sign_modes( sign_modes ),
   _default_verifier( default_verifier ),
   _params( p )
{
   ABSTRACT_ACCOUNT_ASSERT( _accounts, config_exception, "before_tx_decorator requires an account keeper" );
   ABSTRACT_ACCOUNT_ASSERT( _contracts, config_exception, "before_tx_decorator requires a contract keeper" );
   ABSTRACT_ACCOUNT_ASSERT( _sign_modes, config_exception, "before_tx_decorator requires a sign mode handler" );
   ABSTRACT_ACCOUNT_ASSERT( _default_verifier, config_exception, "before_tx_decorator requires a default verifier" );
   validate_params( _params );
}

void before_tx_decorator::ante_handle( tx_context& ctx, const tx& t, bool simulate, const ante_handler& next )
{
   auto result = classify_tx( ctx, t, *_accounts );

   const auto* contract_tx = std::get_if< qualifies >( &result );
   if ( contract_tx == nullptr )
   {
      LOG(debug) << "Transaction is not signed by a single contract account, using default verification";
      _default_verifier->ante_handle( ctx, t, simulate, next );
      return;
   }

   const auto& signer = contract_tx->account;
   LOG(debug) << "Transaction signer " << signer.address() << " is a contract account";

   // Must happen before any contract call. The post stage reads it back.
   ctx.handoff().write( signer.address() );

   auto msgs  = to_stargate_msgs( t.get_msgs() );
   auto creds = prepare_credentials( ctx, t, signer, contract_tx->signature.data, *_sign_modes );

   detail::sudo( *_contracts, ctx, signer.address(), make_before_tx_msg( msgs, creds ), _params.max_gas_before );

   next( ctx, t, simulate );
}

after_tx_decorator::after_tx_decorator( std::shared_ptr< contract_keeper > contracts, const params& p ) :
   _contracts( contracts ),
   _params( p )
{
   ABSTRACT_ACCOUNT_ASSERT( _contracts, config_exception, "after_tx_decorator requires a contract keeper" );
   validate_params( _params );
}

void after_tx_decorator::post_handle( tx_context& ctx, const tx& t, bool simulate, bool success, const post_handler& next )
{
   auto signer = ctx.handoff().read();

   if ( !signer )
   {
      next( ctx, t, simulate, success );
      return;
   }

   ctx.handoff().clear();

   detail::sudo( *_contracts, ctx, *signer, make_after_tx_msg( success ), _params.max_gas_after );

   next( ctx, t, simulate, success );
}

} // abstract_account
