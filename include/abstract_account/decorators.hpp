#pragma once

#include <abstract_account/ante.hpp>
#include <abstract_account/keepers.hpp>
#include <abstract_account/params.hpp>
#include <abstract_account/sign_mode_handler.hpp>

#include <memory>

namespace abstract_account {

/**
 * Hands authentication of contract account transactions to the account's contract
 * and delegates every other transaction to the default verifier.
 */
class before_tx_decorator final : public ante_decorator
{
public:
   before_tx_decorator(
      std::shared_ptr< account_keeper > accounts,
      std::shared_ptr< contract_keeper > contracts,
      std::shared_ptr< sign_mode_handler > sign_modes,
      std::shared_ptr< ante_decorator > default_verifier,
      const params& p = params() );

   void ante_handle( tx_context& ctx, const tx& t, bool simulate, const ante_handler& next ) override;

private:
   std::shared_ptr< account_keeper >    _accounts;
   std::shared_ptr< contract_keeper >   _contracts;
   std::shared_ptr< sign_mode_handler > _sign_modes;
   std::shared_ptr< ante_decorator >    _default_verifier;
   params                               _params;
};

/**
 * Notifies the contract that authenticated a transaction of the transaction's outcome.
 */
class after_tx_decorator final : public post_decorator
{
public:
   after_tx_decorator( std::shared_ptr< contract_keeper > contracts, const params& p = params() );

   void post_handle( tx_context& ctx, const tx& t, bool simulate, bool success, const post_handler& next ) override;

private:
   std::shared_ptr< contract_keeper > _contracts;
   params                             _params;
};

} // abstract_account
