#pragma once

#include <abstract_account/sign_mode_handler.hpp>
#include <abstract_account/tx.hpp>
#include <abstract_account/tx_context.hpp>
#include <abstract_account/types.hpp>

#include <cstdint>
#include <string>

namespace abstract_account {

struct credentials
{
   std::string sign_bytes;
   std::string signature;
};

/**
 * Account number the signer signs over. Genesis transactions (block height 0)
 * are signed over account number 0, the same as the default verifier expects.
 */
uint64_t signer_account_number( const tx_context& ctx, const protocol::contract_account& account );

credentials prepare_credentials(
   const tx_context& ctx,
   const tx& t,
   const protocol::contract_account& account,
   const signature_data& data,
   const sign_mode_handler& handler );

} // abstract_account
