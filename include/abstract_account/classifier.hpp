#pragma once

#include <abstract_account/keepers.hpp>
#include <abstract_account/tx.hpp>
#include <abstract_account/tx_context.hpp>
#include <abstract_account/types.hpp>

#include <variant>

namespace abstract_account {

struct not_applicable {};

struct qualifies
{
   protocol::contract_account account;
   signature_v2               signature;
};

using classification = std::variant< not_applicable, qualifies >;

/**
 * A transaction qualifies when it has exactly one signer, exactly one signature,
 * and the signer is a contract account. Throws decode_exception when the
 * transaction cannot report its signers and signatures.
 */
classification classify_tx( const tx_context& ctx, const tx& t, const account_keeper& accounts );

} // abstract_account
