#pragma once

#include <abstract_account/tx_context.hpp>
#include <abstract_account/types.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace abstract_account {

struct sudo_result
{
   int32_t     code = 0;
   std::string data;
   std::string error;
};

struct account_keeper
{
   virtual ~account_keeper() = default;

   virtual std::optional< account > get_account( const tx_context& ctx, const std::string& address ) const = 0;
};

struct contract_keeper
{
   virtual ~contract_keeper() = default;

   /**
    * Invokes the privileged sudo entry point of the contract at the given address.
    * A non-zero result code is an error response from the contract. Exceptions
    * signal that the call could not be made or did not complete.
    */
   virtual sudo_result sudo( tx_context& ctx, const std::string& contract, const std::string& msg, uint64_t gas_limit ) = 0;
};

} // abstract_account
