#pragma once

#include <abstract_account/protocol/account.pb.h>
#include <abstract_account/protocol/tx.pb.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace abstract_account {

template< class... Ts > struct overloaded : Ts... { using Ts::operator()...; };
template< class... Ts > overloaded( Ts... ) -> overloaded< Ts... >;

using account = std::variant< protocol::base_account, protocol::contract_account >;

const std::string& get_address( const account& acc );

struct single_signature_data
{
   protocol::sign_mode mode = protocol::sign_mode_unspecified;
   std::string         signature;
};

struct multi_signature_data;

using signature_data = std::variant< single_signature_data, multi_signature_data >;

struct multi_signature_data
{
   protocol::compact_bit_array   bitarray;
   std::vector< signature_data > signatures;
};

struct signature_v2
{
   std::string    public_key;
   signature_data data;
   uint64_t       sequence = 0;
};

// Everything about the signer that goes into the sign bytes besides the transaction itself
struct signer_data
{
   std::string address;
   std::string chain_id;
   uint64_t    account_number = 0;
   uint64_t    sequence = 0;
   std::string public_key;
};

} // abstract_account
