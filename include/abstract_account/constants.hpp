#pragma once

#include <cstdint>
#include <string>

namespace abstract_account {

// Prefix of a message type URL, followed by the full protobuf message name
const std::string type_url_prefix = "/";

// Section of the config file holding the module parameters
const std::string config_section = "abstract_account";

// Transactions included at this height are genesis transactions
constexpr uint64_t genesis_height = 0;

// Gas available to the contract for each sudo call
constexpr uint64_t default_max_gas_before = 2'000'000;
constexpr uint64_t default_max_gas_after  = 1'000'000;

} // abstract_account
