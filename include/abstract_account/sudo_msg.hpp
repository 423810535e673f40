#pragma once

#include <abstract_account/credentials.hpp>

#include <abstract_account/protocol/sudo.pb.h>

#include <string>
#include <vector>

namespace abstract_account {

std::string make_before_tx_msg( const std::vector< protocol::stargate_msg >& msgs, const credentials& creds );
std::string make_after_tx_msg( bool success );

std::string to_json( const protocol::account_sudo_msg& msg );
protocol::account_sudo_msg sudo_msg_from_json( const std::string& json );

} // abstract_account
