#pragma once

#include <abstract_account/protocol/sudo.pb.h>

#include <google/protobuf/message.h>

#include <memory>
#include <string>
#include <vector>

namespace abstract_account {

std::string msg_type_url( const google::protobuf::Message& msg );

// Deterministic protobuf serialization
std::string encode_msg( const google::protobuf::Message& msg );

std::unique_ptr< google::protobuf::Message > decode_msg( const std::string& type_url, const std::string& value );

/**
 * Converts transaction messages to (type url, bytes) pairs, preserving order.
 * Either every message is converted or an encoding_exception is thrown.
 */
std::vector< protocol::stargate_msg > to_stargate_msgs( const std::vector< const google::protobuf::Message* >& msgs );

} // abstract_account
