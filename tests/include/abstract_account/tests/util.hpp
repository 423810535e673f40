#pragma once

#include <abstract_account/transcoder.hpp>
#include <abstract_account/tx.hpp>

#include <abstract_account/protocol/tx.pb.h>

#include <google/protobuf/any.pb.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace abstract_account { namespace tests {

inline google::protobuf::Any pack_any( const google::protobuf::Message& msg )
{
   google::protobuf::Any any;
   any.set_type_url( msg_type_url( msg ) );
   any.set_value( encode_msg( msg ) );
   return any;
}

inline protocol::mode_info single_mode( protocol::sign_mode mode = protocol::sign_mode_direct )
{
   protocol::mode_info info;
   info.mutable_single()->set_mode( mode );
   return info;
}

inline protocol::signer_info make_signer_info( const std::string& public_key, const protocol::mode_info& info, uint64_t sequence = 0 )
{
   protocol::signer_info signer;
   signer.set_public_key( public_key );
   *signer.mutable_mode_info() = info;
   signer.set_sequence( sequence );
   return signer;
}

/**
 * Builds a raw transaction from messages and parallel lists of signer infos and
 * signatures. The lists are not required to match in length.
 */
inline protocol::tx_raw make_tx_raw(
   const std::vector< const google::protobuf::Message* >& msgs,
   const std::vector< protocol::signer_info >& signer_infos,
   const std::vector< std::string >& signatures,
   const std::string& memo = "" )
{
   protocol::tx_body body;
   for ( const auto* msg : msgs )
      *body.add_messages() = pack_any( *msg );
   body.set_memo( memo );

   protocol::auth_info auth;
   for ( const auto& info : signer_infos )
      *auth.add_signer_infos() = info;
   auth.mutable_fee()->set_gas_limit( 200'000 );

   protocol::tx_raw raw;
   raw.set_body_bytes( encode_msg( body ) );
   raw.set_auth_info_bytes( encode_msg( auth ) );
   for ( const auto& sig : signatures )
      raw.add_signatures( sig );

   return raw;
}

inline std::shared_ptr< wrapped_tx > make_tx(
   const std::vector< const google::protobuf::Message* >& msgs,
   const std::vector< protocol::signer_info >& signer_infos,
   const std::vector< std::string >& signatures )
{
   return std::make_shared< wrapped_tx >( make_tx_raw( msgs, signer_infos, signatures ) );
}

// Stand-in signature scheme understood by the mock contracts
inline std::string toy_sign( const std::string& key, const std::string& sign_bytes )
{
   return key + ":" + std::to_string( std::hash< std::string >{}( sign_bytes ) );
}

} } // abstract_account::tests
