#pragma once

#include <abstract_account/types.hpp>

#include <abstract_account/protocol/tx.pb.h>

#include <google/protobuf/message.h>

#include <memory>
#include <string>
#include <vector>

namespace abstract_account {

class tx
{
public:
   virtual ~tx() = default;

   virtual std::vector< const google::protobuf::Message* > get_msgs() const = 0;
};

/**
 * A transaction that exposes its declared signers and their signatures.
 * The two lists are read independently and need not have the same length.
 */
class sig_verifiable_tx : public tx
{
public:
   virtual std::vector< std::string > get_signers() const = 0;
   virtual std::vector< signature_v2 > get_signatures() const = 0;
};

class wrapped_tx final : public sig_verifiable_tx
{
public:
   explicit wrapped_tx( const protocol::tx_raw& raw );

   std::vector< const google::protobuf::Message* > get_msgs() const override;
   std::vector< std::string > get_signers() const override;
   std::vector< signature_v2 > get_signatures() const override;

   const protocol::tx_raw& raw() const;
   const protocol::tx_body& body() const;
   const protocol::auth_info& auth_info() const;

private:
   protocol::tx_raw                                         _raw;
   protocol::tx_body                                        _body;
   protocol::auth_info                                      _auth_info;
   std::vector< std::unique_ptr< google::protobuf::Message > > _msgs;
   std::vector< std::string >                               _signers;
};

std::shared_ptr< wrapped_tx > decode_tx( const std::string& tx_bytes );

// Addresses named by the signer option of the message type, in declaration order
std::vector< std::string > get_msg_signers( const google::protobuf::Message& msg );

signature_data mode_info_to_signature_data( const protocol::mode_info& info, const std::string& signature );

} // abstract_account
