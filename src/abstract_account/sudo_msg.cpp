#include <abstract_account/exceptions.hpp>
#include <abstract_account/sudo_msg.hpp>

#include <google/protobuf/util/json_util.h>

namespace abstract_account {

std::string make_before_tx_msg( const std::vector< protocol::stargate_msg >& msgs, const credentials& creds )
{
   protocol::account_sudo_msg msg;
   auto* before_tx = msg.mutable_before_tx();

   for ( const auto& m : msgs )
      *before_tx->add_msgs() = m;

   before_tx->set_sign_bytes( creds.sign_bytes );
   before_tx->set_signature( creds.signature );

   return to_json( msg );
}

std::string make_after_tx_msg( bool success )
{
   protocol::account_sudo_msg msg;
   msg.mutable_after_tx()->set_success( success );
   return to_json( msg );
}

std::string to_json( const protocol::account_sudo_msg& msg )
{
   google::protobuf::util::JsonPrintOptions options;
   options.preserve_proto_field_names    = true;
   options.always_print_primitive_fields = true;

   std::string json;
   auto status = google::protobuf::util::MessageToJsonString( msg, &json, options );
   ABSTRACT_ACCOUNT_ASSERT( status.ok(), encoding_exception, "unable to encode sudo message: ${status}", ("status", status.ToString()) );

   return json;
}

protocol::account_sudo_msg sudo_msg_from_json( const std::string& json )
{
   protocol::account_sudo_msg msg;
   auto status = google::protobuf::util::JsonStringToMessage( json, &msg );
   ABSTRACT_ACCOUNT_ASSERT( status.ok(), decode_exception, "unable to decode sudo message: ${status}", ("status", status.ToString()) );

   return msg;
}

} // abstract_account
