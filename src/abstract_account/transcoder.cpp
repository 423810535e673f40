#include <abstract_account/constants.hpp>
#include <abstract_account/exceptions.hpp>
#include <abstract_account/transcoder.hpp>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

namespace abstract_account {

std::string msg_type_url( const google::protobuf::Message& msg )
{
   return type_url_prefix + msg.GetDescriptor()->full_name();
}

std::string encode_msg( const google::protobuf::Message& msg )
{
   std::string bytes;
   bool success = false;

   {
      google::protobuf::io::StringOutputStream stream( &bytes );
      google::protobuf::io::CodedOutputStream coded_stream( &stream );
      coded_stream.SetSerializationDeterministic( true );
      success = msg.SerializeToCodedStream( &coded_stream ) && !coded_stream.HadError();
   }

   ABSTRACT_ACCOUNT_ASSERT( success, encoding_exception, "unable to encode message ${type}", ("type", msg.GetDescriptor()->full_name()) );

   return bytes;
}

std::unique_ptr< google::protobuf::Message > decode_msg( const std::string& type_url, const std::string& value )
{
   auto pos = type_url.find_last_of( '/' );
   auto type_name = pos == std::string::npos ? std::string() : type_url.substr( pos + 1 );
   ABSTRACT_ACCOUNT_ASSERT( type_name.size(), decode_exception, "malformed type url '${url}'", ("url", type_url) );

   const auto* descriptor = google::protobuf::DescriptorPool::generated_pool()->FindMessageTypeByName( type_name );
   ABSTRACT_ACCOUNT_ASSERT( descriptor != nullptr, decode_exception, "unknown message type ${url}", ("url", type_url) );

   const auto* prototype = google::protobuf::MessageFactory::generated_factory()->GetPrototype( descriptor );
   ABSTRACT_ACCOUNT_ASSERT( prototype != nullptr, decode_exception, "no prototype for message type ${url}", ("url", type_url) );

   std::unique_ptr< google::protobuf::Message > msg( prototype->New() );
   ABSTRACT_ACCOUNT_ASSERT( msg->ParseFromString( value ), decode_exception, "unable to decode message of type ${url}", ("url", type_url) );

   return msg;
}

std::vector< protocol::stargate_msg > to_stargate_msgs( const std::vector< const google::protobuf::Message* >& msgs )
{
   std::vector< protocol::stargate_msg > stargate_msgs;
   stargate_msgs.reserve( msgs.size() );

   for ( const auto* msg : msgs )
   {
      ABSTRACT_ACCOUNT_ASSERT( msg != nullptr, encoding_exception, "transaction contains a null message" );

      protocol::stargate_msg stargate_msg;
      stargate_msg.set_type_url( msg_type_url( *msg ) );
      stargate_msg.set_value( encode_msg( *msg ) );
      stargate_msgs.emplace_back( std::move( stargate_msg ) );
   }

   return stargate_msgs;
}

} // abstract_account
