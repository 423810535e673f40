#include <abstract_account/exceptions.hpp>
#include <abstract_account/transcoder.hpp>
#include <abstract_account/tx.hpp>

#include <abstract_account/protocol/options.pb.h>

#include <google/protobuf/descriptor.h>

#include <algorithm>

namespace abstract_account {

wrapped_tx::wrapped_tx( const protocol::tx_raw& raw ) :
   _raw( raw )
{
   ABSTRACT_ACCOUNT_ASSERT( _body.ParseFromString( _raw.body_bytes() ), decode_exception, "unable to decode transaction body" );
   ABSTRACT_ACCOUNT_ASSERT( _auth_info.ParseFromString( _raw.auth_info_bytes() ), decode_exception, "unable to decode transaction auth info" );

   _msgs.reserve( _body.messages_size() );

   for ( const auto& any : _body.messages() )
   {
      _msgs.emplace_back( decode_msg( any.type_url(), any.value() ) );

      for ( auto& signer : get_msg_signers( *_msgs.back() ) )
      {
         if ( std::find( _signers.begin(), _signers.end(), signer ) == _signers.end() )
            _signers.emplace_back( std::move( signer ) );
      }
   }
}

std::vector< const google::protobuf::Message* > wrapped_tx::get_msgs() const
{
   std::vector< const google::protobuf::Message* > msgs;
   msgs.reserve( _msgs.size() );

   for ( const auto& msg : _msgs )
      msgs.push_back( msg.get() );

   return msgs;
}

std::vector< std::string > wrapped_tx::get_signers() const
{
   return _signers;
}

std::vector< signature_v2 > wrapped_tx::get_signatures() const
{
   const auto& signer_infos = _auth_info.signer_infos();

   ABSTRACT_ACCOUNT_ASSERT(
      signer_infos.size() == _raw.signatures_size(),
      decode_exception,
      "transaction has ${infos} signer infos but ${sigs} signatures",
      ("infos", signer_infos.size())("sigs", _raw.signatures_size())
   );

   std::vector< signature_v2 > signatures;
   signatures.reserve( signer_infos.size() );

   for ( int i = 0; i < signer_infos.size(); i++ )
   {
      const auto& info = signer_infos.Get( i );

      signature_v2 sig;
      sig.public_key = info.public_key();
      sig.data       = mode_info_to_signature_data( info.mode_info(), _raw.signatures( i ) );
      sig.sequence   = info.sequence();

      signatures.emplace_back( std::move( sig ) );
   }

   return signatures;
}

const protocol::tx_raw& wrapped_tx::raw() const
{
   return _raw;
}

const protocol::tx_body& wrapped_tx::body() const
{
   return _body;
}

const protocol::auth_info& wrapped_tx::auth_info() const
{
   return _auth_info;
}

std::shared_ptr< wrapped_tx > decode_tx( const std::string& tx_bytes )
{
   protocol::tx_raw raw;
   ABSTRACT_ACCOUNT_ASSERT( raw.ParseFromString( tx_bytes ), decode_exception, "unable to decode transaction" );
   return std::make_shared< wrapped_tx >( raw );
}

std::vector< std::string > get_msg_signers( const google::protobuf::Message& msg )
{
   const auto* descriptor = msg.GetDescriptor();
   const auto* reflection = msg.GetReflection();
   const auto& options    = descriptor->options();

   auto field_count = options.ExtensionSize( protocol::signer );
   ABSTRACT_ACCOUNT_ASSERT( field_count > 0, decode_exception, "message ${type} does not declare a signer", ("type", descriptor->full_name()) );

   std::vector< std::string > signers;

   for ( int i = 0; i < field_count; i++ )
   {
      const auto& field_name = options.GetExtension( protocol::signer, i );
      const auto* field = descriptor->FindFieldByName( field_name );

      ABSTRACT_ACCOUNT_ASSERT(
         field != nullptr && field->type() == google::protobuf::FieldDescriptor::TYPE_STRING,
         decode_exception,
         "signer field ${field} of message ${type} is not a string field",
         ("field", field_name)("type", descriptor->full_name())
      );

      if ( field->is_repeated() )
      {
         for ( int j = 0; j < reflection->FieldSize( msg, field ); j++ )
            signers.emplace_back( reflection->GetRepeatedString( msg, field, j ) );
      }
      else
      {
         signers.emplace_back( reflection->GetString( msg, field ) );
      }
   }

   for ( const auto& signer : signers )
      ABSTRACT_ACCOUNT_ASSERT( signer.size(), decode_exception, "message ${type} has an empty signer", ("type", descriptor->full_name()) );

   return signers;
}

signature_data mode_info_to_signature_data( const protocol::mode_info& info, const std::string& signature )
{
   switch ( info.sum_case() )
   {
      case protocol::mode_info::kSingle:
         return single_signature_data{ info.single().mode(), signature };
      case protocol::mode_info::kMulti:
      {
         const auto& multi = info.multi();

         protocol::multi_signature multi_sig;
         ABSTRACT_ACCOUNT_ASSERT( multi_sig.ParseFromString( signature ), decode_exception, "unable to decode multisignature" );
         ABSTRACT_ACCOUNT_ASSERT(
            multi_sig.signatures_size() == multi.mode_infos_size(),
            decode_exception,
            "multisignature has ${sigs} signatures but ${infos} mode infos",
            ("sigs", multi_sig.signatures_size())("infos", multi.mode_infos_size())
         );

         multi_signature_data data;
         data.bitarray = multi.bitarray();
         data.signatures.reserve( multi_sig.signatures_size() );

         for ( int i = 0; i < multi_sig.signatures_size(); i++ )
            data.signatures.emplace_back( mode_info_to_signature_data( multi.mode_infos( i ), multi_sig.signatures( i ) ) );

         return data;
      }
      case protocol::mode_info::SUM_NOT_SET:
         break;
   }

   ABSTRACT_ACCOUNT_THROW( decode_exception, "signer info is missing its mode info" );
}

} // abstract_account
