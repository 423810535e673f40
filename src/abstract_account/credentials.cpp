#include <abstract_account/credentials.hpp>
#include <abstract_account/exceptions.hpp>

namespace abstract_account {

uint64_t signer_account_number( const tx_context& ctx, const protocol::contract_account& account )
{
   // Outside genesis the stored account number is signed over. Genesis
   // transactions sign over 0 to agree with the default signature verifier;
   // earlier releases signed over the stored number here as well.
   if ( ctx.is_genesis() )
      return 0;

   return account.account_number();
}

credentials prepare_credentials(
   const tx_context& ctx,
   const tx& t,
   const protocol::contract_account& account,
   const signature_data& data,
   const sign_mode_handler& handler )
{
   const auto* single = std::get_if< single_signature_data >( &data );
   ABSTRACT_ACCOUNT_ASSERT(
      single != nullptr,
      unsupported_signature_shape_exception,
      "account ${address} must be signed with a single signature",
      ("address", account.address())
   );

   signer_data signer;
   signer.address        = account.address();
   signer.chain_id       = ctx.chain_id();
   signer.account_number = signer_account_number( ctx, account );
   signer.sequence       = account.sequence();
   signer.public_key     = account.public_key();

   credentials creds;
   creds.sign_bytes = handler.get_sign_bytes( single->mode, signer, t );
   creds.signature  = single->signature;

   return creds;
}

} // abstract_account
