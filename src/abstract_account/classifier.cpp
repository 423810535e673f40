#include <abstract_account/classifier.hpp>
#include <abstract_account/exceptions.hpp>

namespace abstract_account {

classification classify_tx( const tx_context& ctx, const tx& t, const account_keeper& accounts )
{
   const auto* sig_tx = dynamic_cast< const sig_verifiable_tx* >( &t );
   ABSTRACT_ACCOUNT_ASSERT( sig_tx != nullptr, decode_exception, "transaction is not a sig_verifiable_tx" );

   auto signatures = sig_tx->get_signatures();
   auto signers    = sig_tx->get_signers();

   if ( signers.size() != 1 || signatures.size() != 1 )
      return not_applicable{};

   auto signer_account = accounts.get_account( ctx, signers.front() );
   ABSTRACT_ACCOUNT_ASSERT( signer_account.has_value(), unknown_address_exception, "account ${address} does not exist", ("address", signers.front()) );

   return std::visit( overloaded {
      []( const protocol::base_account& ) -> classification
      {
         return not_applicable{};
      },
      [&]( const protocol::contract_account& a ) -> classification
      {
         return qualifies{ a, std::move( signatures.front() ) };
      }
   }, *signer_account );
}

} // abstract_account
