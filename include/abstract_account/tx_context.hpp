#pragma once

#include <abstract_account/signer_handoff.hpp>

#include <cstdint>
#include <string>

namespace abstract_account {

/**
 * State scoped to the processing of a single transaction. The ledger creates
 * one per transaction and passes it by reference to every ante and post stage.
 */
class tx_context final
{
public:
   tx_context() = delete;
   tx_context( const std::string& chain_id, uint64_t block_height );

   tx_context( const tx_context& ) = delete;
   tx_context& operator=( const tx_context& ) = delete;

   const std::string& chain_id() const;
   uint64_t block_height() const;
   bool is_genesis() const;

   signer_handoff& handoff();
   const signer_handoff& handoff() const;

private:
   std::string    _chain_id;
   uint64_t       _block_height;
   signer_handoff _handoff;
};

} // abstract_account
