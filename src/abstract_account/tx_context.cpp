#include <abstract_account/constants.hpp>
#include <abstract_account/tx_context.hpp>

namespace abstract_account {

tx_context::tx_context( const std::string& chain_id, uint64_t block_height ) :
   _chain_id( chain_id ),
   _block_height( block_height )
{}

const std::string& tx_context::chain_id() const
{
   return _chain_id;
}

uint64_t tx_context::block_height() const
{
   return _block_height;
}

bool tx_context::is_genesis() const
{
   return _block_height == genesis_height;
}

signer_handoff& tx_context::handoff()
{
   return _handoff;
}

const signer_handoff& tx_context::handoff() const
{
   return _handoff;
}

} // abstract_account
