#include <abstract_account/signer_handoff.hpp>

namespace abstract_account {

void signer_handoff::write( const std::string& address )
{
   _signer = address;
}

std::optional< std::string > signer_handoff::read() const
{
   return _signer;
}

void signer_handoff::clear()
{
   _signer.reset();
}

} // abstract_account
