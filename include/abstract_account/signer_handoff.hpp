#pragma once

#include <optional>
#include <string>

namespace abstract_account {

/**
 * Carries the address of a contract account signer from the ante stage of a
 * transaction to its post stage. Holds at most one address; a write replaces
 * whatever was there.
 */
class signer_handoff final
{
public:
   void write( const std::string& address );
   std::optional< std::string > read() const;
   void clear();

private:
   std::optional< std::string > _signer;
};

} // abstract_account
