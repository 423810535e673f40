#include <abstract_account/types.hpp>

namespace abstract_account {

const std::string& get_address( const account& acc )
{
   return std::visit( overloaded {
      []( const protocol::base_account& a ) -> const std::string& { return a.address(); },
      []( const protocol::contract_account& a ) -> const std::string& { return a.address(); }
   }, acc );
}

} // abstract_account
