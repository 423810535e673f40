#pragma once

#include <abstract_account/tx.hpp>
#include <abstract_account/types.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace abstract_account {

class sign_mode_handler
{
public:
   virtual ~sign_mode_handler() = default;

   virtual protocol::sign_mode default_mode() const = 0;
   virtual std::vector< protocol::sign_mode > modes() const = 0;

   virtual std::string get_sign_bytes( protocol::sign_mode mode, const signer_data& data, const tx& t ) const = 0;
};

/**
 * Signs over sign_doc{ body_bytes, auth_info_bytes, chain_id, account_number }
 * using the exact body and auth info bytes the transaction was submitted with.
 */
class direct_sign_mode_handler final : public sign_mode_handler
{
public:
   protocol::sign_mode default_mode() const override;
   std::vector< protocol::sign_mode > modes() const override;

   std::string get_sign_bytes( protocol::sign_mode mode, const signer_data& data, const tx& t ) const override;
};

class sign_mode_handler_map final : public sign_mode_handler
{
public:
   sign_mode_handler_map( protocol::sign_mode default_mode, const std::vector< std::shared_ptr< sign_mode_handler > >& handlers );

   protocol::sign_mode default_mode() const override;
   std::vector< protocol::sign_mode > modes() const override;

   std::string get_sign_bytes( protocol::sign_mode mode, const signer_data& data, const tx& t ) const override;

private:
   protocol::sign_mode                                              _default_mode;
   std::map< protocol::sign_mode, std::shared_ptr< sign_mode_handler > > _handlers;
};

} // abstract_account
