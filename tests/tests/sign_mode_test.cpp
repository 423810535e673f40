#include <boost/test/unit_test.hpp>

#include <abstract_account/exceptions.hpp>
#include <abstract_account/sign_mode_handler.hpp>

#include <abstract_account/tests/util.hpp>
#include <abstract_account/tests/msgs.pb.h>

using namespace abstract_account;

namespace {

// Stands in for a tx that cannot provide its raw bytes
class opaque_tx final : public tx
{
public:
   std::vector< const google::protobuf::Message* > get_msgs() const override { return {}; }
};

class textual_sign_mode_handler final : public sign_mode_handler
{
public:
   protocol::sign_mode default_mode() const override { return protocol::sign_mode_textual; }
   std::vector< protocol::sign_mode > modes() const override { return { protocol::sign_mode_textual }; }

   std::string get_sign_bytes( protocol::sign_mode, const signer_data& data, const tx& ) const override
   {
      return "textual:" + data.address;
   }
};

} // anonymous

struct sign_mode_fixture
{
   sign_mode_fixture()
   {
      send.set_from_address( "alice" );
      send.set_to_address( "bob" );
      t = tests::make_tx( { &send }, { tests::make_signer_info( "pubkey", tests::single_mode() ) }, { "sig" } );

      data.address = "alice";
      data.chain_id = "chain";
      data.account_number = 7;
      data.sequence = 2;
   }

   tests::msg_send               send;
   std::shared_ptr< wrapped_tx > t;
   signer_data                   data;
};

BOOST_FIXTURE_TEST_SUITE( sign_mode_tests, sign_mode_fixture )

BOOST_AUTO_TEST_CASE( direct_sign_mode_test )
{ try {
   direct_sign_mode_handler handler;
   BOOST_REQUIRE( handler.default_mode() == protocol::sign_mode_direct );
   BOOST_REQUIRE_EQUAL( handler.modes().size(), 1 );

   BOOST_TEST_MESSAGE( "Direct sign bytes are the sign doc over the submitted bytes" );
   auto sign_bytes = handler.get_sign_bytes( protocol::sign_mode_direct, data, *t );

   protocol::sign_doc doc;
   BOOST_REQUIRE( doc.ParseFromString( sign_bytes ) );
   BOOST_REQUIRE_EQUAL( doc.body_bytes(), t->raw().body_bytes() );
   BOOST_REQUIRE_EQUAL( doc.auth_info_bytes(), t->raw().auth_info_bytes() );
   BOOST_REQUIRE_EQUAL( doc.chain_id(), "chain" );
   BOOST_REQUIRE_EQUAL( doc.account_number(), 7 );

   BOOST_TEST_MESSAGE( "Sign bytes change with the account number" );
   data.account_number = 8;
   BOOST_REQUIRE_NE( handler.get_sign_bytes( protocol::sign_mode_direct, data, *t ), sign_bytes );

   BOOST_TEST_MESSAGE( "Other modes are rejected" );
   BOOST_REQUIRE_THROW( handler.get_sign_bytes( protocol::sign_mode_textual, data, *t ), unsupported_sign_mode_exception );
   BOOST_REQUIRE_THROW( handler.get_sign_bytes( protocol::sign_mode_unspecified, data, *t ), unsupported_sign_mode_exception );

   BOOST_TEST_MESSAGE( "Transactions without raw bytes cannot be signed directly" );
   BOOST_REQUIRE_THROW( handler.get_sign_bytes( protocol::sign_mode_direct, data, opaque_tx() ), encoding_exception );
} ABSTRACT_ACCOUNT_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( sign_mode_handler_map_test )
{ try {
   auto direct = std::make_shared< direct_sign_mode_handler >();
   auto textual = std::make_shared< textual_sign_mode_handler >();

   sign_mode_handler_map handlers( protocol::sign_mode_direct, { direct, textual } );
   BOOST_REQUIRE( handlers.default_mode() == protocol::sign_mode_direct );
   BOOST_REQUIRE_EQUAL( handlers.modes().size(), 2 );

   BOOST_TEST_MESSAGE( "Requests are dispatched by mode" );
   BOOST_REQUIRE_EQUAL( handlers.get_sign_bytes( protocol::sign_mode_textual, data, *t ), "textual:alice" );
   BOOST_REQUIRE_EQUAL(
      handlers.get_sign_bytes( protocol::sign_mode_direct, data, *t ),
      direct->get_sign_bytes( protocol::sign_mode_direct, data, *t ) );

   BOOST_TEST_MESSAGE( "Unregistered modes are rejected" );
   BOOST_REQUIRE_THROW( handlers.get_sign_bytes( protocol::sign_mode_legacy_amino_json, data, *t ), unsupported_sign_mode_exception );
   BOOST_REQUIRE_THROW( handlers.get_sign_bytes( protocol::sign_mode_unspecified, data, *t ), unsupported_sign_mode_exception );

   BOOST_TEST_MESSAGE( "Two handlers for one mode are rejected" );
   BOOST_REQUIRE_THROW( sign_mode_handler_map( protocol::sign_mode_direct, { direct, direct } ), invalid_params_exception );

   BOOST_TEST_MESSAGE( "The default mode must have a handler" );
   BOOST_REQUIRE_THROW( sign_mode_handler_map( protocol::sign_mode_legacy_amino_json, { direct } ), invalid_params_exception );

   BOOST_TEST_MESSAGE( "A null handler is rejected" );
   std::vector< std::shared_ptr< sign_mode_handler > > with_null { direct, nullptr };
   BOOST_REQUIRE_THROW( sign_mode_handler_map( protocol::sign_mode_direct, with_null ), invalid_params_exception );
} ABSTRACT_ACCOUNT_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
