#pragma once
#include <abstract_account/exception.hpp>

namespace abstract_account {

// Errors that abort the current transaction. Block processing continues with the next one.
ABSTRACT_ACCOUNT_DECLARE_EXCEPTION( tx_failure_exception );

ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( decode_exception, tx_failure_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( unsupported_signature_shape_exception, tx_failure_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( encoding_exception, tx_failure_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( unsupported_sign_mode_exception, encoding_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( contract_invocation_exception, tx_failure_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( unknown_address_exception, tx_failure_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( default_verification_exception, tx_failure_exception );

// Configuration exceptions
ABSTRACT_ACCOUNT_DECLARE_EXCEPTION( config_exception );
ABSTRACT_ACCOUNT_DECLARE_DERIVED_EXCEPTION( invalid_params_exception, config_exception );

} // abstract_account
