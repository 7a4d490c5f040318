#pragma once

#include <rndr/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: ledger error code.
// Stable numeric failure codes reported in transaction results. Envelope
// errors never touch state; ledger errors roll the transaction back.
namespace rndr::schema {

enum class ledger_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  not_owner = 10,
  not_authorized = 11,
  invalid_address = 12,
  invalid_recipient = 13,
  insufficient_balance = 14,
  insufficient_allowance = 15,
  insufficient_escrow_balance = 16,
  no_balance = 17,
  length_mismatch = 18,
  escrow_not_configured = 19,
  arithmetic_overflow = 20,
  unknown_contract = 30,
  unsupported_operation = 31,
  invalid_deposit_data = 32,
  migration_unavailable = 33,
};

inline constexpr auto kLedgerErrorCodeNames = std::array{
    std::pair{std::string_view{"invalid_transaction"},
              ledger_error_code::invalid_transaction},
    std::pair{std::string_view{"unsupported_transaction_version"},
              ledger_error_code::unsupported_transaction_version},
    std::pair{std::string_view{"invalid_chain_id"},
              ledger_error_code::invalid_chain_id},
    std::pair{std::string_view{"invalid_nonce"},
              ledger_error_code::invalid_nonce},
    std::pair{std::string_view{"invalid_signature_type"},
              ledger_error_code::invalid_signature_type},
    std::pair{std::string_view{"signature_verification_failed"},
              ledger_error_code::signature_verification_failed},
    std::pair{std::string_view{"not_owner"}, ledger_error_code::not_owner},
    std::pair{std::string_view{"not_authorized"},
              ledger_error_code::not_authorized},
    std::pair{std::string_view{"invalid_address"},
              ledger_error_code::invalid_address},
    std::pair{std::string_view{"invalid_recipient"},
              ledger_error_code::invalid_recipient},
    std::pair{std::string_view{"insufficient_balance"},
              ledger_error_code::insufficient_balance},
    std::pair{std::string_view{"insufficient_allowance"},
              ledger_error_code::insufficient_allowance},
    std::pair{std::string_view{"insufficient_escrow_balance"},
              ledger_error_code::insufficient_escrow_balance},
    std::pair{std::string_view{"no_balance"}, ledger_error_code::no_balance},
    std::pair{std::string_view{"length_mismatch"},
              ledger_error_code::length_mismatch},
    std::pair{std::string_view{"escrow_not_configured"},
              ledger_error_code::escrow_not_configured},
    std::pair{std::string_view{"arithmetic_overflow"},
              ledger_error_code::arithmetic_overflow},
    std::pair{std::string_view{"unknown_contract"},
              ledger_error_code::unknown_contract},
    std::pair{std::string_view{"unsupported_operation"},
              ledger_error_code::unsupported_operation},
    std::pair{std::string_view{"invalid_deposit_data"},
              ledger_error_code::invalid_deposit_data},
    std::pair{std::string_view{"migration_unavailable"},
              ledger_error_code::migration_unavailable},
};

constexpr std::string_view to_string(const ledger_error_code code) {
  return to_string(code, kLedgerErrorCodeNames).value_or("unknown_error");
}

constexpr std::optional<ledger_error_code> try_ledger_error_code_from_string(
    const std::string_view name) {
  return from_string(name, kLedgerErrorCodeNames);
}

}  // namespace rndr::schema
