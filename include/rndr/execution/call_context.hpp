#pragma once

#include <rndr/execution/state_scope.hpp>
#include <rndr/schema/primitives.hpp>

namespace rndr::execution {

class contract_directory;

/// Who is calling, and where the call reads and writes.
///
/// For a nested call between contracts `caller` is the calling contract's
/// address, never the original transaction signer.
struct call_context final {
  state_scope& scope;
  rndr::schema::address_t caller{};
  const contract_directory& contracts;
};

}  // namespace rndr::execution
