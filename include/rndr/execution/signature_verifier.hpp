#pragma once

#include <rndr/schema/primitives.hpp>
#include <functional>

namespace rndr::execution {

using signature_verifier_t =
    std::function<bool(const rndr::schema::bytes_view_t& message,
                       const rndr::schema::signer_id_t& signer,
                       const rndr::schema::signature_t& signature)>;

}  // namespace rndr::execution
