#pragma once

#include <provenance/schema/primitives.hpp>
#include <functional>

namespace provenance::crypto {

/// Verification hook; `verify_signature` unless replaced for tests.
using signature_verifier_t =
    std::function<bool(const provenance::schema::bytes_view_t&,
                       const provenance::schema::signer_id_t&,
                       const provenance::schema::signature_t&)>;

}  // namespace provenance::crypto
