#pragma once
#include "typed_data.hpp"

#include <cstdint>
#include <vector>

// Signing capability. Owns the key (or the device holding it);
// the pipeline only hands it typed data and normalizes what comes back.
class ISigner {
public:
    virtual ~ISigner() = default;

    // Returns 65 bytes r || s || v, v in {0,1} or {27,28}.
    // May block on a hardware round-trip; serializing device access is the implementation's job.
    virtual std::vector<std::uint8_t> sign_typed_data(const TypedDataDomain& domain,
                                                      const TypedDataSchema& types,
                                                      const PhantomAgent& message) = 0;
};
