#pragma once

#include <optional>
#include <string>
#include "types.hpp"

namespace orion {

// Source of the epoch price snapshot. Throws when no reliable price exists.
class PriceAdapter {
public:
    virtual ~PriceAdapter() = default;

    virtual PriceQuote quote(const AssetId& asset) = 0;
};

class ExecutionAdapter {
public:
    virtual ~ExecutionAdapter() = default;

    /**
     * SELL: `bound` is the minimum underlying to receive; returns underlying received.
     * BUY:  `bound` is the maximum underlying to spend; returns underlying spent.
     * `amount` is in the asset's smallest units.
     */
    virtual Amount execute(OrderSide side, const AssetId& asset, const Amount& amount,
                           const Amount& bound) = 0;
};

class DecryptionOracle {
public:
    virtual ~DecryptionOracle() = default;

    virtual std::string request_decryption(const VaultId& vault, const std::string& ciphertext) = 0;

    // Status query only; never advances or consumes the request.
    virtual bool is_resolved(const std::string& request_id) const = 0;

    // Plaintext intent once the request is resolved.
    virtual std::optional<Intent> poll(const std::string& request_id) = 0;
};

} // namespace orion
