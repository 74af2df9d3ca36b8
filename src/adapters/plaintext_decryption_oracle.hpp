#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include "core/adapters.hpp"
#include "core/types.hpp"

namespace orion {

/**
 * Stand-in for a threshold decryption service. "Ciphertexts" are JSON intents,
 * [{"asset": "WETH", "weight": 600000000}, ...], resolved after a fixed number of service
 * rounds. The driver calls advance_round() between keeper runs; with zero rounds a request
 * resolves as soon as it is made. A ciphertext that does not parse resolves to an empty intent.
 */
class PlaintextDecryptionOracle : public DecryptionOracle {
public:
    explicit PlaintextDecryptionOracle(std::size_t rounds_until_resolved = 0);

    static std::string encode_intent(const Intent& intent);

    std::string request_decryption(const VaultId& vault, const std::string& ciphertext) override;
    bool is_resolved(const std::string& request_id) const override;
    std::optional<Intent> poll(const std::string& request_id) override;

    // One round of the decryption service: every pending request ages by one.
    void advance_round();
    std::size_t pending_requests() const;

private:
    struct Request {
        VaultId vault;
        std::string ciphertext;
        std::size_t rounds = 0;
        std::optional<Intent> result;
    };

    static Intent decode_intent(const VaultId& vault, const std::string& ciphertext);
    const Request& find_request(const std::string& request_id) const;

    std::size_t rounds_until_resolved_;
    std::size_t next_id_ = 1;
    std::map<std::string, Request> requests_;
};

} // namespace orion
