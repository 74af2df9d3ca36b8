#pragma once

#include <optional>
#include <string>
#include "core/adapters.hpp"
#include <gmock/gmock.h>

namespace orion {
namespace testing {

class MockDecryptionOracle : public orion::DecryptionOracle {
public:
    MOCK_METHOD(std::string, request_decryption, (const orion::VaultId&, const std::string&), (override));
    MOCK_METHOD(bool, is_resolved, (const std::string&), (const, override));
    MOCK_METHOD(std::optional<orion::Intent>, poll, (const std::string&), (override));
};

} // namespace testing
} // namespace orion
