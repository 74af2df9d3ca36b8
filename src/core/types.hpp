#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

namespace orion {

// Token quantities are 256-bit words; overflow and underflow throw instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;
using SignedAmount = boost::multiprecision::checked_int256_t;
using WideAmount = boost::multiprecision::checked_uint512_t;

using Address = std::string;
using AssetId = std::string;
using VaultId = std::string;
using Timestamp = std::uint64_t;  // seconds since epoch

constexpr std::uint32_t BASIS_POINTS = 10000;
constexpr std::uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;
constexpr std::uint64_t INTENT_SCALE = 1000000000ULL;
constexpr unsigned SHARE_DECIMALS = 18;

enum class OrderSide {
    BUY,
    SELL
};

enum class VaultType {
    TRANSPARENT,
    ENCRYPTED
};

enum class VaultStatus {
    ACTIVE,
    DECOMMISSIONING,
    DECOMMISSIONED
};

enum class Rounding {
    FLOOR,
    CEIL
};

enum class FeeType {
    ABSOLUTE,
    SOFT_HURDLE,
    HARD_HURDLE,
    HIGH_WATER_MARK,
    HURDLE_HWM
};

struct FeeModel {
    FeeType type = FeeType::ABSOLUTE;
    std::uint32_t performance_fee_bps = 0;
    std::uint32_t management_fee_bps = 0;
    Amount high_water_mark = 0;  // underlying units per whole share, 0 = never set
};

struct IntentEntry {
    AssetId asset;
    std::uint64_t weight = 0;  // fraction of INTENT_SCALE
};

using Intent = std::vector<IntentEntry>;

// asset -> amount in the asset's smallest units
using Portfolio = std::map<AssetId, Amount>;

struct PriceQuote {
    Amount price = 0;             // underlying per whole asset unit, scaled by 10^price_decimals
    unsigned price_decimals = 0;
};

using PriceSnapshot = std::map<AssetId, PriceQuote>;

struct AssetInfo {
    unsigned decimals = 18;
    std::optional<Amount> dust_threshold;  // overrides the protocol-wide threshold
};

struct Order {
    AssetId asset;
    OrderSide side = OrderSide::BUY;
    Amount amount = 0;                      // asset units
    Amount estimated_underlying_value = 0;  // underlying units at the epoch price snapshot
    bool drain = false;
};

inline std::string to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline std::string to_string(VaultType type) {
    return type == VaultType::TRANSPARENT ? "TRANSPARENT" : "ENCRYPTED";
}

inline std::string to_string(VaultStatus status) {
    switch (status) {
        case VaultStatus::ACTIVE: return "ACTIVE";
        case VaultStatus::DECOMMISSIONING: return "DECOMMISSIONING";
        case VaultStatus::DECOMMISSIONED: return "DECOMMISSIONED";
    }
    return "UNKNOWN";
}

inline std::string to_string(FeeType type) {
    switch (type) {
        case FeeType::ABSOLUTE: return "ABSOLUTE";
        case FeeType::SOFT_HURDLE: return "SOFT_HURDLE";
        case FeeType::HARD_HURDLE: return "HARD_HURDLE";
        case FeeType::HIGH_WATER_MARK: return "HIGH_WATER_MARK";
        case FeeType::HURDLE_HWM: return "HURDLE_HWM";
    }
    return "UNKNOWN";
}

} // namespace orion
