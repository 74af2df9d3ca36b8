#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"
#include "core/result.hpp"

namespace orion {
namespace utils {

struct ConfigIssue {
    std::string field;
    std::string message;
    std::string value;
};

class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationErrors = std::vector<ConfigIssue>;

    // Validate complete configuration
    static ValidationResult validate_config(const nlohmann::json& config);

    // Validate specific sections
    static ValidationResult validate_app_config(const nlohmann::json& app_config);
    static ValidationResult validate_logging_config(const nlohmann::json& logging_config);
    static ValidationResult validate_protocol_config(const nlohmann::json& protocol_config);
    static ValidationResult validate_asset_config(const nlohmann::json& asset_config);
    static ValidationResult validate_vault_config(const nlohmann::json& vault_config);
    static ValidationResult validate_market_config(const nlohmann::json& market_config);

    static const ValidationErrors& get_errors() { return errors_; }
    static void clear_errors() { errors_.clear(); }

private:
    static ValidationErrors errors_;

    static bool validate_required_field(const nlohmann::json& config, const std::string& field);
    static bool validate_string_field(const nlohmann::json& config, const std::string& field,
                                      size_t min_length = 0, size_t max_length = SIZE_MAX);
    static bool validate_numeric_field(const nlohmann::json& config, const std::string& field,
                                       double min_value = -std::numeric_limits<double>::infinity(),
                                       double max_value = std::numeric_limits<double>::infinity());
    static bool validate_integer_field(const nlohmann::json& config, const std::string& field,
                                       std::int64_t min_value, std::int64_t max_value);
    static bool validate_boolean_field(const nlohmann::json& config, const std::string& field);
    static bool validate_array_field(const nlohmann::json& config, const std::string& field,
                                     size_t min_size = 0, size_t max_size = SIZE_MAX);
    static bool validate_enum_field(const nlohmann::json& config, const std::string& field,
                                    const std::vector<std::string>& valid_values);
    // Unsigned decimal string; empty is allowed when `optional`.
    static bool validate_amount_field(const nlohmann::json& config, const std::string& field, bool optional);
    static bool validate_bps_field(const nlohmann::json& config, const std::string& field, std::int64_t max_bps);

    static void add_error(const std::string& field, const std::string& message, const std::string& value = "");
};

} // namespace utils
} // namespace orion
