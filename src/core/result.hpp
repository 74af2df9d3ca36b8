#pragma once

#include <string>
#include <utility>
#include <variant>

namespace orion {

// Value or error message, for checks that report rather than throw.
template<typename T>
class Result {
public:
    static Result<T> success(T value) {
        Result<T> result;
        result.state_.template emplace<0>(std::move(value));
        return result;
    }

    static Result<T> error(std::string message) {
        Result<T> result;
        result.state_.template emplace<1>(std::move(message));
        return result;
    }

    bool is_success() const { return state_.index() == 0; }
    bool is_error() const { return state_.index() == 1; }

    const T& value() const { return std::get<0>(state_); }
    const std::string& error() const { return std::get<1>(state_); }

private:
    Result() = default;

    std::variant<T, std::string> state_;
};

} // namespace orion
