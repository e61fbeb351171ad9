#pragma once
#include <string>
#include <utility>

namespace aeo_engine::common {

// Outcome of an operation that reports failure instead of throwing
template <typename T>
struct Result {
    bool success = false;
    T value{};
    std::string message;

    static Result<T> Success(T value, const std::string& message = "") {
        return { true, std::move(value), message };
    }

    static Result<T> Failure(const std::string& message) {
        return { false, T{}, message };
    }

    Result(bool success, T value, const std::string& message)
        : success(success), value(std::move(value)), message(message)
    {
    }

    Result() = default;

    explicit operator bool() const { return success; }
};

} // namespace aeo_engine::common
