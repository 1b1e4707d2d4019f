/**
 * @file Errors.hpp
 * @brief Error taxonomy shared by the engine, the HAL and the C API.
 */

#ifndef MEGAPHONE_ERRORS_HPP
#define MEGAPHONE_ERRORS_HPP

#include <optional>
#include <utility>

namespace megaphone {

/**
 * @brief Status codes returned across the engine.
 *
 * Values are stable: the C API returns them negated (see CInterface.h).
 * Ring buffer overruns/underruns are not errors; they are counted in
 * SessionDiagnostics.
 */
enum class ErrorCode : int {
    Ok = 0,
    PermissionDenied = 1,
    DeviceUnavailable = 2,
    DeviceLost = 3,
    DecodeError = 4,
    NotFound = 5,
    ConfigError = 6,
    InvalidState = 7
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::DeviceLost: return "DeviceLost";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

/**
 * @brief Either a value or the ErrorCode explaining why there is none.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(ErrorCode::Ok) {}
    Result(ErrorCode error) : error_(error) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    ErrorCode error() const { return error_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const T& operator*() const { return *value_; }

    T value_or(T fallback) const { return value_.value_or(std::move(fallback)); }

private:
    std::optional<T> value_;
    ErrorCode error_;
};

} // namespace megaphone

#endif // MEGAPHONE_ERRORS_HPP
