#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace interrupt_filter {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    IOError,
    ParseError,
    InvalidConfig,
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::InvalidConfig, message);
}

} // namespace interrupt_filter
