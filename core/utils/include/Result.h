#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <functional>
#include <utility>

namespace CubeLink {

/**
 * @brief Error carried by a failed Result
 *
 * code holds an ErrorCode value (see ErrorCodes.h); component names the
 * subsystem that produced it.
 */
struct Error {
    std::string message;
    int code{0};
    std::string component;

    Error() = default;
    Error(std::string msg, int c = 0, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}

    std::string toString() const {
        std::string result = message;
        if (!component.empty()) {
            result = "[" + component + "] " + result;
        }
        if (code != 0) {
            result += " (code: " + std::to_string(code) + ")";
        }
        return result;
    }
};

/**
 * @brief Value-or-error return type for synchronous operations
 *
 * Usage:
 *   auto room = registry.joinRoom(code);
 *   if (!room) {
 *       logger.warn(room.error().toString(), "CLI");
 *       return 1;
 *   }
 *   use(room.value());
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    T& value() {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

    Result& onError(const std::function<void(const E&)>& callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    std::variant<T, E> data_;
};

// Success/error only
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    Result& onError(const std::function<void(const E&)>& callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

} // namespace CubeLink
