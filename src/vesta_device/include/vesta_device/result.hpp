/**
 * @file result.hpp
 * @brief Result<T>：值或 Error，无链式组合，只做检查与解包
 */

#pragma once

#include <vesta_device/error.hpp>

#include <cassert>
#include <optional>
#include <utility>
#include <variant>

namespace vesta_device {

template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}      // NOLINT implicit
    Result(Error error) : data_(std::move(error)) {}  // NOLINT implicit

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & {
        assert(ok() && "called value() on error Result");
        return std::get<T>(data_);
    }

    const T& value() const& {
        assert(ok() && "called value() on error Result");
        return std::get<T>(data_);
    }

    T value() && {
        assert(ok() && "called value() on error Result");
        return std::move(std::get<T>(data_));
    }

    const Error& error() const& {
        assert(!ok() && "called error() on ok Result");
        return std::get<Error>(data_);
    }

    T orThrow() && {
        if (!ok()) throw DeviceError(std::get<Error>(data_));
        return std::move(std::get<T>(data_));
    }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}  // NOLINT implicit

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const& {
        assert(!ok() && "called error() on ok Result<void>");
        return *error_;
    }

    void orThrow() && {
        if (!ok()) throw DeviceError(*error_);
    }

private:
    std::optional<Error> error_;
};

}  // namespace vesta_device
