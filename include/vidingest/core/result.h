#pragma once

#include <optional>
#include <utility>

#include "vidingest/core/error.h"

namespace vidingest::core {

/// @brief Value-or-error return used at every module boundary.
///
/// Stores and the session manager never throw across their interfaces; callers
/// branch on ok() and map code() to an HTTP status at the edge.
template <typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    const T& value() const { return value_.value(); }
    T& value() { return value_.value(); }
    const Error& error() const { return error_; }
    /// kOk on success.
    ErrorCode code() const { return error_.code; }

private:
    std::optional<T> value_;
    Error error_{ErrorCode::kOk, ""};
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : ok_(false), error_(error) {}
    Result(Error&& error) : ok_(false), error_(std::move(error)) {}

    bool ok() const { return ok_; }
    void value() const {}
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    bool ok_{true};
    Error error_{ErrorCode::kOk, ""};
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace vidingest::core
