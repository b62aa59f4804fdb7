#pragma once

/**
 * @file error.hpp
 * @brief Error codes, error values and the Result type returned by fallible operations.
 */

#include "brush/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace brush {

/// @brief Category of a failed operation.
enum class ErrorCode : u8 {
    CanvasNotFound,           ///< Canvas handle is unknown or destroyed.
    ImageNotFound,            ///< Image handle is unknown or destroyed.
    GeometryNotFound,         ///< Geometry handle is unknown or destroyed.
    MaterialNotFound,         ///< Material handle is unknown or destroyed.
    LayoutNotFound,           ///< Vertex layout handle is unknown or destroyed.
    AttributeNotFound,        ///< Vertex attribute handle is unknown.
    UnsupportedPixelFormat,   ///< Pixel format has no codec.
    UnknownMaterialProperty,  ///< Material property name is not recognised.
    InvalidArgument,          ///< Argument out of range or of the wrong shape.
    DeviceError               ///< The render device rejected a request.
};

/// @brief Return the enumerator name of an error code (e.g. "CanvasNotFound").
const char* errorCodeName(ErrorCode code);

/// @brief A typed failure with an optional human-readable detail.
struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;  ///< Failure category.
    std::string message;                          ///< Detail, may be empty.

    /// @brief Format as "<CodeName>: <message>", or just the code name.
    std::string describe() const;

    bool operator==(const Error& o) const { return code == o.code && message == o.message; }
};

/// @brief Either a value of type T or an Error.
///
/// Returned by every fallible operation. Accessing value() on a failed
/// result (or error() on a successful one) is a programming error.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }
    const Error& error() const { return std::get<1>(data_); }

    /// @brief Return the value, or fallback if this result holds an error.
    T valueOr(T fallback) const { return ok() ? std::get<0>(data_) : std::move(fallback); }

private:
    std::variant<T, Error> data_;
};

/// @brief Success (no value) or an Error.
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

} // namespace brush
