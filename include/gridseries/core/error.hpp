#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace gridseries {

/// Fatal failure categories. Per-geography conditions (geometry outside the
/// grid, days without data coverage) are not errors; they are counted in
/// AggregateReport and simply produce no rows.
enum class ErrorKind : std::uint8_t {
    InvalidParameter,
    SourceReadFailure,
    WriteFailure,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

struct Error {
    ErrorKind kind = ErrorKind::InvalidParameter;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline auto invalid_parameter(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::InvalidParameter, .message = std::move(message)});
}

[[nodiscard]] inline auto source_read_failure(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::SourceReadFailure, .message = std::move(message)});
}

[[nodiscard]] inline auto write_failure(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::WriteFailure, .message = std::move(message)});
}

}  // namespace gridseries
