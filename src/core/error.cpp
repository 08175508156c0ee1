#include <gridseries/core/error.hpp>

#include <fmt/format.h>

namespace gridseries {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::InvalidParameter:
            return "invalid parameter";
        case ErrorKind::SourceReadFailure:
            return "source read failure";
        case ErrorKind::WriteFailure:
            return "write failure";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace gridseries
