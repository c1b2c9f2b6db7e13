#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace NM {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput,
        InvalidThemePath,
        UnserializableType,
        NotFound,
        NotSupported,
        InvalidOptions,
        BuildFailed,
        LifecycleInconsistency,
        PatchConflict
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidThemePath:
        return "invalid_theme_path";
    case Error::Code::UnserializableType:
        return "unserializable_type";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::InvalidOptions:
        return "invalid_options";
    case Error::Code::BuildFailed:
        return "build_failed";
    case Error::Code::LifecycleInconsistency:
        return "lifecycle_inconsistency";
    case Error::Code::PatchConflict:
        return "patch_conflict";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

[[nodiscard]] inline auto make_error(std::string message, Error::Code code = Error::Code::UnknownError) -> Error {
    return Error{code, std::move(message)};
}

} // namespace NM
