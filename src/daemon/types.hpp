#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <unordered_set>
#include <variant>

using WindowId = uint64_t;
using WorkspaceId = uint64_t;
using WindowSet = std::unordered_set<WindowId>;

// Destination of a move: a numeric workspace or a named one (the stage).
struct WorkspaceName {
    std::string name;
};
using WorkspaceRef = std::variant<WorkspaceId, WorkspaceName>;

enum class ErrorKind {
    NotFound,
    InvalidState,
    ActiveWindowUnavailable,
    RemoteActionFailure,
    RegistryError,
    ProtocolError,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

std::string describe(const WorkspaceRef& ref);

// Renders ids as "[1, 2, 3]".
std::string format_window_ids(std::span<const WindowId> ids);
