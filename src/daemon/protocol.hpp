#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace protocol {

struct Add {
    WindowId window_id;
};
struct Remove {
    WindowId window_id;
};
struct List {};
struct ToggleActive {};

// Exactly one of the targets is set.
struct Stage {
    std::optional<WindowId> window_id;
    bool all = false;
    bool list = false;
    bool active = false;
};
struct Unstage {
    std::optional<WindowId> window_id;
    bool all = false;
    bool active = false;
};

using Request = std::variant<Add, Remove, List, ToggleActive, Stage, Unstage>;

struct Response {
    enum class Kind { Success, Error, Data };
    Kind kind;
    std::string text;

    static Response success(std::string msg) { return {Kind::Success, std::move(msg)}; }
    static Response error(std::string msg) { return {Kind::Error, std::move(msg)}; }
    static Response data(std::string msg) { return {Kind::Data, std::move(msg)}; }
};

Result<Request> parse_request(std::string_view line);

// Inverse of parse_request, used by the client.
std::string format_request(const Request& request);

// One newline-terminated line. Errors get the "Error: " prefix.
std::string format_response(const Response& response);

} // namespace protocol
