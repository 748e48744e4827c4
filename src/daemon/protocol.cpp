#include "protocol.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <vector>

namespace protocol {

namespace {

std::vector<std::string_view> split_words(std::string_view line) {
    std::vector<std::string_view> words;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) pos++;
        size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) pos++;
        if (pos > start) words.push_back(line.substr(start, pos - start));
    }
    return words;
}

Result<WindowId> parse_window_id(std::string_view text) {
    WindowId id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return make_error(ErrorKind::ProtocolError, "Invalid window id");
    }
    return id;
}

Result<WindowId> required_window_id(const std::vector<std::string_view>& words) {
    if (words.size() < 2) {
        return make_error(ErrorKind::ProtocolError, "Missing window id");
    }
    return parse_window_id(words[1]);
}

} // namespace

Result<Request> parse_request(std::string_view line) {
    auto words = split_words(line);
    if (words.empty()) {
        return make_error(ErrorKind::ProtocolError, "Unknown command");
    }

    auto cmd = words[0];

    if (cmd == "add" || cmd == "remove") {
        auto id = required_window_id(words);
        if (!id) return std::unexpected(id.error());
        if (cmd == "add") return Add{*id};
        return Remove{*id};
    }

    if (cmd == "list") return List{};
    if (cmd == "toggle_active") return ToggleActive{};

    if (cmd == "stage") {
        if (words.size() < 2) {
            return make_error(ErrorKind::ProtocolError, "Missing argument for stage");
        }
        auto arg = words[1];
        if (arg == "--all") return Stage{.all = true};
        if (arg == "--list") return Stage{.list = true};
        if (arg == "--active") return Stage{.active = true};
        auto id = parse_window_id(arg);
        if (!id) return std::unexpected(id.error());
        return Stage{.window_id = *id};
    }

    if (cmd == "unstage") {
        if (words.size() < 2) {
            return make_error(ErrorKind::ProtocolError, "Missing argument for unstage");
        }
        auto arg = words[1];
        if (arg == "--all") return Unstage{.all = true};
        if (arg == "--active") return Unstage{.active = true};
        auto id = parse_window_id(arg);
        if (!id) return std::unexpected(id.error());
        return Unstage{.window_id = *id};
    }

    return make_error(ErrorKind::ProtocolError, "Unknown command");
}

std::string format_request(const Request& request) {
    struct Formatter {
        std::string operator()(const Add& r) const { return std::format("add {}", r.window_id); }
        std::string operator()(const Remove& r) const { return std::format("remove {}", r.window_id); }
        std::string operator()(const List&) const { return "list"; }
        std::string operator()(const ToggleActive&) const { return "toggle_active"; }
        std::string operator()(const Stage& r) const {
            if (r.all) return "stage --all";
            if (r.list) return "stage --list";
            if (r.active) return "stage --active";
            return std::format("stage {}", r.window_id.value_or(0));
        }
        std::string operator()(const Unstage& r) const {
            if (r.all) return "unstage --all";
            if (r.active) return "unstage --active";
            return std::format("unstage {}", r.window_id.value_or(0));
        }
    };
    return std::visit(Formatter{}, request) + "\n";
}

std::string format_response(const Response& response) {
    if (response.kind == Response::Kind::Error) {
        return "Error: " + response.text + "\n";
    }
    return response.text + "\n";
}

} // namespace protocol
