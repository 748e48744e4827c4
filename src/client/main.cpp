#include "config.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "protocol.hpp"

#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [-c PATH] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  add <window-id>                      Add a window to the sticky list");
    std::println(stderr, "  remove <window-id>                   Remove a window from the sticky list");
    std::println(stderr, "  list                                 List sticky windows");
    std::println(stderr, "  toggle-active                        Toggle stickiness of the focused window");
    std::println(stderr, "  stage <window-id|--all|--list|--active>");
    std::println(stderr, "                                       Park sticky windows on the stage workspace");
    std::println(stderr, "  unstage <window-id|--all|--active>   Bring staged windows to the current workspace");
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::vector<std::string> words;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && words.empty()) {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 1;
            }
            config_path = argv[++i];
        } else if ((arg == "--help" || arg == "-h") && words.empty()) {
            usage(argv[0]);
            return 0;
        } else {
            words.push_back(arg);
        }
    }

    if (words.empty()) {
        usage(argv[0]);
        return 1;
    }
    if (words[0] == "toggle-active") words[0] = "toggle_active";

    // stage and unstage take exactly one target
    size_t expected_words = (words[0] == "list" || words[0] == "toggle_active") ? 1 : 2;
    if (words.size() > expected_words) {
        std::println(stderr, "Unexpected argument: {}", words[expected_words]);
        usage(argv[0]);
        return 1;
    }

    std::string line;
    for (auto& w : words) {
        if (!line.empty()) line += ' ';
        line += w;
    }

    auto request = protocol::parse_request(line);
    if (!request) {
        std::println(stderr, "Error: {}", request.error().message);
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    UnixSocketClient client;
    auto sock_path = config.ipc_socket();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is nsticky-daemon running?");
        return 1;
    }

    if (!client.send(protocol::format_request(*request))) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    std::string response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.starts_with("Error: ")) {
        std::println(stderr, "{}", response);
        return 1;
    }

    std::println("{}", response);
    return 0;
}
