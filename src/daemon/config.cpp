#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::niri_socket() const {
    return niri.socket.empty() ? platform::niri_socket() : niri.socket;
}

std::string Config::ipc_socket() const {
    return ipc.socket.empty() ? platform::ipc_endpoint() : ipc.socket;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("niri")) {
            auto& n = j["niri"];
            if (n.contains("socket")) cfg.niri.socket = n["socket"].get<std::string>();
            if (n.contains("timeout_ms")) {
                auto& t = n["timeout_ms"];
                if (t.is_number_unsigned() && t.get<uint64_t>() >= Niri::MIN_TIMEOUT_MS &&
                    t.get<uint64_t>() <= Niri::MAX_TIMEOUT_MS) {
                    cfg.niri.timeout_ms = t.get<uint32_t>();
                } else {
                    std::println(stderr, "config: niri.timeout_ms must be {}..{}, keeping {}",
                                 Niri::MIN_TIMEOUT_MS, Niri::MAX_TIMEOUT_MS, cfg.niri.timeout_ms);
                }
            }
        }

        if (j.contains("ipc")) {
            auto& i = j["ipc"];
            if (i.contains("socket")) cfg.ipc.socket = i["socket"].get<std::string>();
        }

        if (j.contains("stage")) {
            auto& s = j["stage"];
            if (s.contains("workspace")) cfg.stage.workspace = s["workspace"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
