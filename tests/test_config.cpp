#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "nsticky_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        std::ofstream(path) << content;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.niri.socket.empty());
        REQUIRE(cfg.niri.timeout_ms == 2000);
        REQUIRE(cfg.niri.timeout() == std::chrono::milliseconds{2000});
        REQUIRE(cfg.ipc.socket.empty());
        REQUIRE(cfg.stage.workspace == "stage");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "niri": { "socket": "/run/user/1000/niri.sock", "timeout_ms": 500 },
            "ipc": { "socket": "/tmp/nsticky-test.sock" },
            "stage": { "workspace": "parking" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.niri.socket == "/run/user/1000/niri.sock");
        REQUIRE(cfg.niri.timeout_ms == 500);
        REQUIRE(cfg.ipc.socket == "/tmp/nsticky-test.sock");
        REQUIRE(cfg.stage.workspace == "parking");
        REQUIRE(cfg.niri_socket() == "/run/user/1000/niri.sock");
        REQUIRE(cfg.ipc_socket() == "/tmp/nsticky-test.sock");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "stage": { "workspace": "scratch" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.stage.workspace == "scratch");
        // Other fields retain defaults
        REQUIRE(cfg.niri.timeout_ms == 2000);
        REQUIRE(cfg.ipc.socket.empty());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.stage.workspace == "stage");
        REQUIRE(cfg.niri.timeout_ms == 2000);
    }

    SECTION("OutOfRangeTimeoutKeepsDefault") {
        for (const char* bad : {"-1", "0", "4294967296", "99999999999", "2.5", "\"500\""}) {
            TmpFile f(std::string(R"({ "niri": { "timeout_ms": )") + bad +
                      R"( }, "stage": { "workspace": "kept" } })");

            auto cfg = Config::load(f.path);
            REQUIRE(cfg.niri.timeout_ms == 2000);
            REQUIRE(cfg.niri.timeout() == std::chrono::milliseconds{2000});
            REQUIRE(cfg.stage.workspace == "kept");
        }

        TmpFile max(R"({ "niri": { "timeout_ms": 600000 } })");
        REQUIRE(Config::load(max.path).niri.timeout_ms == Config::Niri::MAX_TIMEOUT_MS);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/nsticky_test_nonexistent_config_file.json");
        REQUIRE(cfg.stage.workspace == "stage");
    }

    SECTION("EmptySocketsFallBackToEnvironment") {
        ::setenv("NIRI_SOCKET", "/tmp/nsticky-test-niri.sock", 1);
        ::setenv("XDG_RUNTIME_DIR", "/tmp/nsticky-runtime", 1);

        Config cfg;
        REQUIRE(cfg.niri_socket() == "/tmp/nsticky-test-niri.sock");
        REQUIRE(cfg.ipc_socket() == "/tmp/nsticky-runtime/nsticky.sock");

        ::unsetenv("XDG_RUNTIME_DIR");
        REQUIRE(cfg.ipc_socket() == "/tmp/niri_sticky_cli.sock");
    }
}
