#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "vd_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        REQUIRE(fd >= 0);
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for one scope.
class EnvOverride {
public:
    EnvOverride(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) saved_ = old;
        ::setenv(name, value, 1);
    }
    ~EnvOverride() {
        if (saved_) ::setenv(name_, saved_->c_str(), 1);
        else ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> saved_;
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.model == "small");
        REQUIRE(cfg.backend.language == "en");
        REQUIRE(cfg.backend.beam_size == 5);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.chunk_samples == 8192);
        REQUIRE(cfg.audio.silence_threshold == 400.0);
        REQUIRE(cfg.audio.silence_seconds == 5.0);
        REQUIRE(cfg.audio.max_seconds == 3600.0);
        REQUIRE(cfg.audio.ring_buffer_bytes() == 30 * 16000 * sizeof(int16_t));
        REQUIRE(cfg.output.prefer == "xdotool");
        REQUIRE(cfg.output.press_enter);
        REQUIRE(cfg.hotkey == "<ctrl>+<alt>+v");
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "type": "lan",
                "model": "base",
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "language": "de",
                "threads": 8
            },
            "audio": { "silence_threshold": 250, "silence_seconds": 2.5, "max_seconds": 60 },
            "output": { "prefer": "ydotool", "press_enter": false, "typing_delay_ms": 0 },
            "hotkey": "<super>+<f9>",
            "notifications": false,
            "lock_file": "/run/user/1000/vd.pid"
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.model == "base");
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.backend.threads == 8);
        REQUIRE(cfg.audio.silence_threshold == 250.0);
        REQUIRE(cfg.audio.silence_seconds == 2.5);
        REQUIRE(cfg.audio.max_seconds == 60.0);
        REQUIRE(cfg.output.prefer == "ydotool");
        REQUIRE_FALSE(cfg.output.press_enter);
        REQUIRE(cfg.output.typing_delay_ms == 0);
        REQUIRE(cfg.hotkey == "<super>+<f9>");
        REQUIRE_FALSE(cfg.notifications);
        REQUIRE(cfg.resolved_lock_file() == "/run/user/1000/vd.pid");
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.model == "small");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadWrongType") {
        TmpFile f(R"({ "audio": { "silence_seconds": "five" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.silence_seconds == 5.0);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/vd_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }
}

TEST_CASE("Config validation", "[config]") {
    Config cfg;

    SECTION("ModelSizes") {
        for (const char* m : {"tiny", "base", "small", "medium"}) {
            REQUIRE(Config::is_valid_model(m));
        }
        REQUIRE_FALSE(Config::is_valid_model("large"));
        REQUIRE_FALSE(Config::is_valid_model(""));

        cfg.backend.model = "huge";
        auto res = cfg.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("huge") != std::string::npos);
    }

    SECTION("BackendType") {
        cfg.backend.type = "cloud";
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("SilenceDuration") {
        cfg.audio.silence_seconds = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("MaxAboveMin") {
        cfg.audio.max_seconds = 0.25;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("PreferredTypist") {
        cfg.output.prefer = "wtype";
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("Threads") {
        cfg.backend.threads = 0;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("RingBufferHoldsAChunk") {
        cfg.audio.buffer_seconds = 0;
        auto res = cfg.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("buffer_seconds") != std::string::npos);

        // 16000 * 2 bytes per second cannot hold a 32768-byte chunk.
        cfg.audio.buffer_seconds = 1;
        cfg.audio.chunk_samples = 16384;
        REQUIRE_FALSE(cfg.validate().has_value());

        cfg.audio.chunk_samples = 16000;
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LocalBackendNeeds16kHz") {
        cfg.audio.sample_rate = 48000;
        auto res = cfg.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("16000") != std::string::npos);

        cfg.backend.type = "lan";
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("DefaultsAreValid") {
        REQUIRE(cfg.validate().has_value());
    }
}

TEST_CASE("Config paths", "[config]") {
    Config cfg;

    SECTION("LockFileUnderConfigDir") {
        EnvOverride xdg("XDG_CONFIG_HOME", "/home/test/.cfg");
        REQUIRE(cfg.resolved_lock_file() == "/home/test/.cfg/voice-daemon/voice-daemon.pid");
    }

    SECTION("LockFileFromHome") {
        EnvOverride xdg("XDG_CONFIG_HOME", "");
        EnvOverride home("HOME", "/home/test");
        REQUIRE(cfg.resolved_lock_file() == "/home/test/.config/voice-daemon/voice-daemon.pid");
    }

    SECTION("ModelDirUnderDataDir") {
        EnvOverride xdg("XDG_DATA_HOME", "/home/test/.data");
        REQUIRE(cfg.resolved_model_dir() == "/home/test/.data/voice-daemon/models");

        cfg.backend.model_dir = "/opt/models";
        REQUIRE(cfg.resolved_model_dir() == "/opt/models");
    }
}
