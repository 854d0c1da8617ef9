#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "temp_audio_file.hpp"
#include "whisper/lan_backend.hpp"

#include <cstdint>
#include <string>
#include <vector>

TEST_CASE("LAN backend", "[whisper]") {
    ScratchDir dir;

    SECTION("Name") {
        LanBackend backend("http://127.0.0.1:1");
        REQUIRE(backend.name() == "lan");
    }

    SECTION("MissingAudioFile") {
        LanBackend backend("http://127.0.0.1:1");
        auto res = backend.transcribe((dir.path() / "gone.wav").string());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("empty or unreadable audio file") != std::string::npos);
    }

    SECTION("EmptyRecordingIsNotUploaded") {
        auto file = TempAudioFile::create({}, 16000, dir.path().string());
        REQUIRE(file.has_value());

        LanBackend backend("http://127.0.0.1:1");
        auto res = backend.transcribe(file->path());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("empty or unreadable audio file") != std::string::npos);
    }

    SECTION("UnreachableServer") {
        std::vector<int16_t> samples(16000, 1000);
        auto file = TempAudioFile::create(samples, 16000, dir.path().string());
        REQUIRE(file.has_value());

        // Port 1 on loopback refuses the connection immediately.
        LanBackend backend("http://127.0.0.1:1", "openai");
        auto res = backend.transcribe(file->path());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("curl error") != std::string::npos);
    }

    SECTION("StopBeforeUpload") {
        std::vector<int16_t> samples(16000, 1000);
        auto file = TempAudioFile::create(samples, 16000, dir.path().string());
        REQUIRE(file.has_value());

        std::stop_source stop;
        stop.request_stop();
        LanBackend backend("http://127.0.0.1:1");
        auto res = backend.transcribe(file->path(), stop.get_token());
        REQUIRE_FALSE(res.has_value());
    }
}
