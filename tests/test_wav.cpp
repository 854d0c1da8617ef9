#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "temp_audio_file.hpp"
#include "wav.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

void write_u32(std::vector<uint8_t>& buf, size_t pos, uint32_t v) {
    std::memcpy(buf.data() + pos, &v, 4);
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

std::vector<uint8_t> slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == wav::kHeaderSize + samples.size() * 2);

        // PCM, mono, 16-bit
        REQUIRE(read_u32(wav.data() + 16) == 16);
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 32) == 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);

        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        // RIFF chunk size = file_size - 8
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("StereoHeader") {
        auto wav = wav::encode(samples, 48000, 2);
        REQUIRE(read_u16(wav.data() + 22) == 2);
        REQUIRE(read_u32(wav.data() + 28) == 48000 * 4);
        REQUIRE(read_u16(wav.data() + 32) == 4);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == wav::kHeaderSize);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768, 7};

    SECTION("ReadsEncodedFile") {
        auto pcm = wav::decode(wav::encode(samples, 16000));
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->sample_rate == 16000);
        REQUIRE(pcm->channels == 1);
        REQUIRE(pcm->samples == samples);
    }

    SECTION("SkipsUnknownChunks") {
        auto bytes = wav::encode(samples, 16000);
        // Splice an odd-sized LIST chunk (plus pad byte) between fmt and data.
        std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 3, 0, 0, 0, 'a', 'b', 'c', 0};
        bytes.insert(bytes.begin() + 36, list.begin(), list.end());
        write_u32(bytes, 4, static_cast<uint32_t>(bytes.size() - 8));

        auto pcm = wav::decode(bytes);
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->samples == samples);
    }

    SECTION("RejectsGarbage") {
        std::vector<uint8_t> junk(64, 0x41);
        auto pcm = wav::decode(junk);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "not a RIFF/WAVE file");
        REQUIRE_FALSE(wav::decode({}).has_value());
    }

    SECTION("RejectsTruncatedData") {
        auto bytes = wav::encode(samples, 16000);
        bytes.resize(bytes.size() - 4);
        auto pcm = wav::decode(bytes);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "truncated chunk");
    }

    SECTION("RejectsNonPcm") {
        auto bytes = wav::encode(samples, 16000);
        bytes[20] = 3; // IEEE float
        REQUIRE(wav::decode(bytes).error() == "not PCM");
    }

    SECTION("Rejects8Bit") {
        auto bytes = wav::encode(samples, 16000);
        bytes[34] = 8;
        REQUIRE(wav::decode(bytes).error() == "not 16-bit");
    }

    SECTION("MissingDataChunk") {
        auto bytes = wav::encode(samples, 16000);
        bytes.resize(36);
        write_u32(bytes, 4, 28);
        REQUIRE(wav::decode(bytes).error() == "no data chunk");
    }
}

TEST_CASE("TempAudioFile", "[wav]") {
    ScratchDir dir;
    std::vector<int16_t> samples(1600, 1234);

    SECTION("WritesWavAndUnlinksOnDestruction") {
        std::string path;
        {
            auto file = TempAudioFile::create(samples, 16000, dir.path().string());
            REQUIRE(file.has_value());
            path = file->path();
            REQUIRE(fs::path(path).parent_path() == dir.path());
            REQUIRE(fs::path(path).filename().string().starts_with("voice-daemon-"));
            REQUIRE(path.ends_with(".wav"));

            auto pcm = wav::decode(slurp(path));
            REQUIRE(pcm.has_value());
            REQUIRE(pcm->samples == samples);
        }
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE(dir.empty());
    }

    SECTION("PrivateToOwner") {
        auto file = TempAudioFile::create(samples, 16000, dir.path().string());
        REQUIRE(file.has_value());
        struct stat st {};
        REQUIRE(::stat(file->path().c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("ExplicitRemove") {
        auto file = TempAudioFile::create(samples, 16000, dir.path().string());
        REQUIRE(file.has_value());
        std::string path = file->path();
        file->remove();
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE(file->path().empty());
        file->remove();
    }

    SECTION("MoveTransfersOwnership") {
        auto file = TempAudioFile::create(samples, 16000, dir.path().string());
        REQUIRE(file.has_value());
        std::string path = file->path();

        TempAudioFile moved = std::move(*file);
        REQUIRE(file->path().empty());
        REQUIRE(moved.path() == path);
        REQUIRE(fs::exists(path));

        moved.remove();
        REQUIRE(dir.empty());
    }

    SECTION("DistinctNames") {
        auto a = TempAudioFile::create(samples, 16000, dir.path().string());
        auto b = TempAudioFile::create(samples, 16000, dir.path().string());
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->path() != b->path());
    }

    SECTION("MissingDirectory") {
        auto file = TempAudioFile::create(samples, 16000, (dir.path() / "nope").string());
        REQUIRE_FALSE(file.has_value());
        REQUIRE(file.error().find("mkstemps") != std::string::npos);
    }
}
