#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// 16-bit PCM WAV in memory. Little-endian hosts only, like the rest of the
// audio path (PipeWire is asked for S16_LE).
namespace wav {

inline constexpr size_t kHeaderSize = 44;

struct Pcm {
    std::vector<int16_t> samples; // interleaved if channels > 1
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(kHeaderSize + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(1); // PCM
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + kHeaderSize, samples.data(), data_size);
    }

    return out;
}

// Walks the RIFF chunk list, so files with LIST/fact chunks before "data" decode too.
inline std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* t) {
        return std::memcmp(bytes.data() + pos, t, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Pcm pcm;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = r32(pos + 4);
        size_t body = pos + 8;
        if (chunk_size > bytes.size() - body) {
            return std::unexpected("truncated chunk");
        }

        if (tag(pos, "fmt ")) {
            if (chunk_size < 16) return std::unexpected("fmt chunk too short");
            if (r16(body) != 1) return std::unexpected("not PCM");
            pcm.channels = r16(body + 2);
            pcm.sample_rate = r32(body + 4);
            if (r16(body + 14) != 16) return std::unexpected("not 16-bit");
            if (pcm.channels == 0) return std::unexpected("zero channels");
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            pcm.samples.resize(chunk_size / sizeof(int16_t));
            std::memcpy(pcm.samples.data(), bytes.data() + body,
                        pcm.samples.size() * sizeof(int16_t));
            return pcm;
        }

        // Chunks are word aligned
        pos = body + chunk_size + (chunk_size & 1);
    }

    return std::unexpected("no data chunk");
}

} // namespace wav
