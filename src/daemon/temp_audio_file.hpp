#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// A WAV file created with mkstemps (mode 0600) and unlinked on destruction.
// Move-only; the moved-from object owns nothing.
class TempAudioFile {
public:
    static std::expected<TempAudioFile, std::string>
        create(std::span<const int16_t> samples, uint32_t sample_rate, const std::string& dir);

    TempAudioFile(TempAudioFile&& other) noexcept;
    TempAudioFile& operator=(TempAudioFile&& other) noexcept;
    ~TempAudioFile();

    TempAudioFile(const TempAudioFile&) = delete;
    TempAudioFile& operator=(const TempAudioFile&) = delete;

    const std::string& path() const { return path_; }

    // Unlink now instead of at destruction.
    void remove();

private:
    explicit TempAudioFile(std::string path) : path_(std::move(path)) {}

    std::string path_;
};
