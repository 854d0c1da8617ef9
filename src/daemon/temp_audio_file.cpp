#include "temp_audio_file.hpp"

#include "wav.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <unistd.h>
#include <utility>
#include <vector>

std::expected<TempAudioFile, std::string>
TempAudioFile::create(std::span<const int16_t> samples, uint32_t sample_rate, const std::string& dir) {
    std::string tmpl = dir + "/voice-daemon-XXXXXX.wav";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), 4);
    if (fd < 0) {
        return std::unexpected("mkstemps(" + tmpl + ") failed: " + std::strerror(errno));
    }

    // Owns the path from here on, so every failure below unlinks it.
    TempAudioFile file(std::string(buf.data()));

    auto bytes = wav::encode(samples, sample_rate);
    size_t total = 0;
    while (total < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + total, bytes.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return std::unexpected("write(" + file.path() + ") failed: " + std::strerror(err));
        }
        total += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        return std::unexpected("close(" + file.path() + ") failed: " + std::strerror(errno));
    }

    return file;
}

TempAudioFile::TempAudioFile(TempAudioFile&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

TempAudioFile& TempAudioFile::operator=(TempAudioFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

TempAudioFile::~TempAudioFile() {
    remove();
}

void TempAudioFile::remove() {
    if (path_.empty()) return;
    if (::unlink(path_.c_str()) < 0 && errno != ENOENT) {
        std::println(stderr, "tmpfile: unlink({}) failed: {}", path_, std::strerror(errno));
    }
    path_.clear();
}
