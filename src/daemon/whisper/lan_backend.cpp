#include "lan_backend.hpp"
#include "../wav.hpp"

#include <chrono>
#include <cstring>
#include <curl/curl.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const std::stop_token*>(userdata)->stop_requested() ? 1 : 0;
}

// Duration is read from the header only; the body goes to curl straight from disk.
double wav_duration(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::vector<uint8_t> header(wav::kHeaderSize);
    if (!f.read(reinterpret_cast<char*>(header.data()), header.size())) return 0.0;

    uint32_t sample_rate;
    uint32_t data_size;
    std::memcpy(&sample_rate, header.data() + 24, 4);
    std::memcpy(&data_size, header.data() + 40, 4);
    if (sample_rate == 0) return 0.0;
    return static_cast<double>(data_size / sizeof(int16_t)) / sample_rate;
}

void add_field(curl_mime* mime, const char* name, const char* value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value, CURL_ZERO_TERMINATED);
}

} // namespace

LanBackend::LanBackend(std::string url, std::string api_format, std::string language)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(const std::string& wav_path, std::stop_token stop) {
    double duration_s = wav_duration(wav_path);
    if (duration_s <= 0.0) {
        return std::unexpected("empty or unreadable audio file " + wav_path);
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* file_part = curl_mime_addpart(mime);
    curl_mime_name(file_part, "file");
    CURLcode file_rc = curl_mime_filedata(file_part, wav_path.c_str());
    curl_mime_filename(file_part, "audio.wav");
    curl_mime_type(file_part, "audio/wav");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_field(mime, "model", "whisper-1");
        add_field(mime, "language", language_.c_str());
        add_field(mime, "response_format", "json");
    } else {
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        add_field(mime, "response_format", "json");
        if (!language_.empty()) {
            add_field(mime, "language", language_.c_str());
        }
    }

    if (file_rc != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected(std::string("cannot attach audio: ") + curl_easy_strerror(file_rc));
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("transcription aborted");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    try {
        auto j = json::parse(response_body);

        if (j.contains("error")) {
            auto& err = j["error"];
            // OpenAI nests the message in an object; whisper.cpp sends a string.
            std::string msg = err.is_object() ? err.value("message", err.dump())
                                              : err.is_string() ? err.get<std::string>() : err.dump();
            return std::unexpected("server error: " + msg);
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response (HTTP " + std::to_string(http_status) +
                                   "): " + response_body);
        }

        return TranscriptResult{
            .text = trim_whitespace(j["text"].get<std::string>()),
            .duration_s = duration_s,
            .processing_s = processing_s,
        };
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
