#include "lan_speech_engine.hpp"

#include "pcm.hpp"
#include "segmenting_stream.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

LanSpeechEngine::LanSpeechEngine(Options opts) : opts_(std::move(opts)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanSpeechEngine::~LanSpeechEngine() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<SpeechStream>, std::string> LanSpeechEngine::open_stream() {
    if (opts_.url.empty()) {
        return std::unexpected("speech engine url is not configured");
    }
    return std::make_unique<SegmentingSpeechStream>(
        opts_.segmenter,
        [this](std::span<const int16_t> mono, uint32_t sample_rate) {
            return transcribe(mono, sample_rate);
        });
}

std::expected<SpeechAlternative, std::string>
LanSpeechEngine::transcribe(std::span<const int16_t> mono, uint32_t sample_rate) const {
    if (mono.empty()) {
        return SpeechAlternative{};
    }

    auto wav_data = pcm::encode_wav(mono, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(file, "utterance.wav");
    curl_mime_type(file, "audio/wav");

    if (opts_.api_format == "openai") {
        endpoint = opts_.url + "/v1/audio/transcriptions";
        add_field(mime, "model", "whisper-1");
        add_field(mime, "response_format", "json");
        if (!opts_.language.empty()) add_field(mime, "language", opts_.language);
    } else {
        endpoint = opts_.url + "/inference";
        add_field(mime, "temperature", "0.0");
        add_field(mime, "response_format", "json");
        if (!opts_.language.empty()) add_field(mime, "language", opts_.language);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts_.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected("speech server returned HTTP " + std::to_string(status));
    }

    try {
        auto j = json::parse(response_body);
        if (j.contains("error")) {
            auto& err = j["error"];
            return std::unexpected("server error: " +
                                   (err.is_string() ? err.get<std::string>() : err.dump()));
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + response_body);
        }

        SpeechAlternative alt{.text = j["text"].get<std::string>(), .confidence = std::nullopt};
        if (j.contains("confidence") && j["confidence"].is_number()) {
            alt.confidence = j["confidence"].get<double>();
        }

        auto first = alt.text.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) {
            alt.text.clear();
        } else {
            auto last = alt.text.find_last_not_of(" \t\n\r");
            alt.text = alt.text.substr(first, last - first + 1);
        }
        return alt;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
