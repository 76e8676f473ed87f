/**
 * @file AudioCueClient.cpp
 * @brief libcurl audio cue delivery
 *
 * @license MIT
 */

#include "AudioCueClient.hpp"

#include <iostream>
#include <utility>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;


namespace {

// CURL callback for response bodies (kept for error logging)
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

}  // namespace


//=============================================================================
// CONSTRUCTOR / DESTRUCTOR
//=============================================================================

AudioCueClient::AudioCueClient(std::string url, long timeout_ms)
    : url_(std::move(url)),
      timeout_ms_(timeout_ms)
{
}


AudioCueClient::~AudioCueClient() {
    shutdown();
}


//=============================================================================
// LIFECYCLE
//=============================================================================

void AudioCueClient::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&AudioCueClient::workerLoop, this);
    std::cout << "[Audio] Cue delivery to " << url_ << std::endl;
}


void AudioCueClient::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::cout << "[Audio] Stopped (" << delivered_ << " delivered, " << failed_
              << " failed, " << dropped_ << " dropped)" << std::endl;
}


//=============================================================================
// QUEUEING
//=============================================================================

void AudioCueClient::trigger(const std::string& cue, int offset_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (backlog_.size() >= MAX_BACKLOG) {
            backlog_.pop_front();
            ++dropped_;
        }
        backlog_.push_back(buildPayload(cue, offset_ms));
    }
    cv_.notify_one();
}


std::string AudioCueClient::buildPayload(const std::string& cue, int offset_ms) {
    json body = {
        {"type", "trigger_audio"},
        {"audio_context", cue},
        {"offset_ms", offset_ms}
    };
    return body.dump();
}


std::size_t AudioCueClient::backlog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}


//=============================================================================
// WORKER
//=============================================================================

void AudioCueClient::workerLoop() {
    while (true) {
        std::string body;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !backlog_.empty(); });
            if (!running_) {
                return;
            }
            body = std::move(backlog_.front());
            backlog_.pop_front();
        }

        if (post(body)) {
            ++delivered_;
        } else {
            ++failed_;
        }
    }
}


bool AudioCueClient::post(const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "[Audio] Failed to initialize CURL" << std::endl;
        return false;
    }

    std::string response_string;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "[Audio] CURL error: " << curl_easy_strerror(res) << std::endl;
        return false;
    }
    if (http_code >= 400) {
        std::cerr << "[Audio] HTTP " << http_code << ": " << response_string << std::endl;
        return false;
    }
    return true;
}
