/**
 * @file AudioCueClient.hpp
 * @brief Fire-and-forget HTTP delivery of choreography audio cues
 *
 * The engine reports cues from its tick thread; HTTP must never block it.
 * trigger() only enqueues, a worker thread does the libcurl POST:
 *
 *     POST <url>
 *     {"type": "trigger_audio", "audio_context": "<cue>", "offset_ms": <n>}
 *
 * Failures are logged and dropped. When the backlog is full the oldest cue
 * is discarded, since a late sound is worse than a missing one.
 *
 * @license MIT
 */

#ifndef AUDIO_CUE_CLIENT_HPP
#define AUDIO_CUE_CLIENT_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

class AudioCueClient {
public:
    static constexpr std::size_t MAX_BACKLOG = 16;
    static constexpr long DEFAULT_TIMEOUT_MS = 1000;

    explicit AudioCueClient(std::string url, long timeout_ms = DEFAULT_TIMEOUT_MS);
    ~AudioCueClient();

    AudioCueClient(const AudioCueClient&) = delete;
    AudioCueClient& operator=(const AudioCueClient&) = delete;

    void start();
    void shutdown();

    /// Queue a cue for delivery (never blocks on the network)
    void trigger(const std::string& cue, int offset_ms);

    /// Request body for one cue
    static std::string buildPayload(const std::string& cue, int offset_ms);

    std::size_t backlog() const;
    std::size_t delivered() const { return delivered_.load(); }
    std::size_t failed() const { return failed_.load(); }
    std::size_t dropped() const { return dropped_.load(); }

    const std::string& url() const { return url_; }

private:
    std::string url_;
    long timeout_ms_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> backlog_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> dropped_{0};
    std::thread worker_;

    bool post(const std::string& body);
    void workerLoop();
};

#endif // AUDIO_CUE_CLIENT_HPP
