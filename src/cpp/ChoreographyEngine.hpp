/**
 * @file ChoreographyEngine.hpp
 * @brief Fixed-rate motion engine for choreographies, sequences and commands
 *
 * Turns timelines of eased per-channel steps into a stream of pulse widths.
 * The engine thread is the only caller of ActuatorDriver::moveTo().
 *
 * @section Runs Runs
 *
 *   - Foreground: at most one choreography or sequence. A new foreground
 *     run preempts the current one unless the current run disallows
 *     interruption and has priority >= the newcomer. A running sequence
 *     only yields to a strictly higher-priority sequence, so queued
 *     sequences play one after another.
 *   - Background: single commands. Not subject to priority.
 *
 * A step that activates on a channel supersedes whatever step (from any run)
 * was still moving that channel.
 *
 * @section Timeline Timeline Construction
 *
 *     start    = delay / modifier
 *     duration = duration / (modifier * step_modifier)
 *     hold     = hold / modifier
 *
 *     Sync group:   ├── step A ─────────────┤
 *                        ├── step B ────────┤   both end at the group end
 *                           ├ step B+offset ┤   offset delays B's start only
 *
 * @section Tick Tick Pipeline
 *
 *     emergency flag? ─yes─> halt every run
 *          │no
 *          v
 *     activate due steps (start = channel's current position)
 *     interpolate -> clamp to absolute limits -> Validator.monitor
 *          -> Driver.moveTo -> observed position -> Validator.monitor
 *     hold / complete / loop
 *
 * @license MIT
 */

#ifndef CHOREOGRAPHY_ENGINE_HPP
#define CHOREOGRAPHY_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ActuatorDriver.hpp"
#include "ActuatorRegistry.hpp"
#include "ChoreographyLibrary.hpp"
#include "MotionTypes.hpp"
#include "SafetyValidator.hpp"

enum class RunStatus { Pending, Running, Completed, Failed, Stopped, NotFound };
enum class RunKind { Choreography, Sequence, Command };

std::string toString(RunStatus status);
std::string toString(RunKind kind);

/// Result of execute() / startSequence() / startCommand()
struct StartResult {
    bool started = false;
    bool blocked = false;     ///< Refused by a non-interruptible foreground run
    std::string run_id;
    std::string reason;
};

/// One scheduled step with its effective timing
struct TimelineEntry {
    ChoreographyStep step;
    double start_ms = 0.0;
    double duration_ms = 0.0;
    double hold_ms = 0.0;
    CommandKind kind = CommandKind::Position;
    double value = 0.0;       ///< Setting value for non-position entries
};

/// Public view of a run
struct RunInfo {
    std::string id;
    std::string name;
    RunKind kind = RunKind::Command;
    RunStatus status = RunStatus::NotFound;
    int priority = 1;
    bool allows_interruption = true;
    int loops_completed = 0;
    double elapsed_ms = 0.0;
    std::string reason;
};

struct EngineStatus {
    bool running = false;
    int tick_hz = 0;
    std::uint64_t ticks = 0;
    bool emergency_stop = false;
    std::optional<RunInfo> foreground;
    std::vector<RunInfo> background;
    std::map<int, int> positions;
};

class ChoreographyEngine {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    /// External audio hook: (cue, offset into the run in ms)
    using AudioCueSink = std::function<void(const std::string& cue, int offset_ms)>;

    /// External name resolution for names the library does not know
    using BehaviorResolver = std::function<std::optional<std::string>(const std::string& name)>;

    static constexpr int DEFAULT_TICK_HZ = 60;
    static constexpr std::size_t HISTORY_LIMIT = 256;
    static constexpr double MIN_MODIFIER = 0.25;
    static constexpr double MAX_MODIFIER = 4.0;

    ChoreographyEngine(ActuatorRegistry& registry,
                       SafetyValidator& validator,
                       ActuatorDriver& driver,
                       ChoreographyLibrary& library,
                       ClockSource clock = &Clock::now);

    ~ChoreographyEngine();

    ChoreographyEngine(const ChoreographyEngine&) = delete;
    ChoreographyEngine& operator=(const ChoreographyEngine&) = delete;

    //=========================================================================
    // STARTING RUNS
    //=========================================================================

    /**
     * @brief Start a library choreography as the foreground run
     *
     * Step targets are clamped into the channel's safe range. A step on an
     * unknown or disabled channel, or inside a safety zone's forbidden
     * range, rejects the whole choreography.
     *
     * @param name Library key, or a name the behavior resolver maps to one
     * @param personality_modifier Global speed scaling, clamped to [0.25, 4]
     * @param intensity_override Replaces the choreography's emotional intensity
     */
    StartResult execute(const std::string& name,
                        double personality_modifier = 1.0,
                        std::optional<double> intensity_override = std::nullopt);

    /// Run an admitted sequence as the foreground run; blocked while another
    /// sequence of equal or higher priority is still running
    StartResult startSequence(const Sequence& sequence, int priority = 1);

    /// Run one admitted command in the background
    StartResult startCommand(const Command& command);

    //=========================================================================
    // STOPPING
    //=========================================================================

    /// Remove a run without moving any actuator
    bool stop(const std::string& run_id);

    void stopAll();

    /// Trigger the validator's emergency stop, halt every run, stop the driver
    void emergencyStop(const std::string& reason);

    /// Command every enabled channel to its home position
    void returnHome();

    //=========================================================================
    // TICKING
    //=========================================================================

    /// Advance all runs to `now`
    void tick(Clock::time_point now);

    /// Advance all runs to the engine clock's current time
    void tick();

    /// Start the background tick thread
    void start(int tick_hz = DEFAULT_TICK_HZ);

    /// Stop and join the tick thread
    void shutdown();

    bool isRunning() const { return running_.load(); }

    //=========================================================================
    // QUERIES
    //=========================================================================

    RunStatus runStatus(const std::string& run_id) const;
    std::optional<RunInfo> runInfo(const std::string& run_id) const;
    EngineStatus status() const;
    std::vector<Choreography> listChoreographies() const;

    /// Record where a channel is without moving it (startup sync)
    void seedPosition(int channel, int position);
    std::optional<int> currentPosition(int channel) const;

    void setAudioCueSink(AudioCueSink sink);
    void setBehaviorResolver(BehaviorResolver resolver);

    /// Effective timeline for a list of authored steps
    static std::vector<TimelineEntry> buildTimeline(const std::vector<ChoreographyStep>& steps,
                                                    double modifier = 1.0);

    /// Effective timeline for sequence commands (delay = offset from start)
    static std::vector<TimelineEntry> buildTimeline(const std::vector<Command>& commands);

private:
    struct ActiveStep {
        std::size_t entry = 0;
        double start_position = 0.0;
        bool settled = false;
    };

    struct Run {
        RunInfo info;
        std::vector<TimelineEntry> timeline;
        std::vector<AudioSyncPoint> cues;
        double overshoot_scale = 1.0;
        int loops_remaining = 1;              ///< -1 = forever
        Clock::time_point started;
        std::size_t next_entry = 0;
        std::size_t next_cue = 0;
        std::map<int, ActiveStep> active;     ///< channel -> in-flight step
    };

    struct PendingCue {
        std::string cue;
        int offset_ms;
    };

    ActuatorRegistry& registry_;
    SafetyValidator& validator_;
    ActuatorDriver& driver_;
    ChoreographyLibrary& library_;
    ClockSource clock_;

    mutable std::mutex mutex_;
    std::optional<Run> foreground_;
    std::vector<Run> background_;
    std::deque<RunInfo> history_;
    std::map<int, int> positions_;
    std::uint64_t ticks_ = 0;

    AudioCueSink audio_sink_;
    BehaviorResolver resolver_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    int tick_hz_ = DEFAULT_TICK_HZ;

    StartResult admitForeground(Run run);
    void finishLocked(Run& run, RunStatus status, const std::string& reason);
    void haltAllLocked(const std::string& reason);
    void emergencyStopLocked(const std::string& reason);

    /// Advance one run; false if an emergency stop fired during it
    bool advanceLocked(Run& run, Clock::time_point now, std::vector<PendingCue>& cues);
    void supersedeLocked(int channel, const Run& owner);
    void applySettingLocked(const TimelineEntry& entry);
    bool isFinished(const Run& run) const;
    void archiveLocked(const RunInfo& info);
    void tickLoop();
};

#endif // CHOREOGRAPHY_ENGINE_HPP
