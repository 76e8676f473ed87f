/**
 * @file ChoreographyEngine.cpp
 * @brief Fixed-rate motion engine implementation
 *
 * @license MIT
 */

#include "ChoreographyEngine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include "MotionInterpolator.hpp"

namespace {

double msBetween(std::chrono::steady_clock::time_point from,
                 std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

double clampModifier(double modifier) {
    return std::clamp(modifier, ChoreographyEngine::MIN_MODIFIER, ChoreographyEngine::MAX_MODIFIER);
}

} // namespace


//=============================================================================
// STRING CONVERSIONS
//=============================================================================

std::string toString(RunStatus status) {
    switch (status) {
        case RunStatus::Pending:   return "pending";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
        case RunStatus::Stopped:   return "stopped";
        case RunStatus::NotFound:  return "not_found";
    }
    return "not_found";
}

std::string toString(RunKind kind) {
    switch (kind) {
        case RunKind::Choreography: return "choreography";
        case RunKind::Sequence:     return "sequence";
        case RunKind::Command:      return "command";
    }
    return "command";
}


//=============================================================================
// CONSTRUCTOR / DESTRUCTOR
//=============================================================================

ChoreographyEngine::ChoreographyEngine(ActuatorRegistry& registry,
                                       SafetyValidator& validator,
                                       ActuatorDriver& driver,
                                       ChoreographyLibrary& library,
                                       ClockSource clock)
    : registry_(registry),
      validator_(validator),
      driver_(driver),
      library_(library),
      clock_(std::move(clock))
{
}


ChoreographyEngine::~ChoreographyEngine() {
    shutdown();
}


//=============================================================================
// TIMELINE CONSTRUCTION
//=============================================================================

std::vector<TimelineEntry> ChoreographyEngine::buildTimeline(const std::vector<ChoreographyStep>& steps,
                                                             double modifier) {
    const double m = clampModifier(modifier);
    std::vector<TimelineEntry> timeline;
    std::map<std::string, double> group_end;

    for (const auto& step : steps) {
        TimelineEntry entry;
        entry.step = step;
        entry.start_ms = step.delay_ms / m;
        entry.duration_ms = step.duration_ms / (m * clampModifier(step.personality_modifier));
        entry.hold_ms = step.hold_ms / m;
        entry.value = step.end_position;

        if (!step.sync_group.empty()) {
            double end = entry.start_ms + entry.duration_ms;
            auto it = group_end.find(step.sync_group);
            if (it == group_end.end() || it->second < end) {
                group_end[step.sync_group] = end;
            }
        }
        timeline.push_back(entry);
    }

    // Align every group member on the group's latest end
    for (auto& entry : timeline) {
        if (entry.step.sync_group.empty()) {
            continue;
        }
        double end = group_end[entry.step.sync_group];
        entry.start_ms = end - entry.duration_ms;

        double offset = std::min(entry.step.sync_offset_ms / m, entry.duration_ms);
        if (offset > 0.0) {
            entry.start_ms += offset;
            entry.duration_ms -= offset;
        }
    }

    std::stable_sort(timeline.begin(), timeline.end(),
                     [](const TimelineEntry& a, const TimelineEntry& b) {
                         return a.start_ms < b.start_ms;
                     });
    return timeline;
}


std::vector<TimelineEntry> ChoreographyEngine::buildTimeline(const std::vector<Command>& commands) {
    std::vector<TimelineEntry> timeline;
    for (const auto& command : commands) {
        TimelineEntry entry;
        entry.step.channel = command.channel;
        entry.step.duration_ms = command.duration_ms;
        entry.step.delay_ms = command.delay_ms;
        entry.step.easing = command.easing;
        if (command.kind == CommandKind::Position) {
            entry.step.end_position = static_cast<int>(std::lround(command.value));
        }
        entry.start_ms = command.delay_ms;
        entry.duration_ms = command.duration_ms;
        entry.kind = command.kind;
        entry.value = command.value;
        timeline.push_back(entry);
    }

    std::stable_sort(timeline.begin(), timeline.end(),
                     [](const TimelineEntry& a, const TimelineEntry& b) {
                         return a.start_ms < b.start_ms;
                     });
    return timeline;
}


//=============================================================================
// STARTING RUNS
//=============================================================================

StartResult ChoreographyEngine::execute(const std::string& name,
                                        double personality_modifier,
                                        std::optional<double> intensity_override) {
    StartResult result;

    std::string key = name;
    if (!library_.contains(key)) {
        BehaviorResolver resolver;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            resolver = resolver_;
        }
        if (resolver) {
            auto resolved = resolver(name);
            if (resolved && library_.contains(*resolved)) {
                key = *resolved;
            }
        }
    }

    auto choreography = library_.find(key);
    if (!choreography) {
        result.reason = "unknown choreography '" + name + "'";
        return result;
    }
    if (validator_.isEmergencyStopped()) {
        result.reason = "emergency stop active";
        return result;
    }

    // Every target must be reachable before anything moves
    std::vector<ChoreographyStep> steps = choreography->steps;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        Verdict verdict = validator_.checkTarget(steps[i].channel, steps[i].end_position);
        if (!verdict.accepted) {
            result.reason = "step " + std::to_string(i) + ": " + verdict.reason;
            std::cerr << "[Engine] Rejected '" << choreography->key << "': " << result.reason << std::endl;
            return result;
        }
        steps[i].end_position = static_cast<int>(std::lround(verdict.command.value));
    }

    const double m = clampModifier(personality_modifier);

    Run run;
    run.info.id = makeShortId();
    run.info.name = choreography->key;
    run.info.kind = RunKind::Choreography;
    run.info.priority = choreography->priority;
    run.info.allows_interruption = choreography->allows_interruption;
    run.timeline = buildTimeline(steps, m);
    for (auto cue : choreography->audio_cues) {
        cue.time_ms = static_cast<int>(std::lround(cue.time_ms / m));
        run.cues.push_back(cue);
    }
    std::stable_sort(run.cues.begin(), run.cues.end(),
                     [](const AudioSyncPoint& a, const AudioSyncPoint& b) {
                         return a.time_ms < b.time_ms;
                     });
    run.overshoot_scale = std::clamp(intensity_override.value_or(choreography->emotional_intensity), 0.0, 2.0);
    run.loops_remaining = choreography->loop_count;

    return admitForeground(std::move(run));
}


StartResult ChoreographyEngine::startSequence(const Sequence& sequence, int priority) {
    if (validator_.isEmergencyStopped()) {
        StartResult result;
        result.reason = "emergency stop active";
        return result;
    }

    Run run;
    run.info.id = sequence.id.empty() ? makeShortId() : sequence.id;
    run.info.name = sequence.name;
    run.info.kind = RunKind::Sequence;
    run.info.priority = priority;
    run.info.allows_interruption = true;
    run.timeline = buildTimeline(sequence.commands);
    run.loops_remaining = (sequence.loop && sequence.loop_count != 0) ? sequence.loop_count : 1;

    return admitForeground(std::move(run));
}


StartResult ChoreographyEngine::startCommand(const Command& command) {
    StartResult result;
    if (command.kind != CommandKind::EmergencyStop && validator_.isEmergencyStopped()) {
        result.reason = "emergency stop active";
        return result;
    }

    Run run;
    run.info.id = command.id.empty() ? makeShortId() : command.id;
    run.info.name = toString(command.kind) + " ch" + std::to_string(command.channel);
    run.info.kind = RunKind::Command;
    run.info.status = RunStatus::Running;
    run.timeline = buildTimeline(std::vector<Command>{command});

    std::lock_guard<std::mutex> lock(mutex_);
    run.started = clock_();
    result.started = true;
    result.run_id = run.info.id;
    background_.push_back(std::move(run));
    return result;
}


StartResult ChoreographyEngine::admitForeground(Run run) {
    StartResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    if (foreground_) {
        const RunInfo& current = foreground_->info;
        bool protected_run = !current.allows_interruption;
        bool queued_behind = current.kind == RunKind::Sequence && run.info.kind == RunKind::Sequence;
        if ((protected_run || queued_behind) && current.priority >= run.info.priority) {
            std::ostringstream oss;
            oss << "'" << current.name << "' (priority " << current.priority
                << ") cannot be interrupted by priority " << run.info.priority;
            result.blocked = true;
            result.reason = oss.str();
            std::cout << "[Engine] Rejected '" << run.info.name << "': " << result.reason << std::endl;
            return result;
        }
        finishLocked(*foreground_, RunStatus::Stopped, "preempted by '" + run.info.name + "'");
        foreground_.reset();
    }

    run.started = clock_();
    run.info.status = RunStatus::Running;
    result.started = true;
    result.run_id = run.info.id;

    std::cout << "[Engine] Started " << toString(run.info.kind) << " '" << run.info.name
              << "' (" << run.info.id << ", priority " << run.info.priority
              << ", " << run.timeline.size() << " steps)" << std::endl;
    foreground_ = std::move(run);
    return result;
}


//=============================================================================
// STOPPING
//=============================================================================

bool ChoreographyEngine::stop(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (foreground_ && foreground_->info.id == run_id) {
        finishLocked(*foreground_, RunStatus::Stopped, "stopped by request");
        foreground_.reset();
        return true;
    }

    auto it = std::find_if(background_.begin(), background_.end(),
                           [&run_id](const Run& r) { return r.info.id == run_id; });
    if (it != background_.end()) {
        finishLocked(*it, RunStatus::Stopped, "stopped by request");
        background_.erase(it);
        return true;
    }
    return false;
}


void ChoreographyEngine::stopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    haltAllLocked("stopped by request");
}


void ChoreographyEngine::emergencyStop(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    emergencyStopLocked(reason);
}


void ChoreographyEngine::emergencyStopLocked(const std::string& reason) {
    validator_.triggerEmergencyStop(reason);
    haltAllLocked("emergency stop");
    if (!driver_.emergencyStopAll()) {
        std::cerr << "[Engine] Driver emergency stop reported failure" << std::endl;
    }
}


void ChoreographyEngine::returnHome() {
    std::lock_guard<std::mutex> lock(mutex_);
    int homed = 0;
    for (const auto& config : registry_.all()) {
        if (!config.enabled) {
            continue;
        }
        if (driver_.moveTo(config.channel, config.home_position, 0)) {
            positions_[config.channel] = config.home_position;
            ++homed;
        } else {
            std::cerr << "[Engine] Failed to home channel " << config.channel << std::endl;
        }
    }
    std::cout << "[Engine] Returned " << homed << " channel(s) to home" << std::endl;
}


void ChoreographyEngine::finishLocked(Run& run, RunStatus status, const std::string& reason) {
    run.info.status = status;
    run.info.reason = reason;
    archiveLocked(run.info);

    std::cout << "[Engine] " << toString(run.info.kind) << " '" << run.info.name << "' ("
              << run.info.id << ") " << toString(status);
    if (!reason.empty()) {
        std::cout << ": " << reason;
    }
    std::cout << std::endl;
}


void ChoreographyEngine::haltAllLocked(const std::string& reason) {
    if (foreground_) {
        finishLocked(*foreground_, RunStatus::Stopped, reason);
        foreground_.reset();
    }
    for (auto& run : background_) {
        finishLocked(run, RunStatus::Stopped, reason);
    }
    background_.clear();
}


void ChoreographyEngine::archiveLocked(const RunInfo& info) {
    history_.push_back(info);
    while (history_.size() > HISTORY_LIMIT) {
        history_.pop_front();
    }
}


//=============================================================================
// TICKING
//=============================================================================

void ChoreographyEngine::tick() {
    tick(clock_());
}


void ChoreographyEngine::tick(Clock::time_point now) {
    std::vector<PendingCue> cues;
    AudioCueSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++ticks_;

        if (validator_.isEmergencyStopped()) {
            if (foreground_ || !background_.empty()) {
                haltAllLocked("emergency stop active");
            }
            return;
        }

        std::vector<Run*> runs;
        if (foreground_) {
            runs.push_back(&*foreground_);
        }
        for (auto& run : background_) {
            runs.push_back(&run);
        }

        for (Run* run : runs) {
            if (run->info.status != RunStatus::Running) {
                continue;
            }
            if (!advanceLocked(*run, now, cues)) {
                haltAllLocked("emergency stop");
                if (!driver_.emergencyStopAll()) {
                    std::cerr << "[Engine] Driver emergency stop reported failure" << std::endl;
                }
                return;
            }
        }

        if (foreground_ && foreground_->info.status != RunStatus::Running) {
            foreground_.reset();
        }
        background_.erase(
            std::remove_if(background_.begin(), background_.end(),
                           [](const Run& r) { return r.info.status != RunStatus::Running; }),
            background_.end());

        sink = audio_sink_;
    }

    if (sink) {
        for (const auto& cue : cues) {
            sink(cue.cue, cue.offset_ms);
        }
    }
}


bool ChoreographyEngine::advanceLocked(Run& run, Clock::time_point now, std::vector<PendingCue>& cues) {
    const double elapsed = msBetween(run.started, now);
    run.info.elapsed_ms = elapsed;

    // Activate due entries
    while (run.next_entry < run.timeline.size() && run.timeline[run.next_entry].start_ms <= elapsed) {
        const std::size_t index = run.next_entry++;
        const TimelineEntry& entry = run.timeline[index];

        if (entry.kind == CommandKind::EmergencyStop) {
            validator_.triggerEmergencyStop("requested by '" + run.info.name + "'");
            return false;
        }
        if (entry.kind != CommandKind::Position) {
            applySettingLocked(entry);
            continue;
        }

        const int channel = entry.step.channel;
        double start = 0.0;
        auto known = positions_.find(channel);
        if (known != positions_.end()) {
            start = known->second;
        } else {
            start = driver_.getStatus(channel).position;
        }

        supersedeLocked(channel, run);
        run.active[channel] = ActiveStep{index, start, false};
    }

    while (run.next_cue < run.cues.size() && run.cues[run.next_cue].time_ms <= elapsed) {
        const auto& cue = run.cues[run.next_cue++];
        cues.push_back({cue.cue, cue.time_ms});
    }

    // Drive in-flight steps
    for (auto it = run.active.begin(); it != run.active.end();) {
        const int channel = it->first;
        ActiveStep& active = it->second;
        const TimelineEntry& entry = run.timeline[active.entry];
        const double local = elapsed - entry.start_ms;

        if (!active.settled) {
            auto config = registry_.get(channel);
            if (!config) {
                finishLocked(run, RunStatus::Failed, "channel " + std::to_string(channel) + " not configured");
                return true;
            }

            double t = entry.duration_ms > 0.0 ? local / entry.duration_ms : 1.0;
            t = std::clamp(t, 0.0, 1.0);

            double raw = motion::interpolate(t, active.start_position, entry.step.end_position,
                                             entry.step.easing, entry.step.overshoot * run.overshoot_scale);
            int target = motion::clampToLimits(raw, config->limits);

            if (!validator_.monitor(channel, target)) {
                return false;
            }

            int remaining_ms = std::max(0, static_cast<int>(std::lround(entry.duration_ms - local)));
            if (!driver_.moveTo(channel, target, remaining_ms)) {
                finishLocked(run, RunStatus::Failed,
                             "driver write failed on channel " + std::to_string(channel));
                return true;
            }
            positions_[channel] = target;

            int observed = driver_.getStatus(channel).position;
            if (observed != target && !validator_.monitor(channel, observed)) {
                return false;
            }

            if (t >= 1.0) {
                active.settled = true;
            }
        }

        if (active.settled && local >= entry.duration_ms + entry.hold_ms) {
            it = run.active.erase(it);
        } else {
            ++it;
        }
    }

    if (isFinished(run)) {
        ++run.info.loops_completed;
        if (run.loops_remaining == -1 || run.loops_remaining > 1) {
            if (run.loops_remaining > 1) {
                --run.loops_remaining;
            }
            run.started = now;
            run.next_entry = 0;
            run.next_cue = 0;
            std::cout << "[Engine] '" << run.info.name << "' loop " << run.info.loops_completed
                      << " done, restarting" << std::endl;
        } else {
            finishLocked(run, RunStatus::Completed, "");
        }
    }
    return true;
}


void ChoreographyEngine::supersedeLocked(int channel, const Run& owner) {
    auto release = [&](Run& other) {
        if (&other == &owner || other.info.status != RunStatus::Running) {
            return;
        }
        if (other.active.erase(channel) == 0) {
            return;
        }
        if (other.info.kind == RunKind::Command && isFinished(other)) {
            finishLocked(other, RunStatus::Stopped,
                         "superseded on channel " + std::to_string(channel));
        }
    };

    if (foreground_) {
        release(*foreground_);
    }
    for (auto& run : background_) {
        release(run);
    }
}


void ChoreographyEngine::applySettingLocked(const TimelineEntry& entry) {
    ActuatorPatch patch;
    int value = static_cast<int>(std::lround(entry.value));
    if (entry.kind == CommandKind::Speed) {
        patch.default_speed = value;
    } else if (entry.kind == CommandKind::Acceleration) {
        patch.default_acceleration = value;
    } else {
        return;
    }

    RegistryResult result = registry_.upsert(entry.step.channel, patch);
    if (!result.ok) {
        std::cerr << "[Engine] Setting rejected: " << result.error << std::endl;
    }
}


bool ChoreographyEngine::isFinished(const Run& run) const {
    return run.next_entry >= run.timeline.size() && run.active.empty();
}


//=============================================================================
// THREAD
//=============================================================================

void ChoreographyEngine::start(int tick_hz) {
    if (running_.exchange(true)) {
        return;
    }
    tick_hz_ = tick_hz > 0 ? tick_hz : DEFAULT_TICK_HZ;
    thread_ = std::thread(&ChoreographyEngine::tickLoop, this);
}


void ChoreographyEngine::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    std::cout << "[Engine] Tick loop stopped" << std::endl;
}


void ChoreographyEngine::tickLoop() {
    const double loop_period = 1.0 / tick_hz_;
    std::cout << "[Engine] Tick loop started at " << tick_hz_ << " Hz" << std::endl;

    while (running_) {
        auto cycle_start = Clock::now();

        tick();

        // Sleep to maintain tick rate
        auto elapsed = std::chrono::duration<double>(Clock::now() - cycle_start).count();
        double sleep_time = loop_period - elapsed;
        if (sleep_time > 0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(sleep_time));
        }
    }
}


//=============================================================================
// QUERIES
//=============================================================================

std::optional<RunInfo> ChoreographyEngine::runInfo(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (foreground_ && foreground_->info.id == run_id) {
        return foreground_->info;
    }
    for (const auto& run : background_) {
        if (run.info.id == run_id) {
            return run.info;
        }
    }
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (it->id == run_id) {
            return *it;
        }
    }
    return std::nullopt;
}


RunStatus ChoreographyEngine::runStatus(const std::string& run_id) const {
    auto info = runInfo(run_id);
    return info ? info->status : RunStatus::NotFound;
}


EngineStatus ChoreographyEngine::status() const {
    EngineStatus status;
    status.running = running_.load();
    status.emergency_stop = validator_.isEmergencyStopped();

    std::lock_guard<std::mutex> lock(mutex_);
    status.tick_hz = tick_hz_;
    status.ticks = ticks_;
    if (foreground_) {
        status.foreground = foreground_->info;
    }
    for (const auto& run : background_) {
        status.background.push_back(run.info);
    }
    status.positions = positions_;
    return status;
}


std::vector<Choreography> ChoreographyEngine::listChoreographies() const {
    return library_.all();
}


void ChoreographyEngine::seedPosition(int channel, int position) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_[channel] = position;
    }
    if (!validator_.monitor(channel, position)) {
        std::cerr << "[Engine] Channel " << channel << " reports out-of-range position "
                  << position << std::endl;
    }
}


std::optional<int> ChoreographyEngine::currentPosition(int channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(channel);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}


void ChoreographyEngine::setAudioCueSink(AudioCueSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    audio_sink_ = std::move(sink);
}


void ChoreographyEngine::setBehaviorResolver(BehaviorResolver resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    resolver_ = std::move(resolver);
}
