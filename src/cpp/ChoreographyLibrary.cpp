/**
 * @file ChoreographyLibrary.cpp
 * @brief Built-in choreographies and JSON loading
 *
 * @license MIT
 */

#include "ChoreographyLibrary.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

constexpr int DOME = 0;
constexpr int HEAD = 1;

ChoreographyStep step(int channel, int from, int to, int duration_ms, Easing easing, int delay_ms) {
    ChoreographyStep s;
    s.channel = channel;
    s.start_position = from;
    s.end_position = to;
    s.duration_ms = duration_ms;
    s.easing = easing;
    s.delay_ms = delay_ms;
    return s;
}

ChoreographyStep withHold(ChoreographyStep s, int hold_ms) {
    s.hold_ms = hold_ms;
    return s;
}

ChoreographyStep withModifier(ChoreographyStep s, double modifier) {
    s.personality_modifier = modifier;
    return s;
}

ChoreographyStep withOvershoot(ChoreographyStep s, double overshoot) {
    s.overshoot = overshoot;
    return s;
}

ChoreographyStep inGroup(ChoreographyStep s, const std::string& group, int offset_ms = 0) {
    s.sync_group = group;
    s.sync_offset_ms = offset_ms;
    return s;
}


//=============================================================================
// JSON PARSING
//=============================================================================

Easing easingField(const json& j, const char* key) {
    std::string name = j.value(key, std::string("linear"));
    auto easing = parseEasing(name);
    if (!easing) {
        throw std::invalid_argument("unknown easing '" + name + "'");
    }
    return *easing;
}

ChoreographyStep stepFromJson(const json& j) {
    ChoreographyStep s;
    s.channel = j.at("channel").get<int>();
    s.end_position = j.at("end_position").get<int>();
    s.start_position = j.value("start_position", s.end_position);
    s.duration_ms = j.value("duration_ms", 0);
    s.easing = easingField(j, "easing");
    s.delay_ms = j.value("delay_ms", 0);
    s.hold_ms = j.value("hold_ms", 0);
    s.overshoot = j.value("overshoot", 0.0);
    s.sync_group = j.value("sync_group", std::string());
    s.sync_offset_ms = j.value("sync_offset_ms", 0);
    s.personality_modifier = j.value("personality_modifier", 1.0);
    return s;
}

Choreography choreographyFromJson(const json& j) {
    Choreography c;
    c.key = j.at("key").get<std::string>();
    c.name = j.value("name", c.key);
    c.description = j.value("description", std::string());
    c.priority = j.value("priority", 1);
    c.allows_interruption = j.value("allows_interruption", true);
    c.emotional_intensity = j.value("emotional_intensity", 1.0);
    c.emergency_stop_time_ms = j.value("emergency_stop_time_ms", 500);
    c.loop_count = j.value("loop_count", 1);

    for (const auto& s : j.at("steps")) {
        c.steps.push_back(stepFromJson(s));
    }
    if (j.contains("audio_cues")) {
        for (const auto& cue : j.at("audio_cues")) {
            c.audio_cues.push_back({cue.at("time_ms").get<int>(), cue.at("cue").get<std::string>()});
        }
    }
    return c;
}

} // namespace


//=============================================================================
// VALIDATION
//=============================================================================

std::string checkChoreography(const Choreography& c) {
    std::ostringstream oss;
    oss << "Choreography '" << c.key << "': ";

    if (c.key.empty()) {
        return "Choreography without a key";
    }
    if (c.steps.empty()) {
        oss << "no steps";
        return oss.str();
    }
    if (c.priority < 1 || c.priority > 10) {
        oss << "priority " << c.priority << " outside 1-10";
        return oss.str();
    }
    if (c.emotional_intensity < 0.0 || c.emotional_intensity > 2.0) {
        oss << "emotional_intensity outside 0-2";
        return oss.str();
    }
    if (c.loop_count == 0 || c.loop_count < -1) {
        oss << "loop_count must be positive or -1";
        return oss.str();
    }
    for (std::size_t i = 0; i < c.steps.size(); ++i) {
        const auto& s = c.steps[i];
        if (s.channel < 0 || s.duration_ms < 0 || s.delay_ms < 0 || s.hold_ms < 0 ||
            s.sync_offset_ms < 0 || s.overshoot < 0.0 || s.personality_modifier <= 0.0) {
            oss << "step " << i << " has a negative or zero field";
            return oss.str();
        }
    }
    for (const auto& cue : c.audio_cues) {
        if (cue.time_ms < 0 || cue.cue.empty()) {
            oss << "bad audio cue";
            return oss.str();
        }
    }
    return "";
}


//=============================================================================
// BUILT-INS
//=============================================================================

std::vector<Choreography> ChoreographyLibrary::builtins() {
    std::vector<Choreography> result;

    // --- Greetings ---------------------------------------------------------

    Choreography friend_greeting;
    friend_greeting.key = "enthusiastic_friend_greeting";
    friend_greeting.name = "Enthusiastic Friend Greeting";
    friend_greeting.description = "Warm, energetic greeting for recognized friends";
    friend_greeting.priority = 8;
    friend_greeting.allows_interruption = false;
    friend_greeting.emotional_intensity = 1.3;
    friend_greeting.steps = {
        withModifier(step(DOME, 1500, 1950, 400, Easing::Organic, 0), 1.2),
        withHold(step(HEAD, 1500, 1650, 600, Easing::QuadOut, 200), 300),
        withModifier(withOvershoot(step(DOME, 1950, 1050, 1000, Easing::Emotional, 500), 0.1), 1.1),
        withModifier(inGroup(step(DOME, 1050, 1500, 800, Easing::QuadInOut, 1600), "return_center"), 0.9),
        inGroup(step(HEAD, 1650, 1500, 700, Easing::QuadInOut, 1700), "return_center", 100),
    };
    friend_greeting.audio_cues = {{0, "greeting_friends"}, {1500, "happy_excited"}};
    result.push_back(friend_greeting);

    Choreography curious;
    curious.key = "curious_investigation_greeting";
    curious.name = "Curious Investigation Greeting";
    curious.description = "Cautious, inquisitive greeting for unknown individuals";
    curious.priority = 6;
    curious.emotional_intensity = 0.8;
    curious.steps = {
        withModifier(step(DOME, 1500, 1750, 1000, Easing::Organic, 0), 0.8),
        withHold(step(HEAD, 1500, 1650, 800, Easing::QuadInOut, 500), 600),
        withModifier(step(HEAD, 1650, 1350, 600, Easing::SineInOut, 2000), 0.7),
        step(HEAD, 1350, 1600, 700, Easing::QuadOut, 3000),
        withModifier(step(DOME, 1750, 1500, 900, Easing::Organic, 3200), 0.9),
    };
    curious.audio_cues = {{800, "curious_inquisitive"}, {3200, "responding_questions"}};
    result.push_back(curious);

    // --- Character recognition ---------------------------------------------

    Choreography jedi;
    jedi.key = "jedi_recognition_respect";
    jedi.name = "Jedi Recognition Respect";
    jedi.description = "Respectful acknowledgment sequence for Jedi-like figures";
    jedi.priority = 9;
    jedi.allows_interruption = false;
    jedi.emotional_intensity = 1.1;
    jedi.steps = {
        step(HEAD, 1500, 1675, 600, Easing::Mechanical, 0),
        step(DOME, 1500, 1700, 800, Easing::QuadInOut, 300),
        withModifier(withHold(step(HEAD, 1675, 1325, 1500, Easing::Organic, 700), 1000), 0.7),
        withModifier(step(HEAD, 1325, 1500, 1200, Easing::QuadOut, 3900), 0.8),
        step(DOME, 1700, 1500, 800, Easing::QuadInOut, 4200),
    };
    jedi.audio_cues = {{0, "alert_warning"}, {2000, "jedi_recognition"}};
    result.push_back(jedi);

    // --- Personality --------------------------------------------------------

    Choreography stubborn;
    stubborn.key = "stubborn_resistance";
    stubborn.name = "Stubborn Resistance";
    stubborn.description = "Characteristic stubborn defiance";
    stubborn.priority = 7;
    stubborn.emotional_intensity = 1.5;
    stubborn.steps = {
        withModifier(step(HEAD, 1500, 1350, 800, Easing::Emotional, 0), 1.2),
        withOvershoot(step(DOME, 1500, 1200, 1000, Easing::BackIn, 400), 0.15),
        withModifier(withHold(step(HEAD, 1350, 1310, 400, Easing::Linear, 1200), 1500), 0.8),
        withModifier(step(HEAD, 1310, 1450, 1200, Easing::Organic, 3300), 0.6),
        withModifier(step(DOME, 1200, 1500, 1500, Easing::QuadIn, 5000), 0.7),
        step(HEAD, 1450, 1500, 1000, Easing::QuadIn, 5500),
    };
    stubborn.audio_cues = {{500, "frustrated_stubborn"}, {4000, "expressing_sarcasm"}};
    result.push_back(stubborn);

    Choreography dance;
    dance.key = "playful_entertainment_dance";
    dance.name = "Playful Entertainment Dance";
    dance.description = "Energetic dance sequence for entertainment";
    dance.priority = 5;
    dance.emotional_intensity = 1.8;
    dance.steps = {
        withModifier(step(DOME, 1500, 2000, 300, Easing::QuadOut, 0), 1.5),
        withModifier(step(DOME, 2000, 1000, 350, Easing::Linear, 250), 1.4),
        withOvershoot(step(DOME, 1000, 1875, 400, Easing::BounceOut, 550), 0.2),
        step(HEAD, 1500, 1650, 250, Easing::SineInOut, 150),
        step(HEAD, 1650, 1350, 300, Easing::SineInOut, 450),
        withOvershoot(step(HEAD, 1350, 1600, 350, Easing::BounceOut, 800), 0.1),
        step(DOME, 1875, 1500, 600, Easing::ElasticOut, 1100),
        step(HEAD, 1600, 1500, 500, Easing::QuadOut, 1300),
    };
    dance.audio_cues = {{0, "musical_entertainment"}, {1000, "playful_mischievous"}};
    result.push_back(dance);

    // --- Environmental response ---------------------------------------------

    Choreography scan;
    scan.key = "environmental_alert_scan";
    scan.name = "Environmental Alert Scan";
    scan.description = "Systematic environmental scanning for threats or changes";
    scan.priority = 8;
    scan.emotional_intensity = 1.2;
    scan.steps = {
        withModifier(step(DOME, 1500, 1950, 400, Easing::Mechanical, 0), 1.3),
        step(HEAD, 1500, 1675, 300, Easing::Linear, 100),
        withModifier(step(DOME, 1950, 1050, 2000, Easing::Linear, 400), 0.8),
        step(HEAD, 1675, 1325, 1200, Easing::SineInOut, 800),
        inGroup(step(DOME, 1050, 1500, 800, Easing::QuadOut, 3000), "scan_return"),
        inGroup(step(HEAD, 1325, 1500, 700, Easing::QuadOut, 3100), "scan_return"),
    };
    scan.audio_cues = {{0, "alert_warning"}, {3000, "curious_inquisitive"}};
    result.push_back(scan);

    // --- Demonstration ------------------------------------------------------

    Choreography demo;
    demo.key = "full_capability_demonstration";
    demo.name = "Full Capability Demonstration";
    demo.description = "Complete showcase of movement and personality";
    demo.priority = 9;
    demo.allows_interruption = false;
    demo.emotional_intensity = 1.6;
    demo.emergency_stop_time_ms = 300;
    demo.steps = {
        step(DOME, 1500, 2000, 500, Easing::Organic, 0),
        step(HEAD, 1500, 1675, 400, Easing::QuadOut, 200),
        withOvershoot(step(DOME, 2000, 1000, 800, Easing::BounceOut, 600), 0.15),
        step(HEAD, 1675, 1325, 600, Easing::ElasticOut, 800),
        withModifier(step(DOME, 1000, 1300, 1000, Easing::BackOut, 1600), 0.7),
        step(HEAD, 1325, 1450, 800, Easing::Emotional, 1800),
        inGroup(step(DOME, 1300, 1800, 600, Easing::Mechanical, 3200), "precision_demo"),
        inGroup(step(HEAD, 1450, 1600, 500, Easing::Mechanical, 3300), "precision_demo", 100),
        step(DOME, 1800, 1500, 800, Easing::ElasticOut, 4200),
        step(HEAD, 1600, 1500, 700, Easing::QuadOut, 4300),
    };
    demo.audio_cues = {
        {0, "happy_excited"}, {1500, "astromech_duties"},
        {3000, "frustrated_stubborn"}, {4500, "musical_entertainment"}
    };
    result.push_back(demo);

    return result;
}


//=============================================================================
// CONSTRUCTOR / QUERIES
//=============================================================================

ChoreographyLibrary::ChoreographyLibrary(bool with_builtins) {
    if (with_builtins) {
        for (const auto& c : builtins()) {
            choreographies_[c.key] = c;
        }
    }
}

std::optional<Choreography> ChoreographyLibrary::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = choreographies_.find(key);
    if (it == choreographies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ChoreographyLibrary::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return choreographies_.count(key) > 0;
}

std::vector<Choreography> ChoreographyLibrary::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Choreography> result;
    for (const auto& entry : choreographies_) {
        result.push_back(entry.second);
    }
    return result;
}

bool ChoreographyLibrary::add(const Choreography& choreography) {
    std::string error = checkChoreography(choreography);
    if (!error.empty()) {
        std::cerr << "[Engine] " << error << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    choreographies_[choreography.key] = choreography;
    return true;
}


//=============================================================================
// LOADING
//=============================================================================

LibraryLoadReport ChoreographyLibrary::loadJson(const json& document) {
    LibraryLoadReport report;

    if (!document.is_object() || !document.contains("choreographies") ||
        !document["choreographies"].is_array()) {
        report.errors.push_back("Missing 'choreographies' array");
        return report;
    }

    std::size_t index = 0;
    for (const auto& entry : document["choreographies"]) {
        try {
            Choreography c = choreographyFromJson(entry);
            std::string error = checkChoreography(c);
            if (!error.empty()) {
                report.errors.push_back(error);
            } else if (add(c)) {
                ++report.loaded;
            }
        } catch (const std::exception& e) {
            report.errors.push_back("Entry " + std::to_string(index) + ": " + e.what());
        }
        ++index;
    }
    return report;
}

LibraryLoadReport ChoreographyLibrary::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LibraryLoadReport report;
        report.errors.push_back("Cannot open " + path);
        return report;
    }

    try {
        json document = json::parse(file);
        LibraryLoadReport report = loadJson(document);
        std::cout << "[Engine] Loaded " << report.loaded << " choreographies from " << path << std::endl;
        for (const auto& error : report.errors) {
            std::cerr << "[Engine] " << error << std::endl;
        }
        return report;
    } catch (const std::exception& e) {
        LibraryLoadReport report;
        report.errors.push_back(std::string("Parse error in ") + path + ": " + e.what());
        std::cerr << "[Engine] " << report.errors.back() << std::endl;
        return report;
    }
}
