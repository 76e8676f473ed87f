// astromechd.cpp - Astromech Servo Motion Service
#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <thread>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <curl/curl.h>

#include "ActuatorRegistry.hpp"
#include "AudioCueClient.hpp"
#include "ChoreographyEngine.hpp"
#include "ChoreographyLibrary.hpp"
#include "CommandQueue.hpp"
#include "ControlRouter.hpp"
#include "ControlServer.hpp"
#include "PigpioDriver.hpp"
#include "ProfileStore.hpp"
#include "SafetyValidator.hpp"
#include "ServiceSettings.hpp"
#include "SimulatedDriver.hpp"

// Global flags
std::atomic<bool> service_active(true);


// Signal handler
void signal_handler(int /*signum*/) {
    service_active = false;
}


// Short behavior names callers use for the built-in choreographies
std::optional<std::string> resolveBehavior(const std::string& name) {
    static const std::map<std::string, std::string> aliases = {
        {"greeting", "enthusiastic_friend_greeting"},
        {"curious", "curious_investigation_greeting"},
        {"respect", "jedi_recognition_respect"},
        {"stubborn", "stubborn_resistance"},
        {"playful", "playful_entertainment_dance"},
        {"alert", "environmental_alert_scan"},
        {"demo", "full_capability_demonstration"}
    };
    auto it = aliases.find(name);
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}


// Load the configured profile, falling back to the compiled-in layout
std::vector<ActuatorConfig> loadProfile(const ProfileStore& store, const std::string& name) {
    ProfileLoadResult result = store.load(name);
    if (result.found && result.errors.empty()) {
        return result.configs;
    }
    if (result.found) {
        std::cerr << "⚠️  Profile '" << name << "' rejected, using built-in defaults\n";
    } else {
        std::cout << "ℹ️  No saved profile '" << name << "', using built-in defaults\n";
    }
    return ProfileStore::defaultProfile();
}


int runService(const ServiceSettings& settings) {
    // Actuator table and safety
    ProfileStore profiles(settings.profile_dir);
    ActuatorRegistry registry(loadProfile(profiles, settings.profile_name));
    registry.applySafetyTier(settings.safety_tier);
    SafetyValidator validator(registry);
    std::cout << "✅ " << registry.size() << " actuators, tier " << toString(settings.safety_tier) << "\n";

    // Hardware backend
    std::unique_ptr<ActuatorDriver> driver;
    if (settings.driver == "pigpio") {
        driver = std::make_unique<PigpioDriver>(settings.pins, registry.all());
    } else {
        driver = std::make_unique<SimulatedDriver>();
    }
    std::cout << "🤖 Connecting " << driver->name() << " driver...\n";
    if (!driver->connect()) {
        throw std::runtime_error("Driver '" + driver->name() + "' failed to connect");
    }

    // Choreographies
    ChoreographyLibrary library;
    if (!settings.choreography_file.empty()) {
        LibraryLoadReport report = library.loadFile(settings.choreography_file);
        std::cout << "✅ Loaded " << report.loaded << " choreographies from "
                  << settings.choreography_file << "\n";
        for (const auto& error : report.errors) {
            std::cerr << "   " << error << "\n";
        }
    }

    ChoreographyEngine engine(registry, validator, *driver, library);
    engine.setBehaviorResolver(resolveBehavior);

    // Start every channel from where the driver reports it
    for (const auto& config : registry.all()) {
        DriverStatus status = driver->getStatus(config.channel);
        if (status.connected) {
            engine.seedPosition(config.channel, status.position);
        }
    }

    std::unique_ptr<AudioCueClient> audio;
    if (!settings.audio_url.empty()) {
        audio = std::make_unique<AudioCueClient>(settings.audio_url);
        audio->start();
        AudioCueClient* client = audio.get();
        engine.setAudioCueSink([client](const std::string& cue, int offset_ms) {
            client->trigger(cue, offset_ms);
        });
    }

    CommandQueue queue(registry, validator, engine);
    ControlRouter router(registry, validator, engine, queue, profiles, *driver);
    router.setActiveProfile(settings.profile_name);

    ControlServer server(router, settings.bind_address,
                         static_cast<unsigned short>(settings.port),
                         settings.broadcast_hz,
                         std::chrono::seconds(settings.ping_interval_s + settings.ping_timeout_s));

    // Listener runs under the engine lock: post only
    validator.addEmergencyListener([&server](const std::string& reason) {
        server.broadcast(ControlRouter::emergencyNotice(reason).dump());
    });

    engine.start(settings.tick_hz);
    queue.start(settings.dispatch_hz);
    server.start();

    std::cout << "\n🎬 Motion service running (Ctrl+C to stop)\n\n";
    while (service_active) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Cleanup: stop intake first, then motion, then hardware
    std::cout << "\n🛑 Shutting down...\n";
    server.shutdown();
    queue.shutdown();
    engine.shutdown();
    if (audio) {
        audio->shutdown();
    }

    if (!validator.isEmergencyStopped()) {
        std::cout << "🔄 Returning to home positions...\n";
        engine.returnHome();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    driver->disconnect();
    return 0;
}


int main(int argc, char* argv[]) {
    // Signal handler
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::cout << "\n╔════════════════════════════════════════════════════════╗\n";
    std::cout << "║         ASTROMECH SERVO MOTION SERVICE v2.0            ║\n";
    std::cout << "║         Choreography + Safety Core                     ║\n";
    std::cout << "╚════════════════════════════════════════════════════════╝\n\n";

    std::string settings_path = argc > 1 ? argv[1] : "astromech.json";

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;
    try {
        ServiceSettings settings = ServiceSettings::load(settings_path);
        settings.applyEnvironment();
        exit_code = runService(settings);
    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        exit_code = 1;
    }
    curl_global_cleanup();

    if (exit_code == 0) {
        std::cout << "✅ Shutdown complete\n\n";
    }
    return exit_code;
}
