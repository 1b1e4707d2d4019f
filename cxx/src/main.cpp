/**
 * @file main.cpp
 * @brief Interactive megaphone + soundboard front end for Linux (ALSA).
 *
 * Usage: megaphone [--config file.json] [--list-devices] [clip ...]
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "AlsaDriver.hpp"
#include "BroadcastEngine.hpp"
#include "Logger.hpp"
#include "SessionConfig.hpp"

using namespace megaphone;

namespace {

void print_usage() {
    std::cout << "Usage: megaphone [--config file.json] [--list-devices] [clip ...]" << std::endl;
}

void print_help() {
    std::cout << "Commands:\n"
              << "  b          toggle broadcast\n"
              << "  t <id>     trigger clip\n"
              << "  x <voice>  stop voice\n"
              << "  a <path>   add clip\n"
              << "  r <id>     remove clip\n"
              << "  l          list clips\n"
              << "  s          status\n"
              << "  q          quit" << std::endl;
}

void list_devices() {
    hal::AlsaDeviceFactory factory;
    for (const auto& device : factory.enumerate()) {
        std::cout << (device.capture ? "C" : "-") << (device.playback ? "P" : "-") << "  "
                  << device.name;
        if (!device.description.empty()) {
            std::cout << "  (" << device.description << ")";
        }
        std::cout << std::endl;
    }
}

void print_assets(const BroadcastEngine& engine) {
    const auto assets = engine.list_assets();
    if (assets.empty()) {
        std::cout << "(no clips)" << std::endl;
        return;
    }
    for (const auto& info : assets) {
        const double seconds = info.sample_rate > 0
            ? static_cast<double>(info.frame_count) / info.sample_rate : 0.0;
        std::cout << "#" << info.id << "  " << info.name << "  " << seconds << " s" << std::endl;
    }
}

void print_status(const BroadcastEngine& engine) {
    const SessionState s = engine.observe_state();
    const auto& d = s.diagnostics;
    std::cout << (s.state == BroadcastState::Live ? "BROADCASTING" : to_string(s.state))
              << "  " << s.sample_rate << " Hz " << s.channels << " ch " << s.bit_depth << "-bit"
              << "  last_error=" << to_string(s.last_error) << "\n"
              << "  ticks=" << d.ticks << " captured=" << d.frames_captured
              << " overruns=" << d.overruns << " underruns=" << d.underruns
              << " clipped=" << d.clipped_samples << "\n"
              << "  xruns(capture/playback)=" << d.capture_xruns << "/" << d.playback_xruns
              << " voices=" << d.active_voices << " ring=" << d.ring_depth << "/" << d.ring_capacity
              << " worst_mix=" << d.worst_mix_us << "us" << std::endl;
}

bool parse_id(std::istringstream& args, uint32_t& id) {
    long long value = 0;
    if (!(args >> value) || value <= 0) {
        std::cerr << "Expected a positive id" << std::endl;
        return false;
    }
    id = static_cast<uint32_t>(value);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    SessionConfig config;
    std::vector<std::string> clips;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                print_usage();
                return 1;
            }
            if (SessionConfigStore::load_from_file(config, argv[++i]) != ErrorCode::Ok) {
                return 1;
            }
        } else if (arg == "--list-devices") {
            list_devices();
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            print_help();
            return 0;
        } else {
            clips.push_back(arg);
        }
    }

    BroadcastEngine engine(config);
    for (const auto& path : clips) {
        auto result = engine.add_asset(path);
        if (!result) {
            std::cerr << "Cannot load " << path << ": " << to_string(result.error()) << std::endl;
        }
    }

    print_help();
    std::string line;
    while (std::cout << "> " << std::flush && std::getline(std::cin, line)) {
        std::istringstream args(line);
        std::string command;
        if (!(args >> command)) continue;

        if (command == "q") {
            break;
        } else if (command == "b") {
            const BroadcastState state = engine.observe_state().state;
            if (state == BroadcastState::Live) {
                engine.stop_broadcast();
            } else {
                if (state == BroadcastState::Faulted) {
                    engine.reset();
                }
                const ErrorCode err = engine.start_broadcast();
                std::cout << (err == ErrorCode::Ok ? "BROADCASTING" : to_string(err)) << std::endl;
            }
        } else if (command == "t") {
            uint32_t id = 0;
            if (!parse_id(args, id)) continue;
            auto voice = engine.trigger_asset(id);
            if (voice) {
                std::cout << "voice " << *voice << std::endl;
            } else {
                std::cerr << to_string(voice.error()) << std::endl;
            }
        } else if (command == "x") {
            uint32_t id = 0;
            if (!parse_id(args, id)) continue;
            engine.stop_voice(id);
        } else if (command == "a") {
            std::string path;
            std::getline(args >> std::ws, path);
            if (path.empty()) {
                std::cerr << "Expected a path" << std::endl;
                continue;
            }
            auto result = engine.add_asset(path);
            if (!result) {
                std::cerr << to_string(result.error()) << std::endl;
            }
        } else if (command == "r") {
            uint32_t id = 0;
            if (!parse_id(args, id)) continue;
            if (!engine.remove_asset(id)) {
                std::cerr << to_string(ErrorCode::NotFound) << std::endl;
            }
        } else if (command == "l") {
            print_assets(engine);
        } else if (command == "s") {
            print_status(engine);
        } else {
            print_help();
        }

        AudioLogger::instance().flush(std::cout);
    }

    engine.stop_broadcast();
    AudioLogger::instance().flush(std::cout);
    return 0;
}
