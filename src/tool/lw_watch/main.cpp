/// @file main.cpp
/// @brief lw-watch entry point.
///
/// Watches one path and prints a line per debounced burst of changes:
///   lw-watch [--config file.yaml] <path>

#include "lw/debounce/debounce_stage.hpp"
#include "lw/foundation/watch_logger.hpp"
#include "lw/tool/tool_runner.hpp"
#include "lw/watch/location_watcher.hpp"

#include <cstdlib>
#include <iostream>
#include <stop_token>
#include <thread>

int main(int argc, char* argv[]) {
    lw::tool::SignalHandler signals;

    auto target = lw::tool::parseTargetArg(argc, argv);
    if (target.empty()) {
        std::cerr << "usage: lw-watch [--config file.yaml] <path>\n";
        return EXIT_FAILURE;
    }

    // Resolve config: --config flag > LW_CONFIG_PATH env > built-in defaults.
    auto configResult = lw::tool::loadToolConfig(lw::tool::parseConfigArg(argc, argv));
    if (!configResult) {
        std::cerr << "Failed to load config: " << configResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto config = configResult.value();
    lw::foundation::WatchLogger::instance().setAllLevels(config.logLevel);

    std::stop_source stop;
    auto opened = lw::watch::LocationWatcher::open(target, stop.get_token());
    if (!opened) {
        std::cerr << "Failed to watch " << target.string() << ": "
                  << opened.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto watcher = std::move(opened).value();

    lw::debounce::GroupedDebounce<lw::watch::WatchEvent> bursts(
        {.interval = config.interval, .maxDelay = config.maxDelay});

    std::thread forwarder([&watcher, &bursts] {
        auto events = watcher->events();
        auto input = bursts.input();
        while (auto event = events.receive()) {
            if (!input.send(*event)) {
                break;
            }
        }
        input.close();
    });

    std::thread printer([&bursts] {
        auto output = bursts.output();
        while (auto burst = output.receive()) {
            std::cout << lw::tool::formatBurst(*burst) << std::endl;
        }
    });

    std::cout << "Watching " << watcher->target().string() << "\n";

    signals.waitForShutdown();

    // Cancelling the watcher closes its stream; the last burst is flushed.
    stop.request_stop();
    forwarder.join();
    printer.join();
    watcher->close();

    std::cout << "Stopped\n";
    return EXIT_SUCCESS;
}
