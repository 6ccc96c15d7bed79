#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "aegis/config/ConfigLoader.hpp"
#include "aegis/infra/Clock.hpp"
#include "aegis/runtime/ControlPlane.hpp"
#include "aegis/runtime/OperatorApi.hpp"
#include "aegis/runtime/OperatorServer.hpp"
#include "aegis/runtime/Settings.hpp"
#include "aegis/store/JsonFileStateStore.hpp"

using namespace aegis;

// ---------------------------------------------------------------------------
// Signal handler only sets the flag. The main thread notices it and does the
// shutdown (scheduler join, webhook flush) outside signal context.
// ---------------------------------------------------------------------------
static std::atomic<bool> g_stop_flag{false};

void handle_signal(int) {
    g_stop_flag.store(true, std::memory_order_relaxed);
}

int main(int argc, char** argv) {
    const std::string config_file = argc > 1 ? argv[1] : "config.ini";

    ConfigLoader cfg;
    if (!cfg.load(config_file)) {
        std::cout << "[AEGIS] Running with built-in defaults\n";
    } else {
        std::cout << "[AEGIS] Config: " << cfg.config_path() << "\n";
        cfg.dump();
    }

    try {
        ControlPlaneSettings settings = load_settings(cfg);

        SystemClock clock;
        JsonFileStateStore store(settings.data_dir);

        ControlPlane cp(settings, store, clock);
        cp.start();

        std::signal(SIGINT,  handle_signal);
        std::signal(SIGTERM, handle_signal);

        std::atomic<bool> running{true};

        OperatorApi api(cp);
        OperatorServer server(api, settings.http.bind,
                              static_cast<uint16_t>(settings.http.port),
                              std::chrono::milliseconds(settings.http.io_timeout_ms));
        std::thread http_thread;
        if (settings.http.enabled) {
            http_thread = std::thread([&] { server.run(running); });
        } else {
            std::cout << "[AEGIS] Operator API disabled\n";
        }

        while (!g_stop_flag.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "[AEGIS] Shutdown requested\n";
        running.store(false);
        if (http_thread.joinable()) http_thread.join();
        cp.stop();

        std::cout << "[AEGIS] Clean exit (http requests=" << server.served() << ")\n";
    } catch (const AegisError& e) {
        std::cerr << "[AEGIS] FATAL " << error_kind_to_string(e.kind()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[AEGIS] FATAL: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
