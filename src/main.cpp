#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <stdexcept>
#include "artifact_store.hpp"
#include "config.hpp"
#include "execution_service.hpp"
#include "executors/script_executor.hpp"
#include "http_fetcher.hpp"
#include "sandbox_server.hpp"

// Global flag for signal handling
static std::atomic<bool> g_interrupted{false};

// Signal handler
static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

int main(int argc, char** argv) {
    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // a client hanging up mid-write must not take the server down
    std::signal(SIGPIPE, SIG_IGN);

    ServiceConfig cfg;
    bool show_help = false;
    try {
        cfg = parse_args(argc, argv, show_help);
        if (show_help) {
            print_help(argv[0]);
            return 0;
        }
        validate_config(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_help(argv[0]);
        return 2;
    }

    HttpFetcher fetcher{cfg.max_redirects, cfg.max_input_bytes, cfg.verify_fetch_tls};
    ScriptExecutor executor{cfg.python_executable, cfg.max_output_bytes};
    ArtifactStore store{cfg.store_root, cfg.artifact_url_prefix};
    ExecutionService service{cfg, fetcher, executor, store};

    if (!ScriptExecutor::find_program(cfg.python_executable)) {
        std::cerr << "[main] Warning: interpreter " << cfg.python_executable
                  << " not found; executions will fail until it is installed" << std::endl;
    }

    SandboxServer server{cfg, service, store};
    if (!server.start()) {
        std::cerr << "Failed to listen on " << cfg.address << ":" << cfg.port << "\n";
        return 1;
    }

    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cout << "\n[Signal] Received interrupt signal, shutting down gracefully..." << std::endl;
    server.stop();
    return 0;
}
