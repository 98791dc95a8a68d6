/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/config.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/server.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <thread>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <unistd.h>

using namespace vidflow;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "vidflow Daemon\n\n";
    std::cout << "Usage: " << progName << " <workspace> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace            Directory for job storage\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>    Concurrent jobs (default: 4)\n";
    std::cout << "  -h, --help           Show this help\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  VIDFLOW_LOG_LEVEL          Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  VIDFLOW_WORKERS            Concurrent jobs\n";
    std::cout << "  VIDFLOW_SCAN_INTERVAL_MS   Pending scan interval\n";
    std::cout << "  VIDFLOW_OUTPUT_DIR         Scratch directory for rendered videos\n";
    std::cout << "  VIDFLOW_BUCKET_DIR         Object store root\n";
    std::cout << "  VIDFLOW_BUCKET             Object store bucket name\n";
    std::cout << "  VIDFLOW_<STAGE>_MIN_REPLICAS, _MAX_REPLICAS, _DOWNSCALE_DELAY_S\n";
    std::cout << "                             Stage pool elasticity (PREPROCESS, GENERATE,\n";
    std::cout << "                             INTERPOLATE, UPSCALE, POSTPROCESS)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace -w 2\n";
    std::cout << "  VIDFLOW_LOG_LEVEL=DEBUG " << progName << " ./workspace\n";
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    std::filesystem::path workspace = argv[1];
    std::optional<int> workers;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    std::filesystem::path pidPath = workspace / ".vidflowd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid)) {
        std::cerr << "Error: Daemon already running on " << workspace.string()
                  << " (pid " << *pid << ")\n";
        return 1;
    }

    Config config = Config::fromEnv(workspace);
    if (workers) {
        config.workers = *workers;
    }
    if (auto error = config.validate()) {
        std::cerr << "Error: " << *error << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto server = std::make_unique<Server>(workspace, config);
        if (!server->start()) {
            std::cerr << "Error: Failed to start\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            } else {
                LOG_WARN("Could not write pid file: " + pidPath.string());
            }
        }

        std::cout << "vidflow " << VERSION << " running\n";
        std::cout << "  Workers    " << config.workers << "\n";
        std::cout << "  Workspace  " << workspace.string() << "\n";
        std::cout << "  Bucket     " << config.bucket << " (" << config.bucketDir.string() << ")\n";
        std::cout << std::flush;

        while (!g_shutdown_requested && server->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server->shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("vidflow daemon stopped");
    return 0;
}
