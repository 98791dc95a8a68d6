/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/file_store.hpp"
#include "vidflow/flow.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/work.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace vidflow;

void printUsage(const char* progName) {
    std::cout << "vidflow Job Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id] [options]\n";
    std::cout << "       " << progName << " <workspace> --list [status]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory for job storage\n";
    std::cout << "  job_id        Specific job ID (optional, read from stdin when piped)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait        Block until the job reaches a final state\n";
    std::cout << "  -c, --cancel      Cancel a pending or processing job\n";
    std::cout << "  -r, --read        Mark a finished job as read\n";
    std::cout << "  -d, --delete      Delete a finished job\n";
    std::cout << "  -o, --owner <id>  Restrict --list to one owner\n";
    std::cout << "  -u, --unread      With --owner: list that owner's unread jobs\n";
    std::cout << "  -l, --list [s]    List recent jobs, optionally filtered by status\n";
    std::cout << "                    (pending, processing, completed, failed, cancelled)\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - If job_id provided: report that job\n";
    std::cout << "  - If no job_id: report the most recent job\n";
    std::cout << "  - Completed jobs print <bucket>/<object key>\n";
    std::cout << "  - Exit 0 completed, 1 failed or cancelled, 2 not ready\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  VIDFLOW_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace 1731808123456789_12345_0 --wait\n";
    std::cout << "  " << progName << " ./workspace --list processing\n";
    std::cout << "  " << progName << " ./workspace --owner alice --unread\n";
    std::cout << "  vfsubmit ./workspace \"a lighthouse at dusk\" | " << progName << " ./workspace -w\n";
}

namespace {

void printJobs(const std::vector<Job>& jobs) {
    for (const auto& job : jobs) {
        std::cout << job.id << "  " << toString(job.status) << "  " << job.progress << "%  "
                  << job.name << "\n";
    }
}

int listJobs(const Flow& flow, std::optional<JobStatus> status,
             const std::optional<std::string>& owner, bool unreadOnly) {
    std::vector<Job> jobs;
    if (owner && unreadOnly) {
        jobs = flow.unread(*owner);
    } else if (owner) {
        jobs = flow.listByOwner(*owner, 50);
    } else {
        jobs = flow.list(status, 50);
    }
    if (jobs.empty()) {
        std::cerr << "No jobs found" << std::endl;
        return 0;
    }
    printJobs(jobs);
    if (owner) {
        JobStats stats = flow.stats(*owner);
        std::cerr << stats.total << " total, " << stats.active << " active, " << stats.completed
                  << " completed, " << stats.failed << " failed, " << stats.unread << " unread"
                  << std::endl;
    }
    return 0;
}

int report(const Job& job) {
    switch (job.status) {
        case JobStatus::Completed:
            if (job.result) {
                std::cout << job.result->bucket << "/" << job.result->objectKey << std::endl;
            } else {
                std::cout << job.id << std::endl;
            }
            return 0;
        case JobStatus::Failed:
            std::cerr << "Job failed: " << job.id << std::endl;
            if (job.errorMessage) {
                std::cerr << "Error: " << *job.errorMessage << std::endl;
            }
            return 1;
        case JobStatus::Cancelled:
            std::cerr << "Job cancelled: " << job.id << std::endl;
            return 1;
        default:
            std::cerr << "Job not ready: " << job.id << " (status: " << toString(job.status)
                      << ", " << job.progress << "%";
            if (!job.currentStep.empty()) {
                std::cerr << ", " << job.currentStep;
            }
            std::cerr << ")" << std::endl;
            return 2; // Different exit code for "not ready"
    }
}

}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    if (!std::getenv("VIDFLOW_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string jobId;
    bool wait = false;
    bool cancel = false;
    bool markRead = false;
    bool remove = false;
    bool list = false;
    bool unreadOnly = false;
    std::optional<std::string> owner;
    std::optional<JobStatus> listStatus;

    // Parse args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-c" || arg == "--cancel") {
            cancel = true;
        } else if (arg == "-r" || arg == "--read") {
            markRead = true;
        } else if (arg == "-d" || arg == "--delete") {
            remove = true;
        } else if ((arg == "-o" || arg == "--owner") && i + 1 < argc) {
            owner = argv[++i];
            list = true;
        } else if (arg == "-u" || arg == "--unread") {
            unreadOnly = true;
        } else if (arg == "-l" || arg == "--list") {
            list = true;
            if (i + 1 < argc) {
                if (auto status = parseStatus(argv[i + 1])) {
                    listStatus = status;
                    ++i;
                }
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            jobId = arg;
        }
    }

    // Check piped input for JobID if not provided
    if (!list && jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        FileJobStore store(workspace, false);
        if (!store.valid()) {
            std::cerr << "Error: Not a vidflow workspace: " << workspace << std::endl;
            return 1;
        }
        Flow flow(store);

        if (list) {
            if (unreadOnly && !owner) {
                std::cerr << "Error: --unread needs --owner" << std::endl;
                return 1;
            }
            return listJobs(flow, listStatus, owner, unreadOnly);
        }

        // Resolve ID (Specific or Latest)
        if (jobId.empty()) {
            auto latest = flow.latest();
            if (!latest) {
                std::cerr << "No jobs found" << std::endl;
                return 1;
            }
            jobId = latest->id;
        }

        if (!flow.exists(jobId)) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        Work work(store);
        if (cancel) {
            if (!work.cancel(jobId)) {
                std::cerr << "Error: Job cannot be cancelled: " << jobId << std::endl;
                return 1;
            }
            std::cout << jobId << std::endl;
            return 0;
        }
        if (remove) {
            if (!work.remove(jobId)) {
                std::cerr << "Error: Only finished jobs can be deleted: " << jobId << std::endl;
                return 1;
            }
            std::cout << jobId << std::endl;
            return 0;
        }

        // Wait loop
        if (wait) {
            while (true) {
                auto s = flow.status(jobId);
                if (!s || isTerminal(*s)) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
            }
        }

        auto job = flow.get(jobId);
        if (!job) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        int code = report(*job);
        if (markRead && isTerminal(job->status) && !work.markAsRead(jobId)) {
            std::cerr << "Error: Could not mark job as read: " << jobId << std::endl;
            return 1;
        }
        return code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
