/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/file_store.hpp"
#include "vidflow/generation_spec.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/work.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace vidflow;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "vidflow Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <prompt...> [options]\n";
    std::cout << "       " << progName << " <workspace> - [options]   (read prompt from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory for job storage\n";
    std::cout << "  prompt        Text prompt for the video (can be multiple words)\n";
    std::cout << "  -             Read prompt from stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  --width <px>          Output width (default: 512)\n";
    std::cout << "  --height <px>         Output height (default: 512)\n";
    std::cout << "  --length <s>          Video length in seconds (default: 4)\n";
    std::cout << "  --fps <n>             Output frame rate (default: 8)\n";
    std::cout << "  --steps <n>           Denoising steps (default: 25)\n";
    std::cout << "  --guidance <g>        Guidance scale (default: 7.5)\n";
    std::cout << "  --seed <n>            Random seed (default: 0)\n";
    std::cout << "  --model <name>        Base model (default: sd15)\n";
    std::cout << "  --adapter <name>      Motion adapter (default: default)\n";
    std::cout << "  --lora <name=weight>  Add a LoRA (repeatable)\n";
    std::cout << "  --format <ext>        Output container (default: y4m)\n";
    std::cout << "  --negative <text>     Negative prompt\n";
    std::cout << "  --owner <name>        Job owner\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  VIDFLOW_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace \"a lighthouse at dusk\"\n";
    std::cout << "  " << progName << " ./workspace a red kite over hills --length 2 --fps 16\n";
    std::cout << "  echo \"ocean waves\" | " << progName << " ./workspace - --seed 42\n";
}

namespace {

bool isValueOption(const std::string& arg) {
    return arg == "--width" || arg == "--height" || arg == "--length" || arg == "--fps" ||
           arg == "--steps" || arg == "--guidance" || arg == "--seed" || arg == "--model" ||
           arg == "--adapter" || arg == "--lora" || arg == "--format" || arg == "--negative" ||
           arg == "--owner";
}

// Applies one option to the spec. Throws std::invalid_argument on bad input.
void applyOption(GenerationSpec& spec, std::optional<std::string>& owner,
                 const std::string& name, const std::string& value) {
    if (name == "--width") {
        spec.width = std::stoi(value);
    } else if (name == "--height") {
        spec.height = std::stoi(value);
    } else if (name == "--length") {
        spec.lengthSeconds = std::stoi(value);
    } else if (name == "--fps") {
        spec.fps = std::stoi(value);
    } else if (name == "--steps") {
        spec.inferenceSteps = std::stoi(value);
    } else if (name == "--guidance") {
        spec.guidanceScale = std::stod(value);
    } else if (name == "--seed") {
        spec.seed = std::stoll(value);
    } else if (name == "--model") {
        spec.baseModel = value;
    } else if (name == "--adapter") {
        spec.motionAdapter = value;
    } else if (name == "--lora") {
        auto eq = value.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("--lora expects name=weight");
        }
        spec.loras[value.substr(0, eq)] = std::stod(value.substr(eq + 1));
    } else if (name == "--format") {
        spec.outputFormat = value;
    } else if (name == "--negative") {
        spec.negativePrompt = value;
    } else if (name == "--owner") {
        owner = value;
    }
}

}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; VIDFLOW_LOG_LEVEL overrides
    if (!std::getenv("VIDFLOW_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    std::string workspace = argv[1];
    GenerationSpec spec;
    std::optional<std::string> owner;
    std::ostringstream promptStream;
    bool first = true;
    bool readStdin = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (isValueOption(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            try {
                applyOption(spec, owner, arg, argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "-") {
            readStdin = true;
        } else {
            if (!first) promptStream << " ";
            promptStream << arg;
            first = false;
        }
    }

    if (first && !readStdin && !isatty(fileno(stdin))) {
        readStdin = true;
    }

    if (readStdin) {
        spec.prompt.assign((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
        // Remove strictly trailing newline if prompt is just a one-liner
        if (!spec.prompt.empty() && spec.prompt.back() == '\n') {
            spec.prompt.pop_back();
        }
    } else {
        spec.prompt = promptStream.str();
    }

    if (spec.prompt.empty()) {
        std::cerr << "Error: Empty prompt provided\n";
        return 1;
    }

    try {
        FileJobStore store(workspace, true);
        if (!store.valid()) {
            std::cerr << "Error: Workspace is not usable: " << workspace << "\n";
            return 1;
        }

        Work work(store);
        SubmitResult result = work.submit(spec, owner);
        if (result.ok) {
            // Just the job ID - clean for piping, no noise
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
