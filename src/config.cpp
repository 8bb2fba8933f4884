/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/config.hpp"
#include "wfsnap/logger.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace wfsnap {

std::filesystem::path RunOptions::reportPath() const {
    return outputRoot() / reportName;
}

std::filesystem::path RunOptions::outputRoot() const {
    if (inPlace || !outputFolder) {
        return inputFolder;
    }
    return *outputFolder;
}

int envInt(const char* name, int defaultValue) noexcept {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        LOG_WARN(std::string("Ignoring malformed integer in ") + name + ": " + value);
        return defaultValue;
    }
    return static_cast<int>(parsed);
}

std::string envString(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }
    return value;
}

RunOptions optionsFromEnv() {
    RunOptions options;
    options.workers = envInt("WFSNAP_WORKERS", options.workers);
    options.retries = envInt("WFSNAP_RETRIES", options.retries);
    options.render.timeoutSeconds = envInt("WFSNAP_TIMEOUT", options.render.timeoutSeconds);
    options.render.waitSeconds = envInt("WFSNAP_WAIT", options.render.waitSeconds);
    options.renderCommand = envString("WFSNAP_RENDER_CMD", options.renderCommand);
    options.serverUrl = envString("WFSNAP_SERVER_URL", options.serverUrl);
    return options;
}

std::vector<std::string> normalize(RunOptions& options, unsigned hardwareThreads) {
    std::vector<std::string> warnings;

    if (options.square) {
        options.render.width = kSquareSize;
        options.render.height = kSquareSize;
    }

    if (options.inPlace && options.outputFolder) {
        warnings.push_back("--in-place is set; output folder " + options.outputFolder->string() +
                           " will be ignored");
        options.outputFolder.reset();
    }

    const int maxWorkers = hardwareThreads > 0 ? static_cast<int>(hardwareThreads) : 1;
    if (options.workers > maxWorkers) {
        warnings.push_back("Requested " + std::to_string(options.workers) +
                           " workers exceeds CPU count (" + std::to_string(maxWorkers) +
                           "); using " + std::to_string(maxWorkers));
        options.workers = maxWorkers;
    }

    return warnings;
}

std::vector<std::string> validate(const RunOptions& options) {
    std::vector<std::string> problems;

    if (options.inputFolder.empty()) {
        problems.emplace_back("input folder is required");
    }
    if (!options.inPlace && !options.outputFolder) {
        problems.emplace_back("either provide an output folder or use --in-place");
    }
    if (options.workers < 1) {
        problems.emplace_back("--workers must be at least 1");
    }
    if (options.retries < 0) {
        problems.emplace_back("--retries must not be negative");
    }
    if (options.render.width <= 0 || options.render.height <= 0) {
        problems.emplace_back("viewport width and height must be positive");
    }
    if (options.render.timeoutSeconds <= 0) {
        problems.emplace_back("--timeout must be positive");
    }
    if (options.render.waitSeconds < 0) {
        problems.emplace_back("--wait-time must not be negative");
    }
    if (options.reportName.empty()) {
        problems.emplace_back("report name must not be empty");
    }

    return problems;
}

}
