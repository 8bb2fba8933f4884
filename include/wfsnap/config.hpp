/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "wfsnap/types.hpp"

namespace wfsnap {

constexpr int kSquareSize = 2560;
constexpr const char* kDefaultReportName = "wfsnap-job.json";
constexpr const char* kDefaultRenderCommand = "wfsnap-render";

struct RunOptions {
    std::filesystem::path inputFolder;
    std::optional<std::filesystem::path> outputFolder;
    bool inPlace = false;
    bool force = false;
    bool recursive = true;
    bool square = false;
    int workers = 1;
    int retries = 0;
    RenderConfig render;
    std::string reportName = kDefaultReportName;
    std::string renderCommand = kDefaultRenderCommand;
    std::string serverUrl;

    // Report lives next to the sources in in-place mode, in the output folder otherwise.
    [[nodiscard]] std::filesystem::path reportPath() const;
    [[nodiscard]] std::filesystem::path outputRoot() const;
};

// Integer/string lookups with defaults; malformed integers fall back to the default.
[[nodiscard]] int envInt(const char* name, int defaultValue) noexcept;
[[nodiscard]] std::string envString(const char* name, const std::string& defaultValue);

// Defaults overlaid with WFSNAP_* environment variables.
[[nodiscard]] RunOptions optionsFromEnv();

// Applies --square and the in-place/output-folder precedence. Returns warnings for the operator.
std::vector<std::string> normalize(RunOptions& options, unsigned hardwareThreads);

// Empty when the options describe a runnable batch.
[[nodiscard]] std::vector<std::string> validate(const RunOptions& options);

}
