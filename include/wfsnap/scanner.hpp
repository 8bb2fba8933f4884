/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace wfsnap {

struct WorkflowFile {
    std::filesystem::path path;
    std::filesystem::path relativePath;
    std::string name;
    bool valid = false;
    std::string error;
    std::size_t nodeCount = 0;
    std::size_t connectionCount = 0;
    std::set<std::string> nodeTypes;
};

struct ScanSummary {
    std::size_t totalFiles = 0;
    std::size_t validWorkflows = 0;
    std::size_t invalidWorkflows = 0;
    std::size_t totalNodes = 0;
    std::set<std::string> nodeTypes;
};

class Scanner {
public:
    explicit Scanner(const std::filesystem::path& inputFolder, bool recursive = true) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // File names (not paths) that are never treated as workflows, e.g. the status report.
    void ignore(const std::string& filename) { ignored_.insert(filename); }

    [[nodiscard]] bool folderExists() const noexcept;

    // Every *.json below the input folder, ordered by relative path.
    [[nodiscard]] std::vector<WorkflowFile> scan() const;
    [[nodiscard]] WorkflowFile inspect(const std::filesystem::path& file) const;

    [[nodiscard]] static std::vector<WorkflowFile> validOnly(const std::vector<WorkflowFile>& files);
    [[nodiscard]] static ScanSummary summarize(const std::vector<WorkflowFile>& files);

    // File-system safe rendition of a file stem.
    [[nodiscard]] static std::string safeFilename(const std::string& stem);

private:
    std::filesystem::path inputFolder_;
    bool recursive_;
    std::set<std::string> ignored_;

    [[nodiscard]] bool isCandidate(const std::filesystem::directory_entry& entry) const;
};

}
