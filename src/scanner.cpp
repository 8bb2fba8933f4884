/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/scanner.hpp"
#include "wfsnap/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>
#include <nlohmann/json.hpp>

namespace wfsnap {

using nlohmann::json;

namespace {

// Mirrors the workflow schema: name, at least one node, node fields typed.
std::optional<std::string> validateWorkflow(const json& data) {
    if (!data.is_object()) {
        return std::string("root: must be a JSON object");
    }
    if (!data.contains("name") || !data["name"].is_string()) {
        return std::string("name: field required");
    }
    if (!data.contains("nodes") || !data["nodes"].is_array()) {
        return std::string("nodes: field required");
    }
    const json& nodes = data["nodes"];
    if (nodes.empty()) {
        return std::string("nodes: should have at least 1 item");
    }

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const json& node = nodes[i];
        const std::string where = "nodes -> " + std::to_string(i) + " -> ";
        if (!node.is_object()) {
            return where + "node: must be an object";
        }
        if (!node.contains("name") || !node["name"].is_string()) {
            return where + "name: field required";
        }
        if (!node.contains("type") || !node["type"].is_string()) {
            return where + "type: field required";
        }
        if (!node.contains("position") || !node["position"].is_array() || node["position"].size() != 2 ||
            !node["position"][0].is_number() || !node["position"][1].is_number()) {
            return where + "position: must be a list of 2 numbers";
        }
        if (!node.contains("typeVersion") || !node["typeVersion"].is_number()) {
            return where + "typeVersion: field required";
        }
        if (node["typeVersion"].get<double>() < 1.0) {
            return where + "typeVersion: should be greater than or equal to 1";
        }
        if (node.contains("parameters") && !node["parameters"].is_object()) {
            return where + "parameters: must be an object";
        }
    }

    if (data.contains("connections") && !data["connections"].is_object()) {
        return std::string("connections: must be an object");
    }
    if (data.contains("active") && !data["active"].is_boolean()) {
        return std::string("active: must be a boolean");
    }
    return std::nullopt;
}

}

Scanner::Scanner(const std::filesystem::path& inputFolder, bool recursive) noexcept
    : inputFolder_(inputFolder), recursive_(recursive) {
}

bool Scanner::folderExists() const noexcept {
    std::error_code ec;
    return std::filesystem::is_directory(inputFolder_, ec);
}

std::vector<WorkflowFile> Scanner::scan() const {
    std::vector<WorkflowFile> workflows;

    if (!folderExists()) {
        LOG_ERROR("Input folder not found: " + inputFolder_.string());
        return workflows;
    }

    LOG_INFO("Scanning for workflows in: " + inputFolder_.string());

    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (recursive_) {
        auto options = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(inputFolder_, options, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (isCandidate(*it)) {
                files.push_back(it->path());
            }
        }
    } else {
        for (auto it = std::filesystem::directory_iterator(inputFolder_, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (isCandidate(*it)) {
                files.push_back(it->path());
            }
        }
    }
    if (ec) {
        LOG_WARN("Directory walk stopped early in " + inputFolder_.string() + ": " + ec.message());
    }

    // Directory iteration order is unspecified; sort for reproducible reports
    std::sort(files.begin(), files.end(), [this](const auto& a, const auto& b) {
        return a.lexically_relative(inputFolder_).generic_string() <
               b.lexically_relative(inputFolder_).generic_string();
    });

    LOG_INFO("Found " + std::to_string(files.size()) + " JSON files");

    workflows.reserve(files.size());
    for (const auto& file : files) {
        workflows.push_back(inspect(file));
    }

    auto summary = summarize(workflows);
    LOG_INFO("Validated workflows: " + std::to_string(summary.validWorkflows) + "/" +
             std::to_string(summary.totalFiles));
    return workflows;
}

WorkflowFile Scanner::inspect(const std::filesystem::path& file) const {
    WorkflowFile workflow;
    workflow.path = file;
    workflow.relativePath = file.lexically_relative(inputFolder_);
    if (workflow.relativePath.empty()) {
        workflow.relativePath = file.filename();
    }
    workflow.name = file.stem().string();

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        workflow.error = "Processing error: cannot open file";
        LOG_WARN("Cannot open " + file.string());
        return workflow;
    }

    json data = json::parse(in, nullptr, false);
    if (data.is_discarded()) {
        workflow.error = "Invalid JSON: parse error";
        LOG_WARN("Invalid JSON in " + file.filename().string());
        return workflow;
    }

    if (auto problem = validateWorkflow(data)) {
        workflow.error = "Validation error: " + *problem;
        LOG_WARN("Invalid workflow structure in " + file.filename().string() + ": " + *problem);
        return workflow;
    }

    workflow.valid = true;
    workflow.name = data["name"].get<std::string>();
    workflow.nodeCount = data["nodes"].size();
    workflow.connectionCount = data.contains("connections") ? data["connections"].size() : 0;
    for (const auto& node : data["nodes"]) {
        workflow.nodeTypes.insert(node["type"].get<std::string>());
    }
    LOG_TRACE("Valid workflow: " + workflow.relativePath.generic_string());
    return workflow;
}

std::vector<WorkflowFile> Scanner::validOnly(const std::vector<WorkflowFile>& files) {
    std::vector<WorkflowFile> valid;
    std::copy_if(files.begin(), files.end(), std::back_inserter(valid),
                 [](const WorkflowFile& w) { return w.valid; });
    return valid;
}

ScanSummary Scanner::summarize(const std::vector<WorkflowFile>& files) {
    ScanSummary summary;
    summary.totalFiles = files.size();
    for (const auto& w : files) {
        if (w.valid) {
            ++summary.validWorkflows;
            summary.totalNodes += w.nodeCount;
            summary.nodeTypes.insert(w.nodeTypes.begin(), w.nodeTypes.end());
        } else {
            ++summary.invalidWorkflows;
        }
    }
    return summary;
}

std::string Scanner::safeFilename(const std::string& stem) {
    std::string safe;
    safe.reserve(stem.size());
    for (char c : stem) {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        char out = keep ? c : '_';
        if (out == '_' && !safe.empty() && safe.back() == '_') {
            continue;
        }
        safe.push_back(out);
    }

    auto first = safe.find_first_not_of('_');
    if (first == std::string::npos) {
        return "workflow";
    }
    auto last = safe.find_last_not_of('_');
    return safe.substr(first, last - first + 1);
}

bool Scanner::isCandidate(const std::filesystem::directory_entry& entry) const {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    const auto& path = entry.path();
    if (path.extension() != ".json") {
        return false;
    }
    return ignored_.count(path.filename().string()) == 0;
}

}
