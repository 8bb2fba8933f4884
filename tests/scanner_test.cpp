/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "test_utils.hpp"
#include "wfsnap/scanner.hpp"

using namespace wfsnap;
using wfsnap::test::TempDirTest;

class ScannerTest : public TempDirTest {};

TEST_F(ScannerTest, MissingFolderYieldsNothing) {
    Scanner scanner(root_ / "does-not-exist");
    EXPECT_FALSE(scanner.folderExists());
    EXPECT_TRUE(scanner.scan().empty());
}

TEST_F(ScannerTest, FindsJsonRecursivelyInSortedOrder) {
    writeWorkflow("b.json");
    writeWorkflow("a.json");
    writeWorkflow("nested/c.json");
    writeFile("notes.txt", "not a workflow");

    Scanner scanner(root_);
    auto files = scanner.scan();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].relativePath.generic_string(), "a.json");
    EXPECT_EQ(files[1].relativePath.generic_string(), "b.json");
    EXPECT_EQ(files[2].relativePath.generic_string(), "nested/c.json");
}

TEST_F(ScannerTest, NonRecursiveStaysAtTopLevel) {
    writeWorkflow("a.json");
    writeWorkflow("nested/c.json");

    Scanner scanner(root_, false);
    auto files = scanner.scan();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].relativePath.generic_string(), "a.json");
}

TEST_F(ScannerTest, IgnoredNamesAreSkipped) {
    writeWorkflow("a.json");
    writeFile("wfsnap-job.json", "{\"jobs\": []}");

    Scanner scanner(root_);
    scanner.ignore("wfsnap-job.json");
    auto files = scanner.scan();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].relativePath.generic_string(), "a.json");
}

TEST_F(ScannerTest, ValidWorkflowCarriesNameAndNodeStats) {
    writeFile("flow.json", test::workflowJson("Billing Sync", 3));
    Scanner scanner(root_);
    auto file = scanner.inspect(root_ / "flow.json");

    EXPECT_TRUE(file.valid);
    EXPECT_TRUE(file.error.empty());
    EXPECT_EQ(file.name, "Billing Sync");
    EXPECT_EQ(file.nodeCount, 3u);
    EXPECT_EQ(file.nodeTypes.count("n8n-nodes-base.set"), 1u);
}

TEST_F(ScannerTest, RejectsMalformedJson) {
    writeFile("broken.json", "{\"name\": ");
    Scanner scanner(root_);
    auto file = scanner.inspect(root_ / "broken.json");
    EXPECT_FALSE(file.valid);
    EXPECT_EQ(file.error.rfind("Invalid JSON", 0), 0u);
}

TEST_F(ScannerTest, RejectsStructuralProblems) {
    struct Case {
        const char* body;
        const char* field;
    };
    const Case cases[] = {
        {"[]", "root"},
        {"{\"nodes\": [{}]}", "name"},
        {"{\"name\": \"x\", \"nodes\": []}", "nodes"},
        {"{\"name\": \"x\", \"nodes\": [{\"name\": \"a\", \"position\": [0, 0], \"typeVersion\": 1}]}", "type"},
        {"{\"name\": \"x\", \"nodes\": [{\"name\": \"a\", \"type\": \"t\", \"position\": [0], \"typeVersion\": 1}]}", "position"},
        {"{\"name\": \"x\", \"nodes\": [{\"name\": \"a\", \"type\": \"t\", \"position\": [0, 0], \"typeVersion\": 0}]}", "typeVersion"},
        {"{\"name\": \"x\", \"nodes\": [{\"name\": \"a\", \"type\": \"t\", \"position\": [0, 0], \"typeVersion\": 1}], \"connections\": []}", "connections"},
    };

    Scanner scanner(root_);
    for (const auto& c : cases) {
        writeFile("case.json", c.body);
        auto file = scanner.inspect(root_ / "case.json");
        EXPECT_FALSE(file.valid) << c.body;
        EXPECT_EQ(file.error.rfind("Validation error: ", 0), 0u) << file.error;
        EXPECT_NE(file.error.find(c.field), std::string::npos) << file.error;
    }
}

TEST_F(ScannerTest, SummaryAndValidOnly) {
    writeWorkflow("a.json", 2);
    writeWorkflow("b.json", 3);
    writeFile("c.json", "not json");

    Scanner scanner(root_);
    auto files = scanner.scan();
    auto summary = Scanner::summarize(files);
    EXPECT_EQ(summary.totalFiles, 3u);
    EXPECT_EQ(summary.validWorkflows, 2u);
    EXPECT_EQ(summary.invalidWorkflows, 1u);
    EXPECT_EQ(summary.totalNodes, 5u);
    EXPECT_EQ(summary.nodeTypes.size(), 1u);
    EXPECT_EQ(Scanner::validOnly(files).size(), 2u);
}

TEST(ScannerSafeFilename, ReplacesCollapsesAndTrims) {
    EXPECT_EQ(Scanner::safeFilename("billing-sync_v2"), "billing-sync_v2");
    EXPECT_EQ(Scanner::safeFilename("My Flow (copy)"), "My_Flow_copy");
    EXPECT_EQ(Scanner::safeFilename("__a...b__"), "a_b");
    EXPECT_EQ(Scanner::safeFilename("!!!"), "workflow");
    EXPECT_EQ(Scanner::safeFilename(""), "workflow");
}
