/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <iostream>
#include <streambuf>

#include <gtest/gtest.h>

#include "wfsnap/logger.hpp"

using namespace wfsnap;

namespace {

// Sink whose writes throw something that is not a std::exception.
class ThrowingBuf : public std::streambuf {
protected:
    int_type overflow(int_type) override { throw 42; }
};

}

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("ERROR", LogLevel::INFO), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("warning", LogLevel::INFO), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Debug", LogLevel::INFO), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("loud", LogLevel::INFO), LogLevel::INFO);
}

TEST(Logger, ThrowingSinkNeverEscapes) {
    const LogLevel previous = Logger::level();
    Logger::setLevel(LogLevel::INFO);

    ThrowingBuf sink;
    std::streambuf* saved = std::cerr.rdbuf(&sink);
    const auto savedMask = std::cerr.exceptions();
    std::cerr.exceptions(std::ios::badbit);

    Logger::error("write fails with a non-standard exception");

    std::cerr.exceptions(std::ios::goodbit);
    std::cerr.rdbuf(saved);
    std::cerr.clear();
    std::cerr.exceptions(savedMask);
    Logger::setLevel(previous);

    SUCCEED();
}
