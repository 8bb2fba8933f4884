/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <vector>

#include "wfsnap/types.hpp"

namespace wfsnap {

enum class SlotPhase : std::uint8_t { Idle, Rendering, Completed };

struct WorkerSlotState {
    SlotPhase phase = SlotPhase::Idle;
    JobId jobId;
    Clock::time_point startedAt;
    JobStatus status = JobStatus::Success;
    std::size_t completedJobs = 0;
};

[[nodiscard]] const char* toString(SlotPhase phase) noexcept;

// One slot per worker. Only the owning worker writes its slot; each slot has
// its own lock so a reader never waits on anything but a struct copy.
class WorkerSlots {
public:
    explicit WorkerSlots(std::size_t count);

    WorkerSlots(const WorkerSlots&) = delete;
    WorkerSlots& operator=(const WorkerSlots&) = delete;

    void markRendering(std::size_t slot, const JobId& jobId, Clock::time_point startedAt);
    void markCompleted(std::size_t slot, const JobId& jobId, JobStatus status);
    void markIdle(std::size_t slot);

    [[nodiscard]] WorkerSlotState read(std::size_t slot) const;
    [[nodiscard]] std::vector<WorkerSlotState> readAll() const;
    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }

private:
    struct Slot {
        mutable std::mutex mutex;
        WorkerSlotState state;
    };

    std::vector<std::unique_ptr<Slot>> slots_;

    [[nodiscard]] Slot* at(std::size_t slot) const noexcept;
};

}
