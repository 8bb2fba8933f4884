/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "wfsnap/worker_slots.hpp"
#include "wfsnap/logger.hpp"

namespace wfsnap {

const char* toString(SlotPhase phase) noexcept {
    switch (phase) {
        case SlotPhase::Idle:      return "idle";
        case SlotPhase::Rendering: return "rendering";
        case SlotPhase::Completed: return "completed";
    }
    return "idle";
}

WorkerSlots::WorkerSlots(std::size_t count) {
    slots_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        slots_.push_back(std::make_unique<Slot>());
    }
}

void WorkerSlots::markRendering(std::size_t slot, const JobId& jobId, Clock::time_point startedAt) {
    Slot* s = at(slot);
    if (!s) return;
    std::lock_guard<std::mutex> lock(s->mutex);
    s->state.phase = SlotPhase::Rendering;
    s->state.jobId = jobId;
    s->state.startedAt = startedAt;
}

void WorkerSlots::markCompleted(std::size_t slot, const JobId& jobId, JobStatus status) {
    Slot* s = at(slot);
    if (!s) return;
    std::lock_guard<std::mutex> lock(s->mutex);
    s->state.phase = SlotPhase::Completed;
    s->state.jobId = jobId;
    s->state.status = status;
    ++s->state.completedJobs;
}

void WorkerSlots::markIdle(std::size_t slot) {
    Slot* s = at(slot);
    if (!s) return;
    std::lock_guard<std::mutex> lock(s->mutex);
    s->state.phase = SlotPhase::Idle;
    s->state.jobId.clear();
}

WorkerSlotState WorkerSlots::read(std::size_t slot) const {
    Slot* s = at(slot);
    if (!s) return {};
    std::lock_guard<std::mutex> lock(s->mutex);
    return s->state;
}

std::vector<WorkerSlotState> WorkerSlots::readAll() const {
    std::vector<WorkerSlotState> states;
    states.reserve(slots_.size());
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        states.push_back(read(i));
    }
    return states;
}

WorkerSlots::Slot* WorkerSlots::at(std::size_t slot) const noexcept {
    if (slot >= slots_.size()) {
        LOG_ERROR("Worker slot out of range: " + std::to_string(slot));
        return nullptr;
    }
    return slots_[slot].get();
}

}
