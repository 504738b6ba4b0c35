#include "swarm/core/frame_scheduler.hpp"

#include <utility>
#include <vector>

FrameRequestId ManualFrameScheduler::requestFrame(FrameCallback callback) {
    FrameRequestId const id = nextId++;
    pending.emplace(id, std::move(callback));
    return id;
}

void ManualFrameScheduler::cancelFrame(FrameRequestId id) {
    pending.erase(id);
}

std::size_t ManualFrameScheduler::runFrame(double timestampMs) {
    std::vector<FrameRequestId> due;
    due.reserve(pending.size());
    for (const auto& [id, callback] : pending) {
        due.push_back(id);
    }

    std::size_t fired = 0;
    for (FrameRequestId id : due) {
        // An earlier callback may have cancelled this one
        auto it = pending.find(id);
        if (it == pending.end()) {
            continue;
        }
        FrameCallback callback = std::move(it->second);
        pending.erase(it);
        callback(timestampMs);
        ++fired;
    }
    return fired;
}
