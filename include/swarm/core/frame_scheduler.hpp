/**
 * @file frame_scheduler.hpp
 * @brief "Call me before the next display frame" requests and their cancellation
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>

using FrameRequestId = std::uint64_t;

constexpr FrameRequestId NoFrameRequest = 0;

/**
 * @class IFrameScheduler
 * @brief Source of display frames
 *
 * A request fires at most once, with the timestamp of the frame in
 * milliseconds. A cancelled request never fires.
 */
class IFrameScheduler {
public:
    using FrameCallback = std::function<void(double timestampMs)>;

    virtual ~IFrameScheduler() = default;

    virtual FrameRequestId requestFrame(FrameCallback callback) = 0;

    /**
     * @brief Revokes a pending request; unknown or fired ids are ignored
     */
    virtual void cancelFrame(FrameRequestId id) = 0;
};

/**
 * @class ManualFrameScheduler
 * @brief Scheduler whose frames are produced by calling runFrame()
 *
 * Used by the native host, which calls runFrame() once per display refresh,
 * and by tests. Requests made while a frame is running fire on the next frame.
 */
class ManualFrameScheduler : public IFrameScheduler {
public:
    FrameRequestId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameRequestId id) override;

    /**
     * @brief Fires every request pending when the call starts
     * @return Number of callbacks invoked
     */
    std::size_t runFrame(double timestampMs);

    std::size_t pendingCount() const { return pending.size(); }

private:
    FrameRequestId nextId = 1;
    std::map<FrameRequestId, FrameCallback> pending;
};
