#pragma once

#include <functional>
#include <memory>

namespace ww {

/// Handle to a delayed or repeating callback.
/// Destroying the last handle cancels the callback.
class ScheduledTask {
public:
    virtual ~ScheduledTask() = default;

    virtual void cancel() = 0;

    /// False once cancelled, or after a one-shot task has fired.
    virtual bool isActive() const = 0;
};

using ScheduledTaskPtr = std::shared_ptr<ScheduledTask>;

/// Timer primitives used for debouncing, app polling and blinking.
/// Callbacks run on the owning thread's event loop, never concurrently.
class IScheduler {
public:
    virtual ~IScheduler() = default;

    using Callback = std::function<void()>;

    /// Run callback once after the given delay.
    virtual ScheduledTaskPtr scheduleAfter(double seconds, Callback callback) = 0;

    /// Run callback every interval until cancelled. The first run happens
    /// one interval from now.
    virtual ScheduledTaskPtr scheduleEvery(double seconds, Callback callback) = 0;
};

} // namespace ww
