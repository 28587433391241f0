#pragma once

#include "core/scheduling/IScheduler.hpp"
#include <algorithm>
#include <memory>
#include <vector>

// Manual clock: nothing runs until advance() is called.
class FakeScheduler : public ww::IScheduler {
public:
    class Task : public ww::ScheduledTask {
    public:
        double due = 0;
        double interval = 0;
        bool repeating = false;
        bool active = true;
        Callback callback;

        void cancel() override { active = false; }
        bool isActive() const override { return active; }
    };

    ww::ScheduledTaskPtr scheduleAfter(double seconds, Callback callback) override
    {
        return add(seconds, std::move(callback), false);
    }

    ww::ScheduledTaskPtr scheduleEvery(double seconds, Callback callback) override
    {
        return add(seconds, std::move(callback), true);
    }

    // Run every task falling due within the next `seconds`, in due order.
    void advance(double seconds)
    {
        const double target = now_ + seconds;
        for (;;) {
            std::shared_ptr<Task> next;
            for (const auto& weak : tasks_) {
                auto task = weak.lock();
                if (!task || !task->active || task->due > target + 1e-9)
                    continue;
                if (!next || task->due < next->due)
                    next = task;
            }
            if (!next)
                break;

            now_ = std::max(now_, next->due);
            if (next->repeating)
                next->due += next->interval;
            else
                next->active = false;
            auto callback = next->callback;
            callback();
        }
        now_ = target;
        prune();
    }

    double now() const { return now_; }

    int activeCount() const
    {
        int count = 0;
        for (const auto& weak : tasks_) {
            auto task = weak.lock();
            if (task && task->active)
                ++count;
        }
        return count;
    }

    int scheduledTotal() const { return scheduledTotal_; }

private:
    ww::ScheduledTaskPtr add(double seconds, Callback callback, bool repeating)
    {
        auto task = std::make_shared<Task>();
        task->interval = repeating ? std::max(seconds, 0.001) : std::max(seconds, 0.0);
        task->due = now_ + task->interval;
        task->repeating = repeating;
        task->callback = std::move(callback);
        tasks_.push_back(task);
        ++scheduledTotal_;
        return task;
    }

    void prune()
    {
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                    [](const std::weak_ptr<Task>& weak) {
                                        auto task = weak.lock();
                                        return !task || !task->active;
                                    }),
                     tasks_.end());
    }

    double now_ = 0;
    int scheduledTotal_ = 0;
    std::vector<std::weak_ptr<Task>> tasks_;
};
