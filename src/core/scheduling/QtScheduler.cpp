#include "QtScheduler.hpp"
#include <QTimer>
#include <QtGlobal>
#include <boost/log/trivial.hpp>

namespace ww {

namespace {

class QtScheduledTask : public ScheduledTask {
public:
    QtScheduledTask(int intervalMs, IScheduler::Callback callback, bool repeat)
        : timer_(new QTimer)
        , repeat_(repeat)
    {
        timer_->setSingleShot(!repeat);
        timer_->setInterval(intervalMs);
        // The task may be destroyed from inside its own callback, so the
        // timer is released with deleteLater() rather than deleted directly.
        QObject::connect(timer_, &QTimer::timeout, timer_, [this, callback]() {
            if (!repeat_)
                fired_ = true;
            callback();
        });
        timer_->start();
    }

    ~QtScheduledTask() override
    {
        timer_->stop();
        timer_->disconnect();
        timer_->deleteLater();
    }

    void cancel() override { timer_->stop(); }

    bool isActive() const override { return timer_->isActive() && !fired_; }

private:
    QTimer* timer_;
    bool repeat_;
    bool fired_ = false;
};

} // namespace

QtScheduler::QtScheduler(QObject* parent) : QObject(parent) {}

ScheduledTaskPtr QtScheduler::scheduleAfter(double seconds, Callback callback)
{
    return schedule(seconds, std::move(callback), false);
}

ScheduledTaskPtr QtScheduler::scheduleEvery(double seconds, Callback callback)
{
    return schedule(seconds, std::move(callback), true);
}

ScheduledTaskPtr QtScheduler::schedule(double seconds, Callback callback, bool repeat)
{
    if (seconds < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[QtScheduler] Negative delay " << seconds
                                   << "s, running on next loop iteration";
        seconds = 0;
    }
    const int ms = qRound(seconds * 1000.0);
    if (repeat && ms == 0) {
        BOOST_LOG_TRIVIAL(warning) << "[QtScheduler] Zero repeat interval, using 1ms";
        return std::make_shared<QtScheduledTask>(1, std::move(callback), true);
    }
    return std::make_shared<QtScheduledTask>(ms, std::move(callback), repeat);
}

} // namespace ww
