#pragma once

#include "IScheduler.hpp"
#include <QObject>

namespace ww {

/// IScheduler backed by QTimer on the caller's thread.
class QtScheduler : public QObject, public IScheduler {
    Q_OBJECT
public:
    explicit QtScheduler(QObject* parent = nullptr);

    ScheduledTaskPtr scheduleAfter(double seconds, Callback callback) override;
    ScheduledTaskPtr scheduleEvery(double seconds, Callback callback) override;

private:
    ScheduledTaskPtr schedule(double seconds, Callback callback, bool repeat);
};

} // namespace ww
