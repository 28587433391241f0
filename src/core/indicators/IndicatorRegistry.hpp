#pragma once

#include "Indicator.hpp"
#include <QList>
#include <QObject>
#include <functional>

namespace ww {

/// Ordered dispatch list of indicators.
///
/// Every broadcast reaches the indicators in registration order. A throwing
/// indicator is logged and reported through indicatorFailed(); the remaining
/// indicators still receive the call. The registry does NOT own indicators.
class IndicatorRegistry : public QObject {
    Q_OBJECT
public:
    explicit IndicatorRegistry(QObject* parent = nullptr);

    /// Append an indicator. No duplicate check. Null (a failed creation) is
    /// ignored and returns false.
    bool registerIndicator(Indicator* indicator);

    /// Inactive entries stay registered but are skipped by broadcasts.
    bool setActive(Indicator* indicator, bool active);

    void broadcastUpdate(const Instigator& instigator = std::nullopt);
    void broadcastRefresh();
    void broadcastMute();
    void broadcastUnmute();

    /// Destroy every indicator's resources, then clear the list.
    void teardownAll();

    QList<Indicator*> indicators() const;
    int size() const { return entries_.size(); }

signals:
    void indicatorRegistered(const QString& name);
    void indicatorFailed(const QString& name, const QString& operation, const QString& reason);

private:
    struct IndicatorHandle {
        Indicator* indicator = nullptr;
        bool active = true;
    };

    void dispatch(const char* operation, const std::function<void(Indicator*)>& call,
                  bool includeInactive = false);

    QList<IndicatorHandle> entries_;
};

} // namespace ww
