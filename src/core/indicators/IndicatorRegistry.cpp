#include "IndicatorRegistry.hpp"
#include <boost/log/trivial.hpp>
#include <exception>

namespace ww {

IndicatorRegistry::IndicatorRegistry(QObject* parent)
    : QObject(parent)
{
}

bool IndicatorRegistry::registerIndicator(Indicator* indicator)
{
    if (!indicator) {
        BOOST_LOG_TRIVIAL(warning) << "[IndicatorRegistry] Ignoring null indicator "
                                   << "(creation failed)";
        return false;
    }

    entries_.append({indicator, true});
    BOOST_LOG_TRIVIAL(debug) << "[IndicatorRegistry] Added indicator "
                             << indicator->name().toStdString() << ": "
                             << entries_.size() << " total";
    emit indicatorRegistered(indicator->name());
    return true;
}

bool IndicatorRegistry::setActive(Indicator* indicator, bool active)
{
    bool found = false;
    for (auto& entry : entries_) {
        if (entry.indicator == indicator) {
            entry.active = active;
            found = true;
        }
    }
    return found;
}

void IndicatorRegistry::dispatch(const char* operation,
                                 const std::function<void(Indicator*)>& call,
                                 bool includeInactive)
{
    // Copy: an indicator callback may register further indicators.
    const QList<IndicatorHandle> entries = entries_;
    for (const auto& entry : entries) {
        if (!entry.active && !includeInactive)
            continue;

        QString failure;
        try {
            call(entry.indicator);
            continue;
        } catch (const std::exception& e) {
            failure = QString::fromUtf8(e.what());
        } catch (...) {
            failure = QStringLiteral("unknown exception");
        }

        const QString name = entry.indicator->name();
        BOOST_LOG_TRIVIAL(error) << "[IndicatorRegistry] Error calling " << operation << "() on "
                                 << name.toStdString() << ": " << failure.toStdString();
        emit indicatorFailed(name, QString::fromLatin1(operation), failure);
    }
}

void IndicatorRegistry::broadcastUpdate(const Instigator& instigator)
{
    BOOST_LOG_TRIVIAL(debug) << "[IndicatorRegistry] Updating " << entries_.size() << " indicators";
    dispatch("update", [&instigator](Indicator* i) { i->update(instigator); });
}

void IndicatorRegistry::broadcastRefresh()
{
    BOOST_LOG_TRIVIAL(debug) << "[IndicatorRegistry] Refreshing " << entries_.size() << " indicators";
    dispatch("refresh", [](Indicator* i) { i->refresh(); });
}

void IndicatorRegistry::broadcastMute()
{
    dispatch("mute", [](Indicator* i) { i->mute(); });
}

void IndicatorRegistry::broadcastUnmute()
{
    dispatch("unmute", [](Indicator* i) { i->unmute(); });
}

void IndicatorRegistry::teardownAll()
{
    BOOST_LOG_TRIVIAL(debug) << "[IndicatorRegistry] Tearing down " << entries_.size() << " indicators";
    dispatch("destroy", [](Indicator* i) { i->destroy(); }, true);
    entries_.clear();
}

QList<Indicator*> IndicatorRegistry::indicators() const
{
    QList<Indicator*> result;
    for (const auto& entry : entries_)
        result.append(entry.indicator);
    return result;
}

} // namespace ww
