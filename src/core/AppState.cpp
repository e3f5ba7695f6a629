#include "AppState.h"
#include <algorithm>

// ═════════════════════════════════════════════════════════════════════
//  Library
// ═════════════════════════════════════════════════════════════════════

std::optional<Playlist> Library::playlistById(const QString& id) const
{
    for (const Playlist& p : m_known) {
        if (p.id == id)
            return p;
    }
    return std::nullopt;
}

bool Library::applyPlaylists(ListKey key, Result<QVector<Playlist>> result)
{
    const bool ok = result.isOk();
    QVector<Playlist> loaded = ok ? result.value() : QVector<Playlist>();

    if (!playlists.update(key, std::move(result)))
        return false;

    if (ok)
        m_known = loaded;
    return true;
}

bool Library::incrementPlaylistTrackCount(const PlaylistLink& link)
{
    return adjustTrackCount(link, +1);
}

bool Library::decrementPlaylistTrackCount(const PlaylistLink& link)
{
    return adjustTrackCount(link, -1);
}

bool Library::adjustTrackCount(const PlaylistLink& link, int delta)
{
    auto adjust = [&](QVector<Playlist>& list) {
        bool matched = false;
        for (Playlist& p : list) {
            if (p.id != link.id)
                continue;
            matched = true;
            if (p.trackCount)
                p.trackCount = std::max(0, *p.trackCount + delta);
        }
        return matched;
    };

    bool matched = adjust(m_known);
    if (QVector<Playlist>* shown = playlists.valueMut())
        matched = adjust(*shown) || matched;
    return matched;
}

// ═════════════════════════════════════════════════════════════════════
//  Alerts
// ═════════════════════════════════════════════════════════════════════

quint64 AppState::infoAlert(const QString& message)
{
    return pushAlert(message, Alert::Style::Info);
}

quint64 AppState::errorAlert(const AppError& error)
{
    return pushAlert(error.message, Alert::Style::Error);
}

bool AppState::dismissAlert(quint64 id)
{
    auto it = std::find_if(alerts.begin(), alerts.end(),
                           [id](const Alert& a) { return a.id == id; });
    if (it == alerts.end())
        return false;
    alerts.erase(it);
    return true;
}

int AppState::expireAlerts(const QDateTime& now, int timeoutMs)
{
    const int before = alerts.size();
    alerts.erase(std::remove_if(alerts.begin(), alerts.end(),
                                [&](const Alert& a) {
                                    return a.createdAt.msecsTo(now) >= timeoutMs;
                                }),
                 alerts.end());
    return before - alerts.size();
}

quint64 AppState::pushAlert(const QString& message, Alert::Style style)
{
    Alert a;
    a.id = m_nextAlertId++;
    a.message = message;
    a.style = style;
    a.createdAt = QDateTime::currentDateTimeUtc();
    alerts.append(a);
    return a.id;
}
