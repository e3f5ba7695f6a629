#pragma once

#include <QDateTime>
#include <QString>
#include <QVector>
#include <optional>

#include "AppError.h"
#include "MusicData.h"
#include "Promise.h"
#include "Settings.h"

// ── Correlation keys ────────────────────────────────────────────────
// Library reloads are keyed by the dispatcher's submission token.
using ListKey = quint64;

// Detail loads are keyed by the playlist, the sort snapshot the request was
// made with and the submission token, so a late response for an older request
// on the same playlist never satisfies a newer one.
struct PlaylistDetailKey {
    PlaylistLink link;
    SortCriteria sortCriteria = SortCriteria::Title;
    SortOrder    sortOrder = SortOrder::Ascending;
    quint64      token = 0;

    bool operator==(const PlaylistDetailKey& o) const
    {
        return token == o.token && link == o.link
            && sortCriteria == o.sortCriteria && sortOrder == o.sortOrder;
    }
    bool operator!=(const PlaylistDetailKey& o) const { return !(*this == o); }
};

// ── Library ─────────────────────────────────────────────────────────
// The user's playlists. `playlists` is what views observe; knownPlaylists()
// keeps the last successful load so a failed reload doesn't lose it.
class Library {
public:
    Promise<QVector<Playlist>, ListKey> playlists;

    const QVector<Playlist>& knownPlaylists() const { return m_known; }
    std::optional<Playlist> playlistById(const QString& id) const;

    // Feeds a LoadList result through the promise. Returns true if the
    // result was for the current request.
    bool applyPlaylists(ListKey key, Result<QVector<Playlist>> result);

    // Optimistic ±1 on the matching playlist's track count. Unknown counts
    // stay unknown and the count never drops below zero. Returns true if a
    // playlist matched.
    bool incrementPlaylistTrackCount(const PlaylistLink& link);
    bool decrementPlaylistTrackCount(const PlaylistLink& link);

private:
    bool adjustTrackCount(const PlaylistLink& link, int delta);

    QVector<Playlist> m_known;
};

// ── Playlist detail ─────────────────────────────────────────────────
struct PlaylistDetail {
    Promise<PlaylistTracks, PlaylistDetailKey> tracks;
};

// ── Alerts ──────────────────────────────────────────────────────────
struct Alert {
    enum class Style { Info, Error };

    quint64   id = 0;
    QString   message;
    Style     style = Style::Info;
    QDateTime createdAt;
};

// ── Application state ───────────────────────────────────────────────
// Owned by the controller and handed by reference to every command hook on
// the owning thread. Copies are cheap (implicitly shared containers) and
// serve as request-time snapshots.
struct AppState {
    Config          config;
    Library         library;
    PlaylistDetail  playlistDetail;
    QVector<Alert>  alerts;

    quint64 infoAlert(const QString& message);
    quint64 errorAlert(const AppError& error);
    bool dismissAlert(quint64 id);
    // Removes alerts older than timeoutMs; returns how many were removed.
    int expireAlerts(const QDateTime& now, int timeoutMs);

private:
    quint64 pushAlert(const QString& message, Alert::Style style);

    quint64 m_nextAlertId = 1;
};
