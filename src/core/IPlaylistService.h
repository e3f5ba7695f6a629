#pragma once

#include <QString>
#include <QVector>

#include "MusicData.h"
#include "Result.h"

// Remote playlist store the playlist commands talk to.
//
// Every method blocks until the service answers and is called from
// CommandDispatcher worker threads only, never from the owning thread.
// Implementations must therefore be safe for concurrent calls.
//
// Failures are reported as AppError values and passed to the user
// unchanged; implementations don't retry.
class IPlaylistService {
public:
    virtual ~IPlaylistService() = default;

    // ── Identity ─────────────────────────────────────────────────
    virtual QString serviceName() const = 0;

    // ── Browse ───────────────────────────────────────────────────
    virtual Result<QVector<Playlist>> getPlaylists() = 0;
    // Tracks in service order (ascending by date added).
    virtual Result<QVector<Track>> getPlaylistTracks(const QString& playlistId) = 0;

    // ── Edit ─────────────────────────────────────────────────────
    virtual Result<void> addTrackToPlaylist(const QString& playlistId,
                                            const QString& trackUri) = 0;
    virtual Result<void> removeTrackFromPlaylist(const QString& playlistId,
                                                 const QString& trackUri) = 0;
};
