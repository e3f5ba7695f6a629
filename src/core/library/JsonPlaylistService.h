#pragma once

#include <QByteArray>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QVector>
#include <optional>

#include "../IPlaylistService.h"

// IPlaylistService over a JSON catalogue held in memory.
//
// Catalogue layout:
//   { "playlists": [ <playlist>... ],
//     "tracks":    { "<playlistId>": [ <playlist item>... ] },
//     "catalog":   [ <track>... ] }
//
// "catalog" lists tracks that exist on the service but aren't necessarily in
// a playlist: anything addable by URI. Edits stay in memory.
//
// Safe to call from several worker threads at once. Latency and per-operation
// failures can be injected for offline runs and tests.
class JsonPlaylistService : public IPlaylistService {
public:
    enum class Operation { GetPlaylists, GetPlaylistTracks, AddTrack, RemoveTrack };

    JsonPlaylistService() = default;

    Result<void> loadFile(const QString& path);
    Result<void> loadJson(const QByteArray& json);
    QByteArray toJson() const;

    void setLatencyMs(int ms);
    void failOperation(Operation op, const QString& message);
    void clearFailures();
    int callCount(Operation op) const;

    static std::optional<Operation> operationFromString(const QString& name);

    // ── IPlaylistService ─────────────────────────────────────────────
    QString serviceName() const override { return QStringLiteral("JSON catalogue"); }
    Result<QVector<Playlist>> getPlaylists() override;
    Result<QVector<Track>> getPlaylistTracks(const QString& playlistId) override;
    Result<void> addTrackToPlaylist(const QString& playlistId, const QString& trackUri) override;
    Result<void> removeTrackFromPlaylist(const QString& playlistId, const QString& trackUri) override;

private:
    // Counts the call, sleeps the configured latency and returns the
    // injected failure for `op`, if any. Called without m_mutex held.
    std::optional<AppError> enter(Operation op);
    int indexOfPlaylist(const QString& id) const;
    std::optional<Track> findTrackByUri(const QString& uri) const;

    mutable QMutex m_mutex;
    QVector<Playlist> m_playlists;
    QHash<QString, QVector<Track>> m_tracks;   // playlist id → items in order
    QHash<QString, Track> m_catalog;           // uri → track
    QHash<int, QString> m_failures;            // Operation → message
    QHash<int, int> m_calls;                   // Operation → count
    int m_latencyMs = 0;
};
