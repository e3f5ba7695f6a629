#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <optional>

#include "../AppState.h"
#include "../MusicData.h"

class CommandDispatcher;
class IPlaylistService;
class QTimer;
class Settings;

// Entry point for playlist views. Owns the application state and the
// dispatcher the playlist commands are registered on; every UI event becomes
// one command submission. Lives on, and must be used from, the owning thread.
class PlaylistManager : public QObject {
    Q_OBJECT

public:
    explicit PlaylistManager(std::shared_ptr<IPlaylistService> service,
                             const Config& config = Config(),
                             QObject* parent = nullptr);
    ~PlaylistManager() override;

    const AppState& state() const { return m_state; }
    CommandDispatcher* dispatcher() const { return m_dispatcher; }

    // ── Commands ─────────────────────────────────────────────────────
    // Each returns the submission token (0 if rejected).
    quint64 loadPlaylists();
    quint64 openPlaylist(const PlaylistLink& link);
    quint64 addTrack(const PlaylistLink& link, const ItemId& trackId);
    quint64 removeTrack(const PlaylistLink& link, const ItemId& trackId);

    // Playlist the detail view currently shows or is loading.
    std::optional<PlaylistLink> currentPlaylist() const;

    // ── Configuration ────────────────────────────────────────────────
    // A new sort re-opens the current playlist; requests already in flight
    // keep the sort they were made with.
    void setConfig(const Config& config);
    void followSettings(Settings* settings);

    // ── Alerts ───────────────────────────────────────────────────────
    bool dismissAlert(quint64 id);
    int expireAlerts();

signals:
    void stateChanged();

private:
    void onDispatcherStateChanged();

    AppState m_state;
    CommandDispatcher* m_dispatcher = nullptr;
    QTimer* m_alertTimer = nullptr;
};
