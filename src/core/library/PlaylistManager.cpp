#include "PlaylistManager.h"
#include "PlaylistCommands.h"
#include "../CommandDispatcher.h"
#include "../IPlaylistService.h"
#include "../Settings.h"

#include <QDateTime>
#include <QDebug>
#include <QTimer>

static constexpr int ALERT_SWEEP_INTERVAL_MS = 1000;

PlaylistManager::PlaylistManager(std::shared_ptr<IPlaylistService> service,
                                 const Config& config,
                                 QObject* parent)
    : QObject(parent)
    , m_dispatcher(new CommandDispatcher(&m_state, this))
    , m_alertTimer(new QTimer(this))
{
    m_state.config = config;

    qDebug() << "[PlaylistManager] Using" << (service ? service->serviceName() : QStringLiteral("no service"));
    PlaylistCommands::registerAll(*m_dispatcher, std::move(service));

    m_alertTimer->setInterval(ALERT_SWEEP_INTERVAL_MS);
    connect(m_alertTimer, &QTimer::timeout, this, [this]() {
        expireAlerts();
    });
    connect(m_dispatcher, &CommandDispatcher::stateChanged,
            this, &PlaylistManager::onDispatcherStateChanged);
}

PlaylistManager::~PlaylistManager() = default;

// ── Commands ────────────────────────────────────────────────────────
quint64 PlaylistManager::loadPlaylists()
{
    return m_dispatcher->submit(PlaylistCommands::LOAD_LIST);
}

quint64 PlaylistManager::openPlaylist(const PlaylistLink& link)
{
    return m_dispatcher->submit(PlaylistCommands::LOAD_DETAIL,
                                PlaylistDetailRequest{link, m_state});
}

quint64 PlaylistManager::addTrack(const PlaylistLink& link, const ItemId& trackId)
{
    return m_dispatcher->submit(PlaylistCommands::ADD_TRACK,
                                PlaylistAddTrack{link, trackId});
}

quint64 PlaylistManager::removeTrack(const PlaylistLink& link, const ItemId& trackId)
{
    return m_dispatcher->submit(PlaylistCommands::REMOVE_TRACK,
                                PlaylistRemoveTrack{link, trackId});
}

std::optional<PlaylistLink> PlaylistManager::currentPlaylist() const
{
    const auto& tracks = m_state.playlistDetail.tracks;
    if (tracks.isPending())
        return tracks.pendingKey().link;
    if (tracks.isResolved())
        return tracks.resolvedKey().link;
    return std::nullopt;
}

// ── Configuration ───────────────────────────────────────────────────
void PlaylistManager::setConfig(const Config& config)
{
    if (config == m_state.config)
        return;

    const bool resort = config.sortCriteria != m_state.config.sortCriteria
                     || config.sortOrder != m_state.config.sortOrder;
    m_state.config = config;
    emit stateChanged();

    if (resort) {
        if (auto link = currentPlaylist()) {
            qDebug() << "[PlaylistManager] Sort changed to"
                     << sortCriteriaToString(config.sortCriteria)
                     << sortOrderToString(config.sortOrder) << "— reloading" << link->id;
            openPlaylist(*link);
        }
    }
}

void PlaylistManager::followSettings(Settings* settings)
{
    setConfig(settings->config());
    connect(settings, &Settings::sortChanged, this, [this, settings]() {
        setConfig(settings->config());
    });
}

// ── Alerts ──────────────────────────────────────────────────────────
bool PlaylistManager::dismissAlert(quint64 id)
{
    if (!m_state.dismissAlert(id))
        return false;
    onDispatcherStateChanged();
    return true;
}

int PlaylistManager::expireAlerts()
{
    const int removed = m_state.expireAlerts(QDateTime::currentDateTimeUtc(),
                                             m_state.config.alertTimeoutMs);
    if (removed > 0)
        onDispatcherStateChanged();
    else if (m_state.alerts.isEmpty())
        m_alertTimer->stop();
    return removed;
}

void PlaylistManager::onDispatcherStateChanged()
{
    if (m_state.alerts.isEmpty())
        m_alertTimer->stop();
    else if (!m_alertTimer->isActive())
        m_alertTimer->start();
    emit stateChanged();
}
