#include "JsonPlaylistService.h"
#include "PlaylistJson.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QThread>
#include <algorithm>

// ═════════════════════════════════════════════════════════════════════
//  Loading
// ═════════════════════════════════════════════════════════════════════

Result<void> JsonPlaylistService::loadFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[JsonPlaylistService] Failed to open catalogue:" << path;
        return AppError::io(QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }
    return loadJson(file.readAll());
}

Result<void> JsonPlaylistService::loadJson(const QByteArray& json)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseErr);
    if (parseErr.error != QJsonParseError::NoError)
        return AppError::parse(parseErr.errorString());
    if (!doc.isObject())
        return AppError::parse(QStringLiteral("Catalogue root is not an object"));

    const QJsonObject root = doc.object();

    Result<QVector<Playlist>> playlists =
        PlaylistJson::playlistsFromJson(root.value(QStringLiteral("playlists")).toArray());
    if (playlists.isErr())
        return playlists.error();

    QHash<QString, QVector<Track>> tracks;
    QHash<QString, Track> catalog;

    const QJsonObject trackMap = root.value(QStringLiteral("tracks")).toObject();
    for (auto it = trackMap.constBegin(); it != trackMap.constEnd(); ++it) {
        Result<QVector<Track>> items = PlaylistJson::playlistItemsFromJson(it.value().toArray());
        if (items.isErr())
            return AppError::parse(QStringLiteral("Playlist %1: %2").arg(it.key(), items.error().message));
        for (const Track& t : items.value()) {
            if (auto uri = t.id.toUri())
                catalog.insert(*uri, t);
        }
        tracks.insert(it.key(), items.takeValue());
    }

    for (const QJsonValue& v : root.value(QStringLiteral("catalog")).toArray()) {
        Result<Track> t = PlaylistJson::trackFromJson(v.toObject());
        if (t.isErr())
            return t.error();
        if (auto uri = t.value().id.toUri())
            catalog.insert(*uri, t.value());
    }

    // Playlists without a reported total take it from their items.
    QVector<Playlist> loaded = playlists.takeValue();
    for (Playlist& p : loaded) {
        if (!p.trackCount && tracks.contains(p.id))
            p.trackCount = tracks.value(p.id).size();
    }

    QMutexLocker lock(&m_mutex);
    m_playlists = loaded;
    m_tracks = tracks;
    m_catalog = catalog;
    qDebug() << "[JsonPlaylistService] Loaded" << m_playlists.size() << "playlists,"
             << m_catalog.size() << "addressable tracks";
    return Result<void>::ok();
}

QByteArray JsonPlaylistService::toJson() const
{
    QMutexLocker lock(&m_mutex);

    QJsonArray playlists;
    for (const Playlist& p : m_playlists)
        playlists.append(PlaylistJson::playlistToJson(p));

    QJsonObject tracks;
    for (auto it = m_tracks.constBegin(); it != m_tracks.constEnd(); ++it) {
        QJsonArray items;
        for (const Track& t : it.value())
            items.append(PlaylistJson::playlistItemToJson(t));
        tracks.insert(it.key(), items);
    }

    QJsonArray catalog;
    for (const Track& t : m_catalog)
        catalog.append(PlaylistJson::trackToJson(t));

    return QJsonDocument(QJsonObject{
        {QStringLiteral("playlists"), playlists},
        {QStringLiteral("tracks"), tracks},
        {QStringLiteral("catalog"), catalog},
    }).toJson(QJsonDocument::Indented);
}

// ═════════════════════════════════════════════════════════════════════
//  Fault injection
// ═════════════════════════════════════════════════════════════════════

void JsonPlaylistService::setLatencyMs(int ms)
{
    QMutexLocker lock(&m_mutex);
    m_latencyMs = qMax(ms, 0);
}

void JsonPlaylistService::failOperation(Operation op, const QString& message)
{
    QMutexLocker lock(&m_mutex);
    m_failures.insert(static_cast<int>(op), message);
}

void JsonPlaylistService::clearFailures()
{
    QMutexLocker lock(&m_mutex);
    m_failures.clear();
}

int JsonPlaylistService::callCount(Operation op) const
{
    QMutexLocker lock(&m_mutex);
    return m_calls.value(static_cast<int>(op));
}

std::optional<JsonPlaylistService::Operation>
JsonPlaylistService::operationFromString(const QString& name)
{
    const QString s = name.trimmed().toLower();
    if (s == QLatin1String("list"))   return Operation::GetPlaylists;
    if (s == QLatin1String("detail")) return Operation::GetPlaylistTracks;
    if (s == QLatin1String("add"))    return Operation::AddTrack;
    if (s == QLatin1String("remove")) return Operation::RemoveTrack;
    return std::nullopt;
}

std::optional<AppError> JsonPlaylistService::enter(Operation op)
{
    int latency = 0;
    std::optional<AppError> failure;
    {
        QMutexLocker lock(&m_mutex);
        m_calls[static_cast<int>(op)]++;
        latency = m_latencyMs;
        auto it = m_failures.constFind(static_cast<int>(op));
        if (it != m_failures.constEnd())
            failure = AppError::webApi(it.value());
    }
    if (latency > 0)
        QThread::msleep(static_cast<unsigned long>(latency));
    return failure;
}

// ═════════════════════════════════════════════════════════════════════
//  IPlaylistService
// ═════════════════════════════════════════════════════════════════════

Result<QVector<Playlist>> JsonPlaylistService::getPlaylists()
{
    if (auto failure = enter(Operation::GetPlaylists))
        return *failure;

    QMutexLocker lock(&m_mutex);
    return m_playlists;
}

Result<QVector<Track>> JsonPlaylistService::getPlaylistTracks(const QString& playlistId)
{
    if (auto failure = enter(Operation::GetPlaylistTracks))
        return *failure;

    QMutexLocker lock(&m_mutex);
    if (indexOfPlaylist(playlistId) < 0)
        return AppError::webApi(QStringLiteral("Playlist not found: %1").arg(playlistId));
    return m_tracks.value(playlistId);
}

Result<void> JsonPlaylistService::addTrackToPlaylist(const QString& playlistId,
                                                     const QString& trackUri)
{
    if (auto failure = enter(Operation::AddTrack))
        return *failure;

    QMutexLocker lock(&m_mutex);
    const int idx = indexOfPlaylist(playlistId);
    if (idx < 0)
        return AppError::webApi(QStringLiteral("Playlist not found: %1").arg(playlistId));

    std::optional<Track> track = findTrackByUri(trackUri);
    if (!track)
        return AppError::webApi(QStringLiteral("Unknown track: %1").arg(trackUri));

    track->dateAdded = QDateTime::currentDateTimeUtc();
    track->isLocal = false;
    m_tracks[playlistId].append(*track);

    Playlist& p = m_playlists[idx];
    p.trackCount = p.trackCount.value_or(0) + 1;

    qDebug() << "[JsonPlaylistService] Added" << trackUri << "to" << playlistId;
    return Result<void>::ok();
}

Result<void> JsonPlaylistService::removeTrackFromPlaylist(const QString& playlistId,
                                                          const QString& trackUri)
{
    if (auto failure = enter(Operation::RemoveTrack))
        return *failure;

    QMutexLocker lock(&m_mutex);
    const int idx = indexOfPlaylist(playlistId);
    if (idx < 0)
        return AppError::webApi(QStringLiteral("Playlist not found: %1").arg(playlistId));

    // Every occurrence goes, as with the Web API.
    QVector<Track>& items = m_tracks[playlistId];
    const int before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const Track& t) { return t.id.toUri() == trackUri; }),
                items.end());
    const int removed = before - items.size();
    if (removed == 0)
        return AppError::webApi(QStringLiteral("Track not in playlist: %1").arg(trackUri));

    Playlist& p = m_playlists[idx];
    p.trackCount = qMax(0, p.trackCount.value_or(before) - removed);

    qDebug() << "[JsonPlaylistService] Removed" << removed << "x" << trackUri
             << "from" << playlistId;
    return Result<void>::ok();
}

// ── Lookup (m_mutex held) ───────────────────────────────────────────
int JsonPlaylistService::indexOfPlaylist(const QString& id) const
{
    for (int i = 0; i < m_playlists.size(); ++i) {
        if (m_playlists[i].id == id)
            return i;
    }
    return -1;
}

std::optional<Track> JsonPlaylistService::findTrackByUri(const QString& uri) const
{
    auto it = m_catalog.constFind(uri);
    if (it != m_catalog.constEnd())
        return it.value();
    return std::nullopt;
}
