#include "PlaylistJson.h"

#include <QDebug>

namespace PlaylistJson {

// ── Helpers ─────────────────────────────────────────────────────────
static QString str(const QJsonObject& obj, const char* key)
{
    return obj.value(QLatin1String(key)).toString();
}

static ItemType itemTypeFromString(const QString& type)
{
    if (type.isEmpty() || type == QLatin1String("track"))
        return ItemType::Track;
    if (type == QLatin1String("episode"))
        return ItemType::Episode;
    return ItemType::Unknown;
}

// ═════════════════════════════════════════════════════════════════════
//  Playlists
// ═════════════════════════════════════════════════════════════════════

Result<Playlist> playlistFromJson(const QJsonObject& obj)
{
    Playlist p;
    p.id = str(obj, "id");
    if (p.id.isEmpty())
        return AppError::parse(QStringLiteral("Playlist object without id"));

    p.name          = str(obj, "name");
    p.description   = str(obj, "description");
    p.collaborative = obj.value(QStringLiteral("collaborative")).toBool();

    const QJsonObject owner = obj.value(QStringLiteral("owner")).toObject();
    p.ownerId   = str(owner, "id");
    p.ownerName = str(owner, "display_name");

    for (const QJsonValue& v : obj.value(QStringLiteral("images")).toArray()) {
        const QJsonObject img = v.toObject();
        Image image;
        image.url    = str(img, "url");
        image.width  = img.value(QStringLiteral("width")).toInt();
        image.height = img.value(QStringLiteral("height")).toInt();
        if (!image.url.isEmpty())
            p.images.append(image);
    }

    const QJsonValue total = obj.value(QStringLiteral("tracks")).toObject()
                                .value(QStringLiteral("total"));
    if (total.isDouble())
        p.trackCount = total.toInt();

    return p;
}

Result<QVector<Playlist>> playlistsFromJson(const QJsonArray& array)
{
    QVector<Playlist> playlists;
    playlists.reserve(array.size());
    for (const QJsonValue& v : array) {
        if (!v.isObject())
            return AppError::parse(QStringLiteral("Playlist entry is not an object"));
        Result<Playlist> p = playlistFromJson(v.toObject());
        if (p.isErr())
            return p.error();
        playlists.append(p.takeValue());
    }
    return playlists;
}

QJsonObject playlistToJson(const Playlist& playlist)
{
    QJsonArray images;
    for (const Image& img : playlist.images) {
        images.append(QJsonObject{
            {QStringLiteral("url"), img.url},
            {QStringLiteral("width"), img.width},
            {QStringLiteral("height"), img.height},
        });
    }

    QJsonObject tracks;
    if (playlist.trackCount)
        tracks.insert(QStringLiteral("total"), *playlist.trackCount);

    return QJsonObject{
        {QStringLiteral("id"), playlist.id},
        {QStringLiteral("name"), playlist.name},
        {QStringLiteral("description"), playlist.description},
        {QStringLiteral("collaborative"), playlist.collaborative},
        {QStringLiteral("images"), images},
        {QStringLiteral("owner"), QJsonObject{
            {QStringLiteral("id"), playlist.ownerId},
            {QStringLiteral("display_name"), playlist.ownerName},
        }},
        {QStringLiteral("tracks"), tracks},
    };
}

// ═════════════════════════════════════════════════════════════════════
//  Tracks
// ═════════════════════════════════════════════════════════════════════

Result<Track> trackFromJson(const QJsonObject& obj)
{
    Track t;
    t.id.id   = str(obj, "id");
    t.id.type = itemTypeFromString(str(obj, "type"));

    // Some payloads only carry the URI.
    if (t.id.id.isEmpty()) {
        const QString uri = str(obj, "uri");
        if (!uri.isEmpty())
            t.id = ItemId::fromUri(uri);
    }

    t.title      = str(obj, "name");
    t.duration   = obj.value(QStringLiteral("duration_ms")).toInt();
    t.isExplicit = obj.value(QStringLiteral("explicit")).toBool();
    t.album      = str(obj.value(QStringLiteral("album")).toObject(), "name");

    for (const QJsonValue& v : obj.value(QStringLiteral("artists")).toArray()) {
        const QString name = str(v.toObject(), "name");
        if (!name.isEmpty())
            t.artists.append(name);
    }

    if (t.id.id.isEmpty() && t.title.isEmpty())
        return AppError::parse(QStringLiteral("Track object without id or name"));
    return t;
}

Result<Track> playlistItemFromJson(const QJsonObject& obj)
{
    const QJsonValue trackValue = obj.value(QStringLiteral("track"));
    if (trackValue.isNull() || trackValue.isUndefined())
        return Track{};
    if (!trackValue.isObject())
        return AppError::parse(QStringLiteral("Playlist item track is not an object"));

    Result<Track> track = trackFromJson(trackValue.toObject());
    if (track.isErr())
        return track;

    Track t = track.takeValue();
    const QString addedAt = str(obj, "added_at");
    if (!addedAt.isEmpty()) {
        t.dateAdded = QDateTime::fromString(addedAt, Qt::ISODate);
        if (!t.dateAdded.isValid())
            return AppError::parse(QStringLiteral("Invalid added_at: %1").arg(addedAt));
        t.dateAdded = t.dateAdded.toUTC();
    }

    if (obj.value(QStringLiteral("is_local")).toBool()) {
        // Local files have no addressable identity on the service.
        t.isLocal = true;
        t.id.type = ItemType::LocalFile;
        if (t.id.id.isEmpty())
            t.id.id = str(trackValue.toObject(), "uri");
    }
    return t;
}

Result<QVector<Track>> playlistItemsFromJson(const QJsonArray& array)
{
    QVector<Track> tracks;
    tracks.reserve(array.size());
    int skipped = 0;
    for (const QJsonValue& v : array) {
        Result<Track> t = playlistItemFromJson(v.toObject());
        if (t.isErr())
            return t.error();
        if (t.value().id.id.isEmpty() && t.value().title.isEmpty()) {
            ++skipped;
            continue;
        }
        tracks.append(t.takeValue());
    }
    if (skipped > 0)
        qDebug() << "[PlaylistJson] Skipped" << skipped << "unavailable playlist item(s)";
    return tracks;
}

QJsonObject trackToJson(const Track& track)
{
    QJsonArray artists;
    for (const QString& name : track.artists)
        artists.append(QJsonObject{{QStringLiteral("name"), name}});

    QJsonObject obj{
        {QStringLiteral("id"), track.id.id},
        {QStringLiteral("type"), itemTypeName(track.id.type)},
        {QStringLiteral("name"), track.title},
        {QStringLiteral("duration_ms"), track.duration},
        {QStringLiteral("explicit"), track.isExplicit},
        {QStringLiteral("artists"), artists},
        {QStringLiteral("album"), QJsonObject{{QStringLiteral("name"), track.album}}},
    };
    if (auto uri = track.id.toUri())
        obj.insert(QStringLiteral("uri"), *uri);
    return obj;
}

QJsonObject playlistItemToJson(const Track& track)
{
    QJsonObject obj{
        {QStringLiteral("is_local"), track.isLocal},
        {QStringLiteral("track"), trackToJson(track)},
    };
    if (track.dateAdded.isValid())
        obj.insert(QStringLiteral("added_at"), track.dateAdded.toUTC().toString(Qt::ISODate));
    return obj;
}

} // namespace PlaylistJson
