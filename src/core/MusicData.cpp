#include "MusicData.h"

static const QString URI_SCHEME = QStringLiteral("spotify");
static const QString OPEN_URL = QStringLiteral("https://open.spotify.com");

// ═════════════════════════════════════════════════════════════════════
//  ItemId
// ═════════════════════════════════════════════════════════════════════

std::optional<QString> ItemId::toUri() const
{
    if (id.isEmpty())
        return std::nullopt;

    switch (type) {
    case ItemType::Track:
        return QStringLiteral("%1:track:%2").arg(URI_SCHEME, id);
    case ItemType::Episode:
        return QStringLiteral("%1:episode:%2").arg(URI_SCHEME, id);
    case ItemType::LocalFile:
    case ItemType::Unknown:
        break;
    }
    return std::nullopt;
}

ItemId ItemId::fromUri(const QString& uri)
{
    const QStringList parts = uri.split(QLatin1Char(':'));
    if (parts.size() != 3 || parts[0] != URI_SCHEME || parts[2].isEmpty())
        return ItemId{};

    if (parts[1] == QLatin1String("track"))
        return ItemId{parts[2], ItemType::Track};
    if (parts[1] == QLatin1String("episode"))
        return ItemId{parts[2], ItemType::Episode};
    return ItemId{parts[2], ItemType::Unknown};
}

// ═════════════════════════════════════════════════════════════════════
//  Playlist
// ═════════════════════════════════════════════════════════════════════

QString Playlist::url() const
{
    return QStringLiteral("%1/playlist/%2").arg(OPEN_URL, id);
}

std::optional<Image> Playlist::image(int width, int height) const
{
    if (images.isEmpty())
        return std::nullopt;

    const Image* best = nullptr;
    const Image* largest = &images.first();
    for (const Image& img : images) {
        if (img.width * img.height > largest->width * largest->height)
            largest = &img;
        if (img.width >= width && img.height >= height) {
            if (!best || img.width * img.height < best->width * best->height)
                best = &img;
        }
    }
    return best ? *best : *largest;
}

// ═════════════════════════════════════════════════════════════════════
//  Utility Functions
// ═════════════════════════════════════════════════════════════════════

QString formatDuration(int seconds)
{
    int m = seconds / 60;
    int s = seconds % 60;
    return QString("%1:%2").arg(m).arg(s, 2, 10, QChar('0'));
}

QString itemTypeName(ItemType type)
{
    switch (type) {
    case ItemType::Track:     return QStringLiteral("track");
    case ItemType::Episode:   return QStringLiteral("episode");
    case ItemType::LocalFile: return QStringLiteral("local");
    case ItemType::Unknown:   break;
    }
    return QStringLiteral("unknown");
}
