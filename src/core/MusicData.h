#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QDateTime>
#include <optional>

// ── Item identity ───────────────────────────────────────────────────
enum class ItemType {
    Track,
    Episode,
    LocalFile,
    Unknown
};

struct ItemId {
    QString  id;
    ItemType type = ItemType::Unknown;

    // Addressable URI ("spotify:track:<id>"); nullopt for local files,
    // unknown item types and empty ids.
    std::optional<QString> toUri() const;

    static ItemId fromUri(const QString& uri);

    bool operator==(const ItemId& o) const { return id == o.id && type == o.type; }
    bool operator!=(const ItemId& o) const { return !(*this == o); }
};

// ── Data Structs ────────────────────────────────────────────────────
struct Image {
    QString url;
    int     width = 0;    // 0 when the service doesn't report dimensions
    int     height = 0;
};

struct Track {
    ItemId      id;
    QString     title;
    QStringList artists;
    QString     album;
    int         duration = 0;   // milliseconds
    QDateTime   dateAdded;      // UTC, invalid if the service didn't say
    bool        isExplicit = false;
    bool        isLocal = false;

    QString artistName() const { return artists.isEmpty() ? QString() : artists.first(); }
    QString albumName() const { return album; }
};

struct PlaylistLink {
    QString id;
    QString name;

    bool operator==(const PlaylistLink& o) const { return id == o.id && name == o.name; }
    bool operator!=(const PlaylistLink& o) const { return !(*this == o); }
};

struct Playlist {
    QString            id;
    QString            name;
    QString            description;
    QVector<Image>     images;
    std::optional<int> trackCount;   // unknown until the service reports it
    QString            ownerId;
    QString            ownerName;
    bool               collaborative = false;

    PlaylistLink link() const { return {id, name}; }
    QString url() const;

    // Smallest image covering width x height, else the largest available.
    std::optional<Image> image(int width, int height) const;
};

struct PlaylistTracks {
    QString        id;
    QString        name;
    QVector<Track> tracks;

    PlaylistLink link() const { return {id, name}; }
};

// ── Utility Functions ───────────────────────────────────────────────
QString formatDuration(int seconds);
QString itemTypeName(ItemType type);

#endif // MUSICDATA_H
