#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QVector>

#include "../MusicData.h"
#include "../Result.h"

// Web API object shapes ⇄ model values.
//
//   playlist      { id, name, description, collaborative,
//                   images[{url, width, height}], owner{id, display_name},
//                   tracks{total} }
//   playlist item { added_at, is_local, track{...} }
//   track         { id, type, uri, name, duration_ms, explicit,
//                   artists[{id, name}], album{id, name} }
namespace PlaylistJson {

Result<Playlist> playlistFromJson(const QJsonObject& obj);
Result<QVector<Playlist>> playlistsFromJson(const QJsonArray& array);

Result<Track> trackFromJson(const QJsonObject& obj);
// A playlist item whose track is null (removed from the service) yields a
// default Track with an empty id; playlistItemsFromJson() skips those.
Result<Track> playlistItemFromJson(const QJsonObject& obj);
Result<QVector<Track>> playlistItemsFromJson(const QJsonArray& array);

QJsonObject playlistToJson(const Playlist& playlist);
QJsonObject trackToJson(const Track& track);
QJsonObject playlistItemToJson(const Track& track);

} // namespace PlaylistJson
