#pragma once

#include <QString>
#include <QVector>
#include <memory>

#include "../AppState.h"
#include "../CommandDispatcher.h"
#include "../MusicData.h"
#include "PlaylistSorter.h"

class IPlaylistService;

// ── Payloads ────────────────────────────────────────────────────────
// LoadDetail carries a snapshot of the state at request time; the sort
// preference is read from it, not from the live state.
struct PlaylistDetailRequest {
    PlaylistLink link;
    AppState     snapshot;
};

struct PlaylistAddTrack {
    PlaylistLink link;
    ItemId       trackId;
};

struct PlaylistRemoveTrack {
    PlaylistLink link;
    ItemId       trackId;
};

// ── Commands ────────────────────────────────────────────────────────
namespace PlaylistCommands {

inline const Command<NoPayload, QVector<Playlist>> LOAD_LIST{
    QStringLiteral("app.playlist.load-list")};
inline const Command<PlaylistDetailRequest, PlaylistSorter::Merged> LOAD_DETAIL{
    QStringLiteral("app.playlist.load-detail")};
inline const Command<PlaylistAddTrack, void> ADD_TRACK{
    QStringLiteral("app.playlist.add-track")};
inline const Command<PlaylistRemoveTrack, void> REMOVE_TRACK{
    QStringLiteral("app.playlist.remove-track")};

// URI the service understands for a track, or a validation error when the
// item has none (local files, unknown item types).
Result<QString> trackUri(const ItemId& trackId);

PlaylistDetailKey detailKey(const CommandContext& ctx, const PlaylistDetailRequest& request);

// Binds the four playlist commands to `service`. The handlers keep the
// service alive until their last in-flight call returns.
void registerAll(CommandDispatcher& dispatcher, std::shared_ptr<IPlaylistService> service);

} // namespace PlaylistCommands
