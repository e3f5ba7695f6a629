#include "PlaylistCommands.h"
#include "../IPlaylistService.h"

#include <QDebug>

namespace PlaylistCommands {

Result<QString> trackUri(const ItemId& trackId)
{
    if (auto uri = trackId.toUri())
        return *uri;
    return AppError::validation(QStringLiteral("Item doesn't have URI"));
}

PlaylistDetailKey detailKey(const CommandContext& ctx, const PlaylistDetailRequest& request)
{
    PlaylistDetailKey key;
    key.link = request.link;
    key.sortCriteria = request.snapshot.config.sortCriteria;
    key.sortOrder = request.snapshot.config.sortOrder;
    key.token = ctx.token;
    return key;
}

// ═════════════════════════════════════════════════════════════════════
//  LoadList
// ═════════════════════════════════════════════════════════════════════

static void registerLoadList(CommandDispatcher& dispatcher,
                             std::shared_ptr<IPlaylistService> service)
{
    dispatcher.registerCommand(
        LOAD_LIST,
        [service](const NoPayload&) {
            return service->getPlaylists();
        },
        [](const CommandContext& ctx, AppState& state, const NoPayload&) {
            state.library.playlists.defer(ctx.token);
        },
        [](const CommandContext& ctx, AppState& state, const NoPayload&,
           Result<QVector<Playlist>> result) {
            const bool failed = result.isErr();
            const AppError error = failed ? result.error() : AppError{};
            if (!state.library.applyPlaylists(ctx.token, std::move(result))) {
                qDebug() << "[Playlist] Dropping stale playlist list #" << ctx.token;
                return;
            }
            if (failed) {
                qWarning() << "[Playlist] Loading playlists failed:" << error;
                state.errorAlert(error);
                return;
            }
            qDebug() << "[Playlist] Loaded" << state.library.knownPlaylists().size() << "playlists";
        });
}

// ═════════════════════════════════════════════════════════════════════
//  LoadDetail
// ═════════════════════════════════════════════════════════════════════

static void registerLoadDetail(CommandDispatcher& dispatcher,
                               std::shared_ptr<IPlaylistService> service)
{
    dispatcher.registerCommand(
        LOAD_DETAIL,
        [service](const PlaylistDetailRequest& req) -> Result<PlaylistSorter::Merged> {
            return PlaylistSorter::mergeFetchedTracks(
                service->getPlaylistTracks(req.link.id), req.snapshot.config);
        },
        [](const CommandContext& ctx, AppState& state, const PlaylistDetailRequest& req) {
            state.playlistDetail.tracks.defer(detailKey(ctx, req));
        },
        [](const CommandContext& ctx, AppState& state, const PlaylistDetailRequest& req,
           Result<PlaylistSorter::Merged> result) {
            Result<PlaylistTracks> tracks;
            if (result.isErr()) {
                tracks = result.error();
            } else if (result.value().error) {
                tracks = *result.value().error;
            } else {
                tracks = PlaylistTracks{req.link.id, req.link.name, result.value().tracks};
            }

            const bool failed = tracks.isErr();
            const AppError error = failed ? tracks.error() : AppError{};
            if (!state.playlistDetail.tracks.update(detailKey(ctx, req), std::move(tracks))) {
                qDebug() << "[Playlist] Dropping stale detail for" << req.link.id
                         << "#" << ctx.token;
                return;
            }
            if (failed) {
                qWarning() << "[Playlist] Loading" << req.link.id << "failed:" << error;
                state.errorAlert(error);
            }
        });
}

// ═════════════════════════════════════════════════════════════════════
//  AddTrack / RemoveTrack
// ═════════════════════════════════════════════════════════════════════

static void registerAddTrack(CommandDispatcher& dispatcher,
                             std::shared_ptr<IPlaylistService> service)
{
    dispatcher.registerCommand(
        ADD_TRACK,
        [service](const PlaylistAddTrack& d) -> Result<void> {
            Result<QString> uri = trackUri(d.trackId);
            if (uri.isErr())
                return uri.error();
            return service->addTrackToPlaylist(d.link.id, uri.value());
        },
        [](const CommandContext&, AppState& state, const PlaylistAddTrack& d) {
            state.library.incrementPlaylistTrackCount(d.link);
        },
        [](const CommandContext& ctx, AppState& state, const PlaylistAddTrack& d,
           Result<void> result) {
            if (result.isErr()) {
                qWarning() << "[Playlist] Add to" << d.link.id << "failed:" << result.error();
                state.errorAlert(result.error());
                // The optimistic +1 is now wrong; reload the list to correct it.
                ctx.dispatcher->submit(LOAD_LIST);
            } else {
                state.infoAlert(QStringLiteral("Added to playlist."));
            }
        });
}

static void registerRemoveTrack(CommandDispatcher& dispatcher,
                                std::shared_ptr<IPlaylistService> service)
{
    dispatcher.registerCommand(
        REMOVE_TRACK,
        [service](const PlaylistRemoveTrack& d) -> Result<void> {
            Result<QString> uri = trackUri(d.trackId);
            if (uri.isErr())
                return uri.error();
            return service->removeTrackFromPlaylist(d.link.id, uri.value());
        },
        [](const CommandContext&, AppState& state, const PlaylistRemoveTrack& d) {
            state.library.decrementPlaylistTrackCount(d.link);
        },
        [](const CommandContext& ctx, AppState& state, const PlaylistRemoveTrack& d,
           Result<void> result) {
            if (result.isErr()) {
                qWarning() << "[Playlist] Remove from" << d.link.id << "failed:" << result.error();
                state.errorAlert(result.error());
                ctx.dispatcher->submit(LOAD_LIST);
            } else {
                state.infoAlert(QStringLiteral("Removed from playlist."));
            }
            // Membership changed in a way a counter can't express, so always
            // reload the detail with the current state.
            ctx.dispatcher->submit(LOAD_DETAIL, PlaylistDetailRequest{d.link, state});
        });
}

void registerAll(CommandDispatcher& dispatcher, std::shared_ptr<IPlaylistService> service)
{
    registerLoadList(dispatcher, service);
    registerLoadDetail(dispatcher, service);
    registerAddTrack(dispatcher, service);
    registerRemoveTrack(dispatcher, service);
}

} // namespace PlaylistCommands
