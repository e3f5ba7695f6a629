#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QTextStream>
#include <memory>

#include "core/AppState.h"
#include "core/CommandDispatcher.h"
#include "core/MusicData.h"
#include "core/Settings.h"
#include "core/library/JsonPlaylistService.h"
#include "core/library/PlaylistManager.h"

static QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

static QTextStream& err()
{
    static QTextStream s(stderr);
    return s;
}

// Accepts a bare track id or a full URI.
static ItemId parseTrackArg(const QString& arg)
{
    if (arg.contains(QLatin1Char(':')))
        return ItemId::fromUri(arg);
    return ItemId{arg, ItemType::Track};
}

// ── Printing ────────────────────────────────────────────────────────
static void printPlaylists(const Library& library)
{
    const auto& promise = library.playlists;
    if (promise.isPending()) {
        out() << "Playlists: loading…\n";
        return;
    }
    if (promise.isRejected()) {
        out() << "Playlists: error — " << promise.error().message << "\n";
        return;
    }
    if (!promise.isFulfilled())
        return;

    out() << "Playlists (" << promise.value().size() << "):\n";
    for (const Playlist& p : promise.value()) {
        out() << "  " << p.id << "  " << p.name;
        if (p.trackCount)
            out() << "  (" << *p.trackCount << " tracks)";
        out() << "\n";
    }
}

static void printDetail(const PlaylistDetail& detail)
{
    const auto& promise = detail.tracks;
    if (promise.isEmpty())
        return;
    if (promise.isPending()) {
        out() << "\n" << promise.pendingKey().link.name << ": loading…\n";
        return;
    }

    const PlaylistDetailKey& key = promise.resolvedKey();
    out() << "\n" << key.link.name << " [" << sortCriteriaToString(key.sortCriteria)
          << " " << sortOrderToString(key.sortOrder) << "]";
    if (promise.isRejected()) {
        out() << ": error — " << promise.error().message << "\n";
        return;
    }
    out() << ":\n";

    int n = 1;
    for (const Track& t : promise.value().tracks) {
        out() << QStringLiteral("  %1. ").arg(n++, 2) << t.title;
        if (!t.artists.isEmpty())
            out() << " — " << t.artists.join(QStringLiteral(", "));
        if (!t.album.isEmpty())
            out() << " · " << t.album;
        out() << "  " << formatDuration(t.duration / 1000);
        if (t.dateAdded.isValid())
            out() << "  " << t.dateAdded.toString(QStringLiteral("yyyy-MM-dd"));
        out() << "\n";
    }
}

static int printAlerts(const AppState& state)
{
    int errors = 0;
    if (!state.alerts.isEmpty())
        out() << "\n";
    for (const Alert& a : state.alerts) {
        const bool isError = a.style == Alert::Style::Error;
        errors += isError ? 1 : 0;
        out() << (isError ? "[error] " : "[info] ") << a.message << "\n";
    }
    return errors;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("canticle"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Loads playlists from a JSON catalogue through the async command pipeline."));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption catalogOpt(QStringLiteral("catalog"),
        QStringLiteral("Catalogue JSON file (default: playlist/catalogPath setting)."),
        QStringLiteral("file"));
    QCommandLineOption sortOpt(QStringLiteral("sort"),
        QStringLiteral("title, artist, album, duration or date-added."), QStringLiteral("criteria"));
    QCommandLineOption orderOpt(QStringLiteral("order"),
        QStringLiteral("asc or desc."), QStringLiteral("order"));
    QCommandLineOption playlistOpt(QStringLiteral("playlist"),
        QStringLiteral("Playlist id to open."), QStringLiteral("id"));
    QCommandLineOption addOpt(QStringLiteral("add"),
        QStringLiteral("Track id or URI to add to --playlist."), QStringLiteral("track"));
    QCommandLineOption removeOpt(QStringLiteral("remove"),
        QStringLiteral("Track id or URI to remove from --playlist."), QStringLiteral("track"));
    QCommandLineOption latencyOpt(QStringLiteral("latency"),
        QStringLiteral("Simulated service latency."), QStringLiteral("ms"), QStringLiteral("0"));
    QCommandLineOption failOpt(QStringLiteral("fail"),
        QStringLiteral("Make an operation fail: list, detail, add or remove."),
        QStringLiteral("operation"));
    parser.addOptions({catalogOpt, sortOpt, orderOpt, playlistOpt, addOpt, removeOpt,
                       latencyOpt, failOpt});
    parser.process(app);

    Settings* settings = Settings::instance();

    // ── Catalogue ────────────────────────────────────────────────────
    const QString catalogPath = parser.isSet(catalogOpt) ? parser.value(catalogOpt)
                                                         : settings->catalogPath();
    if (catalogPath.isEmpty()) {
        err() << "No catalogue given (--catalog or playlist/catalogPath in "
              << settings->fileName() << ")\n";
        return 1;
    }

    auto service = std::make_shared<JsonPlaylistService>();
    Result<void> loaded = service->loadFile(catalogPath);
    if (loaded.isErr()) {
        err() << loaded.error().message << "\n";
        return 1;
    }

    bool latencyOk = false;
    const int latency = parser.value(latencyOpt).toInt(&latencyOk);
    if (!latencyOk || latency < 0) {
        err() << "Invalid --latency: " << parser.value(latencyOpt) << "\n";
        return 1;
    }
    service->setLatencyMs(latency);

    for (const QString& name : parser.values(failOpt)) {
        auto op = JsonPlaylistService::operationFromString(name);
        if (!op) {
            err() << "Invalid --fail: " << name << "\n";
            return 1;
        }
        service->failOperation(*op, QStringLiteral("Simulated %1 failure").arg(name));
    }

    // ── Sort preference ──────────────────────────────────────────────
    Config config = settings->config();
    if (parser.isSet(sortOpt)) {
        auto criteria = sortCriteriaFromString(parser.value(sortOpt));
        if (!criteria) {
            err() << "Invalid --sort: " << parser.value(sortOpt) << "\n";
            return 1;
        }
        config.sortCriteria = *criteria;
    }
    if (parser.isSet(orderOpt)) {
        auto order = sortOrderFromString(parser.value(orderOpt));
        if (!order) {
            err() << "Invalid --order: " << parser.value(orderOpt) << "\n";
            return 1;
        }
        config.sortOrder = *order;
    }

    if ((parser.isSet(addOpt) || parser.isSet(removeOpt)) && !parser.isSet(playlistOpt)) {
        err() << "--add and --remove need --playlist\n";
        return 1;
    }

    // ── Run ──────────────────────────────────────────────────────────
    PlaylistManager manager(service, config);
    CommandDispatcher* dispatcher = manager.dispatcher();

    manager.loadPlaylists();
    dispatcher->waitForIdle();

    if (parser.isSet(playlistOpt)) {
        const QString id = parser.value(playlistOpt);
        auto known = manager.state().library.playlistById(id);
        const PlaylistLink link = known ? known->link() : PlaylistLink{id, id};

        if (parser.isSet(addOpt)) {
            manager.addTrack(link, parseTrackArg(parser.value(addOpt)));
            dispatcher->waitForIdle();
        }
        if (parser.isSet(removeOpt)) {
            // Removal reloads the detail on its own.
            manager.removeTrack(link, parseTrackArg(parser.value(removeOpt)));
        } else {
            manager.openPlaylist(link);
        }
        dispatcher->waitForIdle();
    }

    printPlaylists(manager.state().library);
    printDetail(manager.state().playlistDetail);
    const int errors = printAlerts(manager.state());
    out().flush();

    return errors > 0 ? 2 : 0;
}
