#include <QtTest/QtTest>
#include <QSemaphore>
#include <QSignalSpy>
#include <QThreadPool>
#include <atomic>
#include <memory>

#include "AppState.h"
#include "CommandDispatcher.h"
#include "IPlaylistService.h"
#include "library/PlaylistCommands.h"

using namespace PlaylistCommands;

// Scripted service. Tests set the canned results before submitting; workers
// only read them.
class FakePlaylistService : public IPlaylistService {
public:
    QString serviceName() const override { return QStringLiteral("fake"); }

    Result<QVector<Playlist>> getPlaylists() override
    {
        ++listCalls;
        return playlists;
    }

    Result<QVector<Track>> getPlaylistTracks(const QString& playlistId) override
    {
        ++detailCalls;
        if (gate && playlistId == gatedPlaylist)
            gate->acquire();
        return tracks.value(playlistId, QVector<Track>{});
    }

    Result<void> addTrackToPlaylist(const QString& playlistId, const QString& trackUri) override
    {
        ++addCalls;
        Q_UNUSED(playlistId);
        lastUri = trackUri;
        return addResult;
    }

    Result<void> removeTrackFromPlaylist(const QString& playlistId, const QString& trackUri) override
    {
        ++removeCalls;
        Q_UNUSED(playlistId);
        lastUri = trackUri;
        return removeResult;
    }

    Result<QVector<Playlist>> playlists = QVector<Playlist>{};
    QHash<QString, Result<QVector<Track>>> tracks;
    Result<void> addResult;
    Result<void> removeResult;

    QSemaphore* gate = nullptr;
    QString gatedPlaylist;

    std::atomic<int> listCalls{0};
    std::atomic<int> detailCalls{0};
    std::atomic<int> addCalls{0};
    std::atomic<int> removeCalls{0};
    QString lastUri;
};

static Playlist makePlaylist(const QString& id, int count)
{
    Playlist p;
    p.id = id;
    p.name = id.toUpper();
    p.trackCount = count;
    return p;
}

static Track makeTrack(const QString& id, const QString& title, int durationMs = 0)
{
    Track t;
    t.id = ItemId{id, ItemType::Track};
    t.title = title;
    t.duration = durationMs;
    return t;
}

static QStringList titles(const PlaylistTracks& pt)
{
    QStringList out;
    for (const Track& t : pt.tracks)
        out << t.title;
    return out;
}

static int countSubmitted(const QSignalSpy& spy, const QString& name)
{
    int n = 0;
    for (int i = 0; i < spy.count(); ++i) {
        if (spy.at(i).at(0).toString() == name)
            ++n;
    }
    return n;
}

class tst_PlaylistCommands : public QObject {
    Q_OBJECT

private:
    // Fresh dispatcher per test; a private pool so a gated handler can't
    // starve the others.
    struct Fixture {
        QThreadPool pool;
        AppState state;
        std::shared_ptr<FakePlaylistService> service = std::make_shared<FakePlaylistService>();
        CommandDispatcher dispatcher{&state};

        Fixture()
        {
            pool.setMaxThreadCount(4);
            dispatcher.setThreadPool(&pool);
            registerAll(dispatcher, service);
            service->playlists = QVector<Playlist>{makePlaylist("a", 3), makePlaylist("b", 5)};
        }

        void loadList()
        {
            dispatcher.submit(LOAD_LIST);
            QVERIFY(dispatcher.waitForIdle(5000));
        }

        int countOf(const QString& id) const
        {
            for (const Playlist& p : state.library.playlists.value()) {
                if (p.id == id)
                    return p.trackCount.value_or(-1);
            }
            return -1;
        }
    };

private slots:

    // ── trackUri ─────────────────────────────────────────────────
    void trackUri_forTrackAndEpisode()
    {
        QCOMPARE(trackUri(ItemId{"1", ItemType::Track}).value(), QStringLiteral("spotify:track:1"));
        QCOMPARE(trackUri(ItemId{"2", ItemType::Episode}).value(), QStringLiteral("spotify:episode:2"));
    }

    void trackUri_localFileIsValidationError()
    {
        Result<QString> uri = trackUri(ItemId{"file.mp3", ItemType::LocalFile});
        QVERIFY(uri.isErr());
        QCOMPARE(uri.error().kind, AppError::Kind::Validation);
        QCOMPARE(uri.error().message, QStringLiteral("Item doesn't have URI"));
    }

    // ── LoadList ─────────────────────────────────────────────────
    void loadList_success()
    {
        Fixture f;
        f.dispatcher.submit(LOAD_LIST);
        QVERIFY(f.state.library.playlists.isPending());

        QVERIFY(f.dispatcher.waitForIdle(5000));
        QVERIFY(f.state.library.playlists.isFulfilled());
        QCOMPARE(f.state.library.playlists.value().size(), 2);
        QVERIFY(f.state.alerts.isEmpty());
    }

    void loadList_failure_alertsAndKeepsKnown()
    {
        Fixture f;
        f.loadList();

        f.service->playlists = AppError::webApi("Service unavailable");
        f.dispatcher.submit(LOAD_LIST);
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QVERIFY(f.state.library.playlists.isRejected());
        QCOMPARE(f.state.library.knownPlaylists().size(), 2);
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].style, Alert::Style::Error);
        QCOMPARE(f.state.alerts[0].message, QStringLiteral("Service unavailable"));
    }

    // ── LoadDetail ───────────────────────────────────────────────
    void loadDetail_sortsByRequestConfig()
    {
        Fixture f;
        f.service->tracks.insert("a", QVector<Track>{makeTrack("1", "Zeta"),
                                                     makeTrack("2", "Alpha"),
                                                     makeTrack("3", "Mu")});
        f.state.config.sortCriteria = SortCriteria::Title;
        f.state.config.sortOrder = SortOrder::Ascending;

        const PlaylistLink link{"a", "A"};
        f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{link, f.state});
        QVERIFY(f.state.playlistDetail.tracks.isPending());
        QVERIFY(f.state.playlistDetail.tracks.pendingKey().link == link);

        QVERIFY(f.dispatcher.waitForIdle(5000));
        const auto& detail = f.state.playlistDetail.tracks;
        QVERIFY(detail.isFulfilled());
        QCOMPARE(titles(detail.value()), (QStringList{"Alpha", "Mu", "Zeta"}));
        QVERIFY(detail.value().link() == link);
        QCOMPARE(detail.resolvedKey().sortCriteria, SortCriteria::Title);
    }

    void loadDetail_ignoresLaterConfigChange()
    {
        Fixture f;
        f.service->tracks.insert("a", QVector<Track>{makeTrack("1", "x", 30),
                                                     makeTrack("2", "y", 10),
                                                     makeTrack("3", "z", 20)});
        f.state.config.sortCriteria = SortCriteria::Duration;
        f.state.config.sortOrder = SortOrder::Descending;

        f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{{"a", "A"}, f.state});
        f.state.config.sortCriteria = SortCriteria::Title;
        f.state.config.sortOrder = SortOrder::Ascending;

        QVERIFY(f.dispatcher.waitForIdle(5000));
        QCOMPARE(titles(f.state.playlistDetail.tracks.value()), (QStringList{"x", "z", "y"}));
    }

    void loadDetail_failure()
    {
        Fixture f;
        f.service->tracks.insert("a", AppError::webApi("Not found"));

        f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{{"a", "A"}, f.state});
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QVERIFY(f.state.playlistDetail.tracks.isRejected());
        QCOMPARE(f.state.playlistDetail.tracks.error().message, QStringLiteral("Not found"));
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].style, Alert::Style::Error);
    }

    void loadDetail_staleResultIsDropped()
    {
        Fixture f;
        QSemaphore gate;
        f.service->gate = &gate;
        f.service->gatedPlaylist = "a";
        f.service->tracks.insert("a", AppError::webApi("late failure"));
        f.service->tracks.insert("b", QVector<Track>{makeTrack("1", "B-side")});

        f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{{"a", "A"}, f.state});
        f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{{"b", "B"}, f.state});

        QTRY_VERIFY(f.state.playlistDetail.tracks.isResolved());
        QCOMPARE(f.state.playlistDetail.tracks.resolvedKey().link.id, QStringLiteral("b"));

        gate.release();
        QVERIFY(f.dispatcher.waitForIdle(5000));

        // The late "a" response neither replaced "b" nor raised an alert.
        QVERIFY(f.state.playlistDetail.tracks.isFulfilled());
        QCOMPARE(titles(f.state.playlistDetail.tracks.value()), QStringList{"B-side"});
        QVERIFY(f.state.alerts.isEmpty());
    }

    void loadDetail_samePlaylistLaterRequestWins()
    {
        Fixture f;
        QSemaphore gate;
        f.service->gate = &gate;
        f.service->gatedPlaylist = "a";
        f.service->tracks.insert("a", QVector<Track>{makeTrack("1", "x")});

        f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{{"a", "A"}, f.state});
        const quint64 second =
            f.dispatcher.submit(LOAD_DETAIL, PlaylistDetailRequest{{"a", "A"}, f.state});
        gate.release(2);
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QVERIFY(f.state.playlistDetail.tracks.isFulfilled());
        QCOMPARE(f.state.playlistDetail.tracks.resolvedKey().token, second);
    }

    // ── AddTrack ─────────────────────────────────────────────────
    void add_withoutUri_neverCallsService()
    {
        Fixture f;
        f.loadList();

        f.dispatcher.submit(ADD_TRACK, PlaylistAddTrack{{"a", "A"}, ItemId{"x.mp3", ItemType::LocalFile}});
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QCOMPARE(f.service->addCalls.load(), 0);
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].message, QStringLiteral("Item doesn't have URI"));
        // The reload puts the optimistic count back.
        QCOMPARE(f.countOf("a"), 3);
    }

    void add_success_incrementsOnlyTarget()
    {
        Fixture f;
        f.loadList();
        QSignalSpy submitted(&f.dispatcher, &CommandDispatcher::commandSubmitted);

        f.dispatcher.submit(ADD_TRACK, PlaylistAddTrack{{"a", "A"}, ItemId{"t1", ItemType::Track}});
        QCOMPARE(f.countOf("a"), 4);
        QCOMPARE(f.countOf("b"), 5);

        QVERIFY(f.dispatcher.waitForIdle(5000));
        QCOMPARE(f.service->addCalls.load(), 1);
        QCOMPARE(f.service->lastUri, QStringLiteral("spotify:track:t1"));
        QCOMPARE(f.countOf("a"), 4);
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].style, Alert::Style::Info);
        QCOMPARE(f.state.alerts[0].message, QStringLiteral("Added to playlist."));
        QCOMPARE(countSubmitted(submitted, LOAD_LIST.name), 0);
    }

    void add_failure_reloadsList()
    {
        Fixture f;
        f.loadList();
        f.service->addResult = AppError::webApi("Forbidden");
        QSignalSpy submitted(&f.dispatcher, &CommandDispatcher::commandSubmitted);

        f.dispatcher.submit(ADD_TRACK, PlaylistAddTrack{{"a", "A"}, ItemId{"t1", ItemType::Track}});
        QCOMPARE(f.countOf("a"), 4);
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QCOMPARE(countSubmitted(submitted, LOAD_LIST.name), 1);
        QCOMPARE(f.service->listCalls.load(), 2);
        QCOMPARE(f.countOf("a"), 3);
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].style, Alert::Style::Error);
        QCOMPARE(f.state.alerts[0].message, QStringLiteral("Forbidden"));
    }

    // ── RemoveTrack ──────────────────────────────────────────────
    void remove_success_reloadsDetailOnce()
    {
        Fixture f;
        f.loadList();
        f.service->tracks.insert("a", QVector<Track>{makeTrack("2", "Two")});
        QSignalSpy submitted(&f.dispatcher, &CommandDispatcher::commandSubmitted);

        f.dispatcher.submit(REMOVE_TRACK, PlaylistRemoveTrack{{"a", "A"}, ItemId{"1", ItemType::Track}});
        QCOMPARE(f.countOf("a"), 2);
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QCOMPARE(f.service->removeCalls.load(), 1);
        QCOMPARE(f.service->lastUri, QStringLiteral("spotify:track:1"));
        QCOMPARE(countSubmitted(submitted, LOAD_DETAIL.name), 1);
        QCOMPARE(countSubmitted(submitted, LOAD_LIST.name), 0);
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].message, QStringLiteral("Removed from playlist."));

        QVERIFY(f.state.playlistDetail.tracks.isFulfilled());
        QCOMPARE(f.state.playlistDetail.tracks.resolvedKey().link.id, QStringLiteral("a"));
        QCOMPARE(titles(f.state.playlistDetail.tracks.value()), QStringList{"Two"});
    }

    void remove_failure_stillReloadsDetail()
    {
        Fixture f;
        f.loadList();
        f.service->removeResult = AppError::webApi("Track not in playlist");
        QSignalSpy submitted(&f.dispatcher, &CommandDispatcher::commandSubmitted);

        f.dispatcher.submit(REMOVE_TRACK, PlaylistRemoveTrack{{"a", "A"}, ItemId{"1", ItemType::Track}});
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QCOMPARE(countSubmitted(submitted, LOAD_DETAIL.name), 1);
        QCOMPARE(countSubmitted(submitted, LOAD_LIST.name), 1);
        QCOMPARE(f.countOf("a"), 3);
        QCOMPARE(f.state.alerts.size(), 1);
        QCOMPARE(f.state.alerts[0].style, Alert::Style::Error);
    }

    void remove_withoutUri_neverCallsService()
    {
        Fixture f;
        f.loadList();

        f.dispatcher.submit(REMOVE_TRACK, PlaylistRemoveTrack{{"a", "A"}, ItemId{"", ItemType::Track}});
        QVERIFY(f.dispatcher.waitForIdle(5000));

        QCOMPARE(f.service->removeCalls.load(), 0);
        QCOMPARE(f.state.alerts[0].message, QStringLiteral("Item doesn't have URI"));
    }
};

QTEST_GUILESS_MAIN(tst_PlaylistCommands)
#include "tst_PlaylistCommands.moc"
