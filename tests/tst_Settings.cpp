#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "Settings.h"

class tst_Settings : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString iniPath() const { return m_dir.filePath(QStringLiteral("settings.ini")); }

private slots:
    void init()
    {
        QFile::remove(iniPath());
    }

    // ── Defaults ─────────────────────────────────────────────────
    void defaults()
    {
        Settings s(iniPath());
        QCOMPARE(s.sortCriteria(), SortCriteria::Title);
        QCOMPARE(s.sortOrder(), SortOrder::Ascending);
        QCOMPARE(s.alertTimeoutMs(), 5000);
        QVERIFY(s.catalogPath().isEmpty());
        QVERIFY(s.config() == Config());
    }

    // ── Persistence ──────────────────────────────────────────────
    void sortPersistsAcrossInstances()
    {
        {
            Settings s(iniPath());
            s.setSortCriteria(SortCriteria::DateAdded);
            s.setSortOrder(SortOrder::Descending);
            s.setCatalogPath(QStringLiteral("/tmp/catalogue.json"));
            s.sync();
        }
        Settings s(iniPath());
        QCOMPARE(s.sortCriteria(), SortCriteria::DateAdded);
        QCOMPARE(s.sortOrder(), SortOrder::Descending);
        QCOMPARE(s.catalogPath(), QStringLiteral("/tmp/catalogue.json"));

        QSettings raw(iniPath(), QSettings::IniFormat);
        QCOMPARE(raw.value("playlist/sortCriteria").toString(), QStringLiteral("date-added"));
        QCOMPARE(raw.value("playlist/sortOrder").toString(), QStringLiteral("desc"));
    }

    void unknownStoredValues_fallBack()
    {
        {
            QSettings raw(iniPath(), QSettings::IniFormat);
            raw.setValue("playlist/sortCriteria", "popularity");
            raw.setValue("playlist/sortOrder", "sideways");
            raw.setValue("playlist/alertTimeoutMs", -3);
        }
        Settings s(iniPath());
        QCOMPARE(s.sortCriteria(), SortCriteria::Title);
        QCOMPARE(s.sortOrder(), SortOrder::Ascending);
        QCOMPARE(s.alertTimeoutMs(), 5000);
    }

    // ── Signals ──────────────────────────────────────────────────
    void sortChanged_onlyOnChange()
    {
        Settings s(iniPath());
        QSignalSpy spy(&s, &Settings::sortChanged);

        s.setSortCriteria(SortCriteria::Artist);
        QCOMPARE(spy.count(), 1);
        s.setSortCriteria(SortCriteria::Artist);
        QCOMPARE(spy.count(), 1);
        s.setSortOrder(SortOrder::Descending);
        QCOMPARE(spy.count(), 2);
        s.setCatalogPath(QStringLiteral("x"));
        QCOMPARE(spy.count(), 2);
    }

    // ── String conversion ────────────────────────────────────────
    void criteriaStrings()
    {
        for (auto c : {SortCriteria::Title, SortCriteria::Artist, SortCriteria::Album,
                       SortCriteria::Duration, SortCriteria::DateAdded}) {
            QCOMPARE(*sortCriteriaFromString(sortCriteriaToString(c)), c);
        }
        QCOMPARE(*sortCriteriaFromString(" Duration "), SortCriteria::Duration);
        QVERIFY(!sortCriteriaFromString("rating").has_value());
    }

    void orderStrings()
    {
        QCOMPARE(*sortOrderFromString("asc"), SortOrder::Ascending);
        QCOMPARE(*sortOrderFromString("DESC"), SortOrder::Descending);
        QCOMPARE(*sortOrderFromString("descending"), SortOrder::Descending);
        QVERIFY(!sortOrderFromString("up").has_value());
    }
};

QTEST_GUILESS_MAIN(tst_Settings)
#include "tst_Settings.moc"
