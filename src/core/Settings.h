#pragma once

#include <QObject>
#include <QSettings>
#include <QString>
#include <optional>

// ── Sort preference ─────────────────────────────────────────────────
enum class SortCriteria { Title, Artist, Album, Duration, DateAdded };
enum class SortOrder { Ascending, Descending };

QString sortCriteriaToString(SortCriteria criteria);   // "title", "date-added", ...
std::optional<SortCriteria> sortCriteriaFromString(const QString& str);
QString sortOrderToString(SortOrder order);            // "asc" / "desc"
std::optional<SortOrder> sortOrderFromString(const QString& str);

// Snapshot of the user configuration this subsystem consumes. Copied into
// AppState; never written back from here.
struct Config {
    SortCriteria sortCriteria = SortCriteria::Title;
    SortOrder    sortOrder = SortOrder::Ascending;
    int          alertTimeoutMs = 5000;

    bool operator==(const Config& o) const
    {
        return sortCriteria == o.sortCriteria && sortOrder == o.sortOrder
            && alertTimeoutMs == o.alertTimeoutMs;
    }
    bool operator!=(const Config& o) const { return !(*this == o); }
};

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // Standalone store on an explicit INI file (tests, alternate profiles).
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    // ── Playlist ─────────────────────────────────────────────────────
    SortCriteria sortCriteria() const;
    void setSortCriteria(SortCriteria criteria);

    SortOrder sortOrder() const;
    void setSortOrder(SortOrder order);

    QString catalogPath() const;
    void setCatalogPath(const QString& path);

    int alertTimeoutMs() const;
    void setAlertTimeoutMs(int ms);

    Config config() const;

    void sync() { m_settings.sync(); }
    QString fileName() const { return m_settings.fileName(); }

    // ~/.local/share/Canticle/settings.ini (platform equivalent elsewhere)
    static QString settingsPath();

signals:
    void sortChanged();

private:
    QSettings m_settings;
};
