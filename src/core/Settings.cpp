#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

static const QString KEY_SORT_CRITERIA = QStringLiteral("playlist/sortCriteria");
static const QString KEY_SORT_ORDER    = QStringLiteral("playlist/sortOrder");
static const QString KEY_CATALOG_PATH  = QStringLiteral("playlist/catalogPath");
static const QString KEY_ALERT_TIMEOUT = QStringLiteral("playlist/alertTimeoutMs");

// ── String conversion ───────────────────────────────────────────────
QString sortCriteriaToString(SortCriteria criteria)
{
    switch (criteria) {
    case SortCriteria::Title:     return QStringLiteral("title");
    case SortCriteria::Artist:    return QStringLiteral("artist");
    case SortCriteria::Album:     return QStringLiteral("album");
    case SortCriteria::Duration:  return QStringLiteral("duration");
    case SortCriteria::DateAdded: return QStringLiteral("date-added");
    }
    return QStringLiteral("title");
}

std::optional<SortCriteria> sortCriteriaFromString(const QString& str)
{
    const QString s = str.trimmed().toLower();
    if (s == QLatin1String("title"))      return SortCriteria::Title;
    if (s == QLatin1String("artist"))     return SortCriteria::Artist;
    if (s == QLatin1String("album"))      return SortCriteria::Album;
    if (s == QLatin1String("duration"))   return SortCriteria::Duration;
    if (s == QLatin1String("date-added") || s == QLatin1String("dateadded"))
        return SortCriteria::DateAdded;
    return std::nullopt;
}

QString sortOrderToString(SortOrder order)
{
    return order == SortOrder::Descending ? QStringLiteral("desc") : QStringLiteral("asc");
}

std::optional<SortOrder> sortOrderFromString(const QString& str)
{
    const QString s = str.trimmed().toLower();
    if (s == QLatin1String("asc") || s == QLatin1String("ascending"))
        return SortOrder::Ascending;
    if (s == QLatin1String("desc") || s == QLatin1String("descending"))
        return SortOrder::Descending;
    return std::nullopt;
}

// ── Settings INI path ───────────────────────────────────────────────
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/Canticle"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s(settingsPath());
    return &s;
}

// ── Constructor ─────────────────────────────────────────────────────
Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Playlist ────────────────────────────────────────────────────────
SortCriteria Settings::sortCriteria() const
{
    const QString raw = m_settings.value(KEY_SORT_CRITERIA, QStringLiteral("title")).toString();
    auto parsed = sortCriteriaFromString(raw);
    if (!parsed) {
        qWarning() << "[Settings] Unknown sort criteria" << raw << "— using title";
        return SortCriteria::Title;
    }
    return *parsed;
}

void Settings::setSortCriteria(SortCriteria criteria)
{
    if (criteria == sortCriteria() && m_settings.contains(KEY_SORT_CRITERIA))
        return;
    m_settings.setValue(KEY_SORT_CRITERIA, sortCriteriaToString(criteria));
    emit sortChanged();
}

SortOrder Settings::sortOrder() const
{
    const QString raw = m_settings.value(KEY_SORT_ORDER, QStringLiteral("asc")).toString();
    auto parsed = sortOrderFromString(raw);
    if (!parsed) {
        qWarning() << "[Settings] Unknown sort order" << raw << "— using asc";
        return SortOrder::Ascending;
    }
    return *parsed;
}

void Settings::setSortOrder(SortOrder order)
{
    if (order == sortOrder() && m_settings.contains(KEY_SORT_ORDER))
        return;
    m_settings.setValue(KEY_SORT_ORDER, sortOrderToString(order));
    emit sortChanged();
}

QString Settings::catalogPath() const
{
    return m_settings.value(KEY_CATALOG_PATH).toString();
}

void Settings::setCatalogPath(const QString& path)
{
    m_settings.setValue(KEY_CATALOG_PATH, path);
}

int Settings::alertTimeoutMs() const
{
    int ms = m_settings.value(KEY_ALERT_TIMEOUT, 5000).toInt();
    return ms > 0 ? ms : 5000;
}

void Settings::setAlertTimeoutMs(int ms)
{
    m_settings.setValue(KEY_ALERT_TIMEOUT, ms);
}

Config Settings::config() const
{
    Config c;
    c.sortCriteria = sortCriteria();
    c.sortOrder = sortOrder();
    c.alertTimeoutMs = alertTimeoutMs();
    return c;
}
