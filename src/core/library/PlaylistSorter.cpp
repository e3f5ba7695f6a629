#include "PlaylistSorter.h"
#include <algorithm>

namespace PlaylistSorter {

// Three-way compare on the selected field.
static int compareBy(SortCriteria criteria, const Track& a, const Track& b)
{
    switch (criteria) {
    case SortCriteria::Title:
        return a.title.compare(b.title, Qt::CaseSensitive);
    case SortCriteria::Artist:
        return a.artistName().compare(b.artistName(), Qt::CaseSensitive);
    case SortCriteria::Album:
        return a.albumName().compare(b.albumName(), Qt::CaseSensitive);
    case SortCriteria::Duration:
        return (a.duration > b.duration) - (a.duration < b.duration);
    case SortCriteria::DateAdded: {
        // Tracks without a date sort before dated ones.
        const qint64 ta = a.dateAdded.isValid() ? a.dateAdded.toMSecsSinceEpoch() : -1;
        const qint64 tb = b.dateAdded.isValid() ? b.dateAdded.toMSecsSinceEpoch() : -1;
        return (ta > tb) - (ta < tb);
    }
    }
    return 0;
}

QVector<Track> sortTracks(QVector<Track> tracks, SortCriteria criteria, SortOrder order)
{
    const bool descending = order == SortOrder::Descending;
    std::stable_sort(tracks.begin(), tracks.end(),
        [criteria, descending](const Track& a, const Track& b) {
            const int c = compareBy(criteria, a, b);
            return descending ? c > 0 : c < 0;
        });
    return tracks;
}

Merged mergeFetchedTracks(const Result<QVector<Track>>& fetched, const Config& config)
{
    Merged merged;
    if (fetched.isErr())
        merged.error = fetched.error();

    merged.tracks = sortTracks(fetched.valueOr({}), config.sortCriteria, config.sortOrder);
    return merged;
}

} // namespace PlaylistSorter
