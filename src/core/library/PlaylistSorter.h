#pragma once

#include <QVector>
#include <optional>

#include "../MusicData.h"
#include "../Result.h"
#include "../Settings.h"

// Orders fetched playlist tracks by the user's sort preference.
//
// The sort is stable under every criteria: tracks that compare equal keep
// their fetch order, in both directions. String fields compare
// case-sensitively.
namespace PlaylistSorter {

QVector<Track> sortTracks(QVector<Track> tracks, SortCriteria criteria, SortOrder order);

// Outcome of merging one fetch with the sort preference. A failed fetch
// yields an empty track list with the fetch error kept alongside.
struct Merged {
    QVector<Track>          tracks;
    std::optional<AppError> error;

    Result<QVector<Track>> toResult() const
    {
        if (error)
            return *error;
        return tracks;
    }
};

Merged mergeFetchedTracks(const Result<QVector<Track>>& fetched, const Config& config);

} // namespace PlaylistSorter
