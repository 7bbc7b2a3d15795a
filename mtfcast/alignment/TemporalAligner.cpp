#include "alignment/TemporalAligner.h"

#include "Errors.h"
#include "TimeUtils.h"

namespace mtfcast {
namespace alignment {

bool AlignedFeatureVector::IsComplete() const {
    for (const auto& [timeframe, slot] : slots) {
        if (!slot) {
            return false;
        }
    }
    return true;
}

const bars::Bar* AlignedFeatureVector::Get(int64_t timeframe_ms) const {
    auto it = slots.find(timeframe_ms);
    if (it == slots.end() || !it->second) {
        return nullptr;
    }
    return &*it->second;
}

std::vector<AlignedFeatureVector> TemporalAligner::Align(const std::vector<int64_t>& referenceTimestamps,
                                                         const TimeframeStreams& streams) {
    for (size_t i = 1; i < referenceTimestamps.size(); ++i) {
        if (referenceTimestamps[i] < referenceTimestamps[i - 1]) {
            throw UnsortedInputError("reference timestamps decrease at index " + std::to_string(i));
        }
    }
    for (const auto& [timeframe, stream] : streams) {
        for (size_t i = 1; i < stream.size(); ++i) {
            if (stream[i].period_start_ms <= stream[i - 1].period_start_ms) {
                throw UnsortedInputError("stream " + FormatTimeframe(timeframe)
                                         + " is not strictly increasing at index " + std::to_string(i));
            }
        }
    }

    struct Cursor {
        int64_t timeframe_ms;
        const std::vector<bars::Bar>* bars;
        size_t next = 0;
        const bars::Bar* selected = nullptr;
    };
    std::vector<Cursor> cursors;
    cursors.reserve(streams.size());
    for (const auto& [timeframe, stream] : streams) {
        cursors.push_back(Cursor{timeframe, &stream});
    }

    std::vector<AlignedFeatureVector> rows;
    rows.reserve(referenceTimestamps.size());
    for (int64_t reference : referenceTimestamps) {
        AlignedFeatureVector row;
        row.reference_timestamp_ms = reference;
        for (auto& cursor : cursors) {
            const auto& stream = *cursor.bars;
            while (cursor.next < stream.size() && stream[cursor.next].period_end_ms() <= reference) {
                if (!stream[cursor.next].incomplete) {
                    cursor.selected = &stream[cursor.next];
                }
                ++cursor.next;
            }
            if (cursor.selected) {
                row.slots.emplace(cursor.timeframe_ms, *cursor.selected);
            } else {
                row.slots.emplace(cursor.timeframe_ms, std::nullopt);
            }
        }
        rows.push_back(std::move(row));
    }

    VerifyNoLookahead(rows);
    return rows;
}

std::vector<int64_t> TemporalAligner::ReferenceClock(const std::vector<bars::Bar>& referenceBars) {
    std::vector<int64_t> clock;
    clock.reserve(referenceBars.size());
    for (const auto& bar : referenceBars) {
        if (!bar.incomplete) {
            clock.push_back(bar.period_end_ms());
        }
    }
    return clock;
}

void TemporalAligner::VerifyNoLookahead(const std::vector<AlignedFeatureVector>& rows) {
    for (const auto& row : rows) {
        for (const auto& [timeframe, slot] : row.slots) {
            if (!slot) {
                continue;
            }
            if (slot->period_end_ms() > row.reference_timestamp_ms || slot->incomplete) {
                throw LeakageViolationError("bar " + FormatTimeframe(timeframe) + " ending "
                                            + FormatIsoMillis(slot->period_end_ms())
                                            + " joined at " + FormatIsoMillis(row.reference_timestamp_ms));
            }
        }
    }
}

} // namespace alignment
} // namespace mtfcast
