#pragma once

// Half-open time range [start, end) in seconds.
// Used both for detected silence and for the segments of video to keep.
struct TimeRange {
    double start;
    double end;

    double duration() const { return end - start; }

    bool operator==(const TimeRange& other) const {
        return start == other.start && end == other.end;
    }
};
