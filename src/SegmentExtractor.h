#pragma once

#include <string>
#include <vector>

#include "TimeRange.h"
#include "VideoSplicer.h"

// Turns detected silence into the list of segments to keep and writes the
// output video made of those segments only.
class SegmentExtractor {
  public:
    // Returns the ordered gaps between the silence ranges within
    // [0, totalDuration). Silences must be sorted by start; overlapping
    // ranges are tolerated.
    static std::vector<TimeRange> complement(const std::vector<TimeRange>& silences,
                                             double totalDuration);

    // Writes outputPath from the keep segments of inputPath. An empty
    // segment list means the whole input was silent: the input is copied
    // verbatim instead of re-encoded.
    // Returns true on success. On failure, 'error' is populated.
    static bool splice(const std::string& inputPath, const std::string& outputPath,
                       const std::vector<TimeRange>& keepSegments,
                       const VideoSplicer::Settings& settings,
                       const VideoSplicer::ProgressCallback& progress, std::string& error);

    // Copies inputPath to outputPath, replacing any existing file.
    static bool copyVerbatim(const std::string& inputPath, const std::string& outputPath,
                             std::string& error);
};
