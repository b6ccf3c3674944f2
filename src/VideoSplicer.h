#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "TimeRange.h"

// Cuts sub-ranges out of a video and joins them back to back into a new
// file, re-encoding both the video and the audio track.
class VideoSplicer {
  public:
    struct Settings {
        std::string videoEncoder = "libx264";
        std::string audioEncoder = "aac";
        int64_t audioBitRate = 128000;
    };

    // progress(doneSegments, totalSegments), called after each segment.
    using ProgressCallback = std::function<void(int, int)>;

    // Writes outputPath (container guessed from its extension, MP4 if
    // unknown), replacing any existing file. Segments must be ordered and
    // non-overlapping.
    // Returns true on success. On failure, 'error' is populated.
    static bool splice(const std::string& inputPath, const std::string& outputPath,
                       const std::vector<TimeRange>& segments, const Settings& settings,
                       const ProgressCallback& progress, std::string& error);
};
