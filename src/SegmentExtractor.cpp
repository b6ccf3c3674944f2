#include "SegmentExtractor.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

std::vector<TimeRange> SegmentExtractor::complement(const std::vector<TimeRange>& silences,
                                                    double totalDuration) {
    std::vector<TimeRange> segments;
    segments.reserve(silences.size() + 1);

    double lastEnd = 0.0;
    for (const TimeRange& silence : silences) {
        if (silence.start > lastEnd) {
            segments.push_back({lastEnd, std::min(silence.start, totalDuration)});
        }
        lastEnd = std::max(lastEnd, silence.end);
    }
    if (lastEnd < totalDuration) {
        segments.push_back({lastEnd, totalDuration});
    }

    // Silence reaching past the end of the audio can leave an empty tail.
    segments.erase(std::remove_if(segments.begin(), segments.end(),
                                  [](const TimeRange& r) { return r.start >= r.end; }),
                   segments.end());
    return segments;
}

bool SegmentExtractor::splice(const std::string& inputPath, const std::string& outputPath,
                              const std::vector<TimeRange>& keepSegments,
                              const VideoSplicer::Settings& settings,
                              const VideoSplicer::ProgressCallback& progress,
                              std::string& error) {
    if (keepSegments.empty()) {
        if (!copyVerbatim(inputPath, outputPath, error)) {
            return false;
        }
        if (progress) {
            progress(1, 1);
        }
        return true;
    }
    return VideoSplicer::splice(inputPath, outputPath, keepSegments, settings, progress, error);
}

bool SegmentExtractor::copyVerbatim(const std::string& inputPath, const std::string& outputPath,
                                    std::string& error) {
    std::error_code ec;
    if (std::filesystem::equivalent(inputPath, outputPath, ec)) {
        // Copying a file onto itself would truncate it first.
        return true;
    }
    std::filesystem::copy_file(inputPath, outputPath,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy '" + inputPath + "' -> '" + outputPath + "': " + ec.message();
        return false;
    }
    return true;
}
