#pragma once

#include <string>

#include "AudioExtractor.h"
#include "VideoSplicer.h"

// Defaults and fixed settings of a silence removal run.
struct ProcessingConfig {
    static constexpr int kDefaultThresholdDb = -40;
    static constexpr int kDefaultMinSilenceMs = 500;

    // Temporary audio used for analysis: mono, 16-bit, 44.1 kHz.
    AudioExtractor::Format analysisFormat;
    // Output encoding: H.264 video, AAC audio.
    VideoSplicer::Settings spliceSettings;
    // Where the temporary audio goes; the system temp dir when empty.
    std::string tempDir;
};

// One silence removal run. Built once from the user's input and never
// modified afterwards.
struct ProcessingJob {
    std::string inputPath;
    std::string outputPath;
    int thresholdDb = ProcessingConfig::kDefaultThresholdDb;
    int minSilenceMs = ProcessingConfig::kDefaultMinSilenceMs;
    ProcessingConfig config;
};

// Builds a job from the raw text of the input fields. Numbers may be
// surrounded by whitespace; anything else that is not an integer is
// rejected.
// Returns true on success. On failure, 'error' is populated with a message
// meant for the user.
bool parseProcessingJob(const std::string& inputPath, const std::string& outputPath,
                        const std::string& thresholdText, const std::string& minSilenceText,
                        ProcessingJob& job, std::string& error);
