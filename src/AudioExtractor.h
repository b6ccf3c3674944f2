#pragma once

#include <string>

// Transcodes the audio track of a video into a PCM WAV file
// (signed 16-bit, by default mono at 44.1 kHz) for silence analysis.
class AudioExtractor {
  public:
    struct Format {
        int sampleRate = 44100;
        int channels = 1;
    };

    // Writes wavPath, replacing any existing file.
    // Returns true on success. On failure, 'error' is populated.
    static bool extract(const std::string& inputPath, const std::string& wavPath,
                        const Format& format, std::string& error);

    static bool extract(const std::string& inputPath, const std::string& wavPath,
                        std::string& error) {
        return extract(inputPath, wavPath, Format{}, error);
    }
};
