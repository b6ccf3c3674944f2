#pragma once

#include <cstdint>
#include <functional>
#include <string>

// Decodes the audio track of a media file to interleaved signed 16-bit
// samples at the native sample rate and channel count, and delivers them
// in chunks via callback.
class AudioDecoder {
  public:
    struct AudioInfo {
        int sampleRate;
        int channels;
    };

    // callback(samples, numFrames, info)
    // Called repeatedly with successive chunks until EOF.
    using Callback = std::function<void(const int16_t*, int, const AudioInfo&)>;

    // Returns true on success. On failure, 'error' is populated.
    static bool decode(const std::string& path, const Callback& cb, std::string& error);
};
