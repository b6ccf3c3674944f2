#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "FfmpegUtils.h"

extern "C" {
#include <libavutil/channel_layout.h>
}

#ifndef SILENCECUT_TEST_ASSETS_DIR
#define SILENCECUT_TEST_ASSETS_DIR ""
#endif

inline std::string assetsDir() {
    const char* env = std::getenv("SILENCECUT_TEST_ASSETS");
    if (env && env[0])
        return std::string(env) + "/";
    std::string d = SILENCECUT_TEST_ASSETS_DIR;
    if (!d.empty() && d.back() != '/')
        d += '/';
    return d;
}

#define SKIP_IF_MISSING(path)                                                             \
    do {                                                                                  \
        if (!std::filesystem::exists(path)) {                                             \
            GTEST_SKIP() << "Asset not found (set SILENCECUT_TEST_ASSETS): " << (path);   \
        }                                                                                 \
    } while (0)

// Directory under the system temp dir, removed with everything in it when
// the object goes out of scope.
class ScratchDir {
  public:
    ScratchDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("silencecut-test-" + std::to_string(stamp) + "-" +
                  std::to_string(std::random_device{}()));
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string path() const { return m_path.string(); }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

  private:
    std::filesystem::path m_path;
};

// Sample generator: returns the value of mono sample 'index'.
using SampleFn = std::function<int16_t(int64_t index)>;

constexpr int16_t kLoud = 10000;  // about -10 dBFS

// 441 Hz square wave at 44.1 kHz, constant power.
inline int16_t squareWave(int64_t index) {
    return ((index / 50) % 2) ? kLoud : static_cast<int16_t>(-kLoud);
}

// Builds a sample generator from (seconds, loud?) pieces played in order.
inline SampleFn pattern(std::vector<std::pair<double, bool>> pieces, int sampleRate = 44100) {
    return [pieces = std::move(pieces), sampleRate](int64_t index) -> int16_t {
        double t = static_cast<double>(index) / sampleRate;
        for (const auto& piece : pieces) {
            if (t < piece.first)
                return piece.second ? squareWave(index) : 0;
            t -= piece.first;
        }
        return 0;
    };
}

inline std::vector<int16_t> renderSamples(const SampleFn& fn, int64_t count, int channels = 1) {
    std::vector<int16_t> out(static_cast<std::size_t>(count) * channels);
    for (int64_t i = 0; i < count; ++i) {
        for (int c = 0; c < channels; ++c) {
            out[static_cast<std::size_t>(i) * channels + c] = fn(i);
        }
    }
    return out;
}

// Writes a Matroska file with a small MPEG-4 Part 2 video stream (25 fps)
// and a mono pcm_s16le 44.1 kHz audio stream generated by 'audio'. An empty
// 'audio' leaves the audio stream without samples. Both streams start at
// 'startOffset' seconds (whole video frames).
// Only encoders built into every FFmpeg are used.
inline bool writeTestVideo(const std::string& path, double seconds, const SampleFn& audio,
                           std::string& error, double startOffset = 0.0) {
    constexpr int kFps = 25;
    constexpr int kRate = 44100;
    constexpr int kSamplesPerFrame = kRate / kFps;
    const int64_t firstFrame = std::llround(startOffset * kFps);

    AVFormatContext* rawOut = nullptr;
    if (int err = avformat_alloc_output_context2(&rawOut, nullptr, "matroska", path.c_str());
        err < 0) {
        error = "avformat_alloc_output_context2: " + avError(err);
        return false;
    }
    OutputContextPtr out(rawOut);

    const AVCodec* vcodec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    const AVCodec* acodec = avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
    if (!vcodec || !acodec) {
        error = "test encoders not available";
        return false;
    }

    CodecContextPtr venc(avcodec_alloc_context3(vcodec));
    CodecContextPtr aenc(avcodec_alloc_context3(acodec));
    if (!venc || !aenc) {
        error = "avcodec_alloc_context3 failed";
        return false;
    }
    venc->width = 160;
    venc->height = 120;
    venc->pix_fmt = AV_PIX_FMT_YUV420P;
    venc->time_base = AVRational{1, kFps};
    venc->framerate = AVRational{kFps, 1};
    venc->gop_size = 12;
    aenc->sample_fmt = AV_SAMPLE_FMT_S16;
    aenc->sample_rate = kRate;
    av_channel_layout_default(&aenc->ch_layout, 1);
    aenc->time_base = AVRational{1, kRate};
    if (out->oformat->flags & AVFMT_GLOBALHEADER) {
        venc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        aenc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    if (int err = avcodec_open2(venc.get(), vcodec, nullptr); err < 0) {
        error = "avcodec_open2 (mpeg4): " + avError(err);
        return false;
    }
    if (int err = avcodec_open2(aenc.get(), acodec, nullptr); err < 0) {
        error = "avcodec_open2 (pcm): " + avError(err);
        return false;
    }

    AVStream* vstream = avformat_new_stream(out.get(), nullptr);
    AVStream* astream = avformat_new_stream(out.get(), nullptr);
    if (!vstream || !astream) {
        error = "avformat_new_stream failed";
        return false;
    }
    vstream->time_base = venc->time_base;
    astream->time_base = aenc->time_base;
    if (avcodec_parameters_from_context(vstream->codecpar, venc.get()) < 0 ||
        avcodec_parameters_from_context(astream->codecpar, aenc.get()) < 0) {
        error = "avcodec_parameters_from_context failed";
        return false;
    }
    if (int err = avio_open(&out->pb, path.c_str(), AVIO_FLAG_WRITE); err < 0) {
        error = "avio_open: " + avError(err);
        return false;
    }
    if (int err = avformat_write_header(out.get(), nullptr); err < 0) {
        error = "avformat_write_header: " + avError(err);
        return false;
    }

    FramePtr vframe(av_frame_alloc());
    FramePtr aframe(av_frame_alloc());
    if (!vframe || !aframe) {
        error = "Out of memory";
        return false;
    }
    vframe->format = venc->pix_fmt;
    vframe->width = venc->width;
    vframe->height = venc->height;
    if (av_frame_get_buffer(vframe.get(), 0) < 0) {
        error = "av_frame_get_buffer (video) failed";
        return false;
    }

    const int frames = static_cast<int>(seconds * kFps);
    for (int i = 0; i < frames; ++i) {
        if (av_frame_make_writable(vframe.get()) < 0) {
            error = "av_frame_make_writable failed";
            return false;
        }
        for (int y = 0; y < venc->height; ++y) {
            for (int x = 0; x < venc->width; ++x) {
                vframe->data[0][y * vframe->linesize[0] + x] =
                        static_cast<uint8_t>(x + y + i * 3);
            }
        }
        for (int y = 0; y < venc->height / 2; ++y) {
            for (int x = 0; x < venc->width / 2; ++x) {
                vframe->data[1][y * vframe->linesize[1] + x] = 128;
                vframe->data[2][y * vframe->linesize[2] + x] = 128;
            }
        }
        vframe->pts = firstFrame + i;
        if (!encodeAndWrite(venc.get(), out.get(), vstream, vframe.get(), error))
            return false;

        if (!audio)
            continue;
        av_frame_unref(aframe.get());
        aframe->format = aenc->sample_fmt;
        aframe->sample_rate = kRate;
        aframe->nb_samples = kSamplesPerFrame;
        if (av_channel_layout_copy(&aframe->ch_layout, &aenc->ch_layout) < 0 ||
            av_frame_get_buffer(aframe.get(), 0) < 0) {
            error = "audio frame allocation failed";
            return false;
        }
        auto* samples = reinterpret_cast<int16_t*>(aframe->data[0]);
        const int64_t first = static_cast<int64_t>(i) * kSamplesPerFrame;
        for (int s = 0; s < kSamplesPerFrame; ++s) {
            samples[s] = audio(first + s);
        }
        aframe->pts = (firstFrame + i) * kSamplesPerFrame;
        if (!encodeAndWrite(aenc.get(), out.get(), astream, aframe.get(), error))
            return false;
    }

    if (!encodeAndWrite(venc.get(), out.get(), vstream, nullptr, error) ||
        !encodeAndWrite(aenc.get(), out.get(), astream, nullptr, error)) {
        return false;
    }
    if (int err = av_write_trailer(out.get()); err < 0) {
        error = "av_write_trailer: " + avError(err);
        return false;
    }
    return true;
}

// Container duration of a media file in seconds, or a negative value if it
// cannot be opened.
inline double probeDuration(const std::string& path) {
    FormatContextPtr fmt;
    std::string error;
    if (!openInput(path, fmt, error) || fmt->duration == AV_NOPTS_VALUE)
        return -1.0;
    return static_cast<double>(fmt->duration) / AV_TIME_BASE;
}
