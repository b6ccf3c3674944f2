#include "AudioDecoder.h"

#include "FfmpegUtils.h"

#include <algorithm>
#include <vector>

bool AudioDecoder::decode(const std::string& path, const Callback& cb, std::string& error) {
    // --- Open container ---
    FormatContextPtr fmt;
    if (!openInput(path, fmt, error)) {
        return false;
    }

    // --- Find best audio stream ---
    int streamIdx = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIdx < 0) {
        error = "No audio stream found";
        return false;
    }

    // --- Set up decoder ---
    CodecContextPtr codecCtx;
    if (!openDecoder(fmt.get(), streamIdx, codecCtx, error)) {
        return false;
    }

    const int outSampleRate = codecCtx->sample_rate;
    const int outChannels = codecCtx->ch_layout.nb_channels;
    if (outChannels <= 0) {
        error = "Audio stream has no channels";
        return false;
    }

    // --- Set up resampler: any input format -> interleaved s16, same layout and rate ---
    SwrContext* rawSwr = nullptr;
    if (int err = swr_alloc_set_opts2(&rawSwr, &codecCtx->ch_layout, AV_SAMPLE_FMT_S16,
                                      outSampleRate, &codecCtx->ch_layout,
                                      codecCtx->sample_fmt, codecCtx->sample_rate, 0, nullptr);
        err < 0) {
        error = "swr_alloc_set_opts2: " + avError(err);
        return false;
    }
    SwrContextPtr swr(rawSwr);

    if (int err = swr_init(swr.get()); err < 0) {
        error = "swr_init: " + avError(err);
        return false;
    }

    PacketPtr pkt(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!pkt || !frame) {
        error = "Out of memory";
        return false;
    }

    const AudioInfo info{outSampleRate, outChannels};

    // Buffer to accumulate converted output before calling cb
    constexpr int kChunkFrames = 8192;
    std::vector<int16_t> outBuf;
    outBuf.reserve(kChunkFrames * outChannels);

    auto flushBuf = [&]() {
        if (!outBuf.empty()) {
            cb(outBuf.data(), static_cast<int>(outBuf.size()) / outChannels, info);
            outBuf.clear();
        }
    };

    auto appendConverted = [&](const uint8_t** in, int inFrames) -> bool {
        const int maxOut = swr_get_out_samples(swr.get(), inFrames) + 256;
        std::vector<int16_t> tmp(static_cast<std::size_t>(maxOut) * outChannels);
        uint8_t* dst = reinterpret_cast<uint8_t*>(tmp.data());

        int converted = swr_convert(swr.get(), &dst, maxOut, in, inFrames);
        if (converted < 0) {
            error = "swr_convert: " + avError(converted);
            return false;
        }

        size_t prev = outBuf.size();
        outBuf.resize(prev + static_cast<size_t>(converted) * outChannels);
        std::copy(tmp.begin(), tmp.begin() + static_cast<std::ptrdiff_t>(converted) * outChannels,
                  outBuf.begin() + static_cast<std::ptrdiff_t>(prev));

        if (static_cast<int>(outBuf.size()) / outChannels >= kChunkFrames) {
            flushBuf();
        }
        return true;
    };

    // Drains every frame the decoder has ready. Returns false on a hard error.
    auto receiveFrames = [&]() -> bool {
        while (true) {
            int err = avcodec_receive_frame(codecCtx.get(), frame.get());
            if (err == AVERROR(EAGAIN) || err == AVERROR_EOF)
                return true;
            if (err < 0) {
                error = "avcodec_receive_frame: " + avError(err);
                return false;
            }
            bool ok = appendConverted(const_cast<const uint8_t**>(frame->extended_data),
                                      frame->nb_samples);
            av_frame_unref(frame.get());
            if (!ok)
                return false;
        }
    };

    // --- Decode loop ---
    int readErr = 0;
    while ((readErr = av_read_frame(fmt.get(), pkt.get())) >= 0) {
        if (pkt->stream_index != streamIdx) {
            av_packet_unref(pkt.get());
            continue;
        }
        int err = avcodec_send_packet(codecCtx.get(), pkt.get());
        av_packet_unref(pkt.get());
        // Corrupt packets are skipped; the decoder resynchronises by itself.
        if (err < 0 && err != AVERROR(EAGAIN) && err != AVERROR_INVALIDDATA) {
            error = "avcodec_send_packet: " + avError(err);
            return false;
        }
        if (!receiveFrames())
            return false;
    }
    if (readErr != AVERROR_EOF) {
        error = "av_read_frame: " + avError(readErr);
        return false;
    }

    // Flush decoder
    if (int err = avcodec_send_packet(codecCtx.get(), nullptr); err < 0 && err != AVERROR_EOF) {
        error = "avcodec_send_packet (flush): " + avError(err);
        return false;
    }
    if (!receiveFrames())
        return false;

    // Flush resampler
    if (!appendConverted(nullptr, 0))
        return false;

    flushBuf();
    return true;
}
