#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include <memory>
#include <string>

// RAII helpers shared by the decoding and encoding code.
struct FormatContextDeleter {
    void operator()(AVFormatContext* c) { avformat_close_input(&c); }
};
// Output contexts are not opened with avformat_open_input.
struct OutputContextDeleter {
    void operator()(AVFormatContext* c) {
        if (c->pb && !(c->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&c->pb);
        }
        avformat_free_context(c);
    }
};
struct CodecContextDeleter {
    void operator()(AVCodecContext* c) { avcodec_free_context(&c); }
};
struct SwrContextDeleter {
    void operator()(SwrContext* c) { swr_free(&c); }
};
struct SwsContextDeleter {
    void operator()(SwsContext* c) { sws_freeContext(c); }
};
struct AudioFifoDeleter {
    void operator()(AVAudioFifo* f) { av_audio_fifo_free(f); }
};
struct PacketDeleter {
    void operator()(AVPacket* p) { av_packet_free(&p); }
};
struct FrameDeleter {
    void operator()(AVFrame* f) { av_frame_free(&f); }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using OutputContextPtr = std::unique_ptr<AVFormatContext, OutputContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;
using AudioFifoPtr = std::unique_ptr<AVAudioFifo, AudioFifoDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;

std::string avError(int err);

// Opens 'path' for reading and probes its streams.
bool openInput(const std::string& path, FormatContextPtr& fmt, std::string& error);

// Opens a decoder for stream 'streamIdx' of 'fmt'.
bool openDecoder(AVFormatContext* fmt, int streamIdx, CodecContextPtr& codecCtx,
                 std::string& error);

// Sends 'frame' (nullptr to flush) to 'enc' and writes every packet it
// produces to 'stream' of 'out'.
bool encodeAndWrite(AVCodecContext* enc, AVFormatContext* out, AVStream* stream,
                    const AVFrame* frame, std::string& error);
