#pragma once

#include <string>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libswscale/swscale.h>
}

// Owning handles for the FFmpeg objects used while decoding. Copy is
// disabled; each handle frees its object exactly once.

class AVFormatContextRAII
{
public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() const { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

private:
    AVFormatContext *ctx_;
};

class AVCodecContextRAII
{
public:
    explicit AVCodecContextRAII(AVCodecContext *ctx = nullptr) : ctx_(ctx) {}
    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() const { return ctx_; }

    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

private:
    AVCodecContext *ctx_;
};

class AVFrameRAII
{
public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}
    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() const { return frame_; }

    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;

private:
    AVFrame *frame_;
};

class AVPacketRAII
{
public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}
    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() const { return packet_; }

    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;

private:
    AVPacket *packet_;
};

// Holds the scaler across frames; sws_getCachedContext reuses or replaces it
class SwsContextRAII
{
public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() const { return ctx_; }
    void set(SwsContext *ctx) { ctx_ = ctx; }

    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;

private:
    SwsContext *ctx_;
};

inline std::string ffmpegErrorString(int error_code)
{
    char err_buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
    return std::string(err_buf);
}
