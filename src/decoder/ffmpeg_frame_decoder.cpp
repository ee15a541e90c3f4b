#include "core/decoder/ffmpeg_frame_decoder.hpp"
#include "core/decoder/ffmpeg_raii.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <cmath>

namespace
{
    struct OpenedStream
    {
        AVFormatContextRAII format_ctx;
        int stream_index = -1;
        const AVCodec *codec = nullptr;
    };

    // Open the container and locate the best video stream
    void openBestVideoStream(const std::string &path, OpenedStream &opened)
    {
        int open_result = avformat_open_input(opened.format_ctx.address(), path.c_str(), nullptr, nullptr);
        if (open_result < 0)
        {
            throw DecodeError("Could not open video file: " + path + " - " + ffmpegErrorString(open_result));
        }

        int info_result = avformat_find_stream_info(opened.format_ctx.get(), nullptr);
        if (info_result < 0)
        {
            throw DecodeError("Could not find stream information: " + path + " - " + ffmpegErrorString(info_result));
        }

        int stream_index = av_find_best_stream(opened.format_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &opened.codec, 0);
        if (stream_index < 0)
        {
            throw DecodeError("No video stream found: " + path);
        }
        opened.stream_index = stream_index;
    }

    double streamFrameRate(const AVStream *stream)
    {
        double fps = av_q2d(stream->avg_frame_rate);
        if (fps <= 0.0 || !std::isfinite(fps))
        {
            fps = av_q2d(stream->r_frame_rate);
        }
        if (fps <= 0.0 || !std::isfinite(fps))
        {
            fps = 0.0;
        }
        return fps;
    }

    double streamDuration(const AVFormatContext *format_ctx, const AVStream *stream)
    {
        if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        {
            return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
        }
        if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0)
        {
            return static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
        }
        return 0.0;
    }
}

FFmpegFrameDecoder::FFmpegFrameDecoder(int decoder_threads)
    : decoder_threads_(decoder_threads < 0 ? 0 : decoder_threads)
{
}

VideoStreamInfo FFmpegFrameDecoder::probe(const std::string &path)
{
    OpenedStream opened;
    openBestVideoStream(path, opened);

    const AVStream *stream = opened.format_ctx.get()->streams[opened.stream_index];

    VideoStreamInfo info;
    info.width = stream->codecpar->width;
    info.height = stream->codecpar->height;
    info.fps = streamFrameRate(stream);
    info.duration_seconds = streamDuration(opened.format_ctx.get(), stream);
    info.total_frames = stream->nb_frames;

    // Many containers (mkv, webm) leave nb_frames unset
    if (info.total_frames <= 0 && info.duration_seconds > 0.0 && info.fps > 0.0)
    {
        info.total_frames = static_cast<int64_t>(std::llround(info.duration_seconds * info.fps));
    }

    Logger::debug("Probed " + path + " - frames: " + std::to_string(info.total_frames) +
                  ", duration: " + std::to_string(info.duration_seconds) +
                  ", size: " + std::to_string(info.width) + "x" + std::to_string(info.height) +
                  ", fps: " + std::to_string(info.fps));
    return info;
}

void FFmpegFrameDecoder::decode(const std::string &path,
                                const std::vector<int64_t> &frame_indices,
                                const FrameCallback &on_frame)
{
    if (frame_indices.empty())
    {
        return;
    }

    OpenedStream opened;
    openBestVideoStream(path, opened);

    AVStream *stream = opened.format_ctx.get()->streams[opened.stream_index];
    if (!opened.codec)
    {
        throw DecodeError("Unsupported video codec: " + path);
    }

    AVCodecContextRAII codec_ctx(avcodec_alloc_context3(opened.codec));
    if (!codec_ctx.get())
    {
        throw DecodeError("Could not allocate decoder context: " + path);
    }
    if (avcodec_parameters_to_context(codec_ctx.get(), stream->codecpar) < 0)
    {
        throw DecodeError("Could not copy codec parameters: " + path);
    }
    codec_ctx.get()->thread_count = decoder_threads_;
    int open_result = avcodec_open2(codec_ctx.get(), opened.codec, nullptr);
    if (open_result < 0)
    {
        throw DecodeError("Could not open decoder: " + path + " - " + ffmpegErrorString(open_result));
    }

    AVFrameRAII frame;
    AVPacketRAII packet;
    SwsContextRAII sws_ctx;
    if (!frame.get() || !packet.get())
    {
        throw DecodeError("Could not allocate frame or packet");
    }

    size_t next_wanted = 0;
    int64_t decoded_index = 0;
    bool stop = false;

    // Drain every frame the codec has ready; returns false once decoding should end
    auto receive_frames = [&]() -> bool
    {
        while (true)
        {
            int response = avcodec_receive_frame(codec_ctx.get(), frame.get());
            if (response == AVERROR(EAGAIN) || response == AVERROR_EOF)
            {
                return true;
            }
            if (response < 0)
            {
                Logger::warn("Error receiving frame from " + path + ": " + ffmpegErrorString(response));
                return true;
            }

            int64_t current = decoded_index++;
            if (current == frame_indices[next_wanted])
            {
                AVFrame *src = frame.get();
                sws_ctx.set(sws_getCachedContext(sws_ctx.get(),
                                                 src->width, src->height, static_cast<AVPixelFormat>(src->format),
                                                 src->width, src->height, AV_PIX_FMT_RGB24,
                                                 SWS_BILINEAR, nullptr, nullptr, nullptr));
                if (!sws_ctx.get())
                {
                    av_frame_unref(src);
                    throw DecodeError("Could not create scaler context: " + path);
                }

                cv::Mat rgb(src->height, src->width, CV_8UC3);
                uint8_t *dst_data[4] = {rgb.data, nullptr, nullptr, nullptr};
                int dst_linesize[4] = {static_cast<int>(rgb.step[0]), 0, 0, 0};
                sws_scale(sws_ctx.get(), src->data, src->linesize, 0, src->height, dst_data, dst_linesize);
                av_frame_unref(src);

                ++next_wanted;
                if (!on_frame(current, std::move(rgb)) || next_wanted >= frame_indices.size())
                {
                    return false;
                }
            }
            else
            {
                av_frame_unref(frame.get());
            }
        }
    };

    while (!stop && av_read_frame(opened.format_ctx.get(), packet.get()) >= 0)
    {
        if (packet.get()->stream_index == opened.stream_index)
        {
            int response = avcodec_send_packet(codec_ctx.get(), packet.get());
            if (response < 0)
            {
                Logger::debug("Skipping undecodable packet in " + path + ": " + ffmpegErrorString(response));
                av_packet_unref(packet.get());
                continue;
            }
            stop = !receive_frames();
        }
        av_packet_unref(packet.get());
    }

    if (!stop)
    {
        // Flush frames still buffered in the codec
        int flush_result = avcodec_send_packet(codec_ctx.get(), nullptr);
        if (flush_result < 0 && flush_result != AVERROR_EOF)
        {
            Logger::warn("Could not flush decoder for " + path + ": " + ffmpegErrorString(flush_result));
        }
        else
        {
            receive_frames();
        }
    }

    Logger::debug("Decoded " + std::to_string(decoded_index) + " frames from " + path + ", delivered " +
                  std::to_string(next_wanted) + " of " + std::to_string(frame_indices.size()));
}
