#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include "core/decoder/ffmpeg_frame_decoder.hpp"
#include "core/decoder/ffmpeg_raii.hpp"
#include "core/frame_sampler.hpp"
#include "core/video_hash_errors.hpp"
#include "test_base.hpp"

namespace
{
    void checkAv(int result, const std::string &what)
    {
        if (result < 0)
        {
            throw std::runtime_error(what + ": " + ffmpegErrorString(result));
        }
    }

    struct OutputContext
    {
        AVFormatContext *ctx = nullptr;

        ~OutputContext()
        {
            if (!ctx)
                return;
            if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE))
                avio_closep(&ctx->pb);
            avformat_free_context(ctx);
        }
    };

    void writePackets(AVCodecContext *encoder, AVFormatContext *output, AVStream *stream, AVPacket *packet)
    {
        while (true)
        {
            int response = avcodec_receive_packet(encoder, packet);
            if (response == AVERROR(EAGAIN) || response == AVERROR_EOF)
                return;
            checkAv(response, "receive packet");

            if (packet->duration == 0)
                packet->duration = 1;
            av_packet_rescale_ts(packet, encoder->time_base, stream->time_base);
            packet->stream_index = stream->index;
            checkAv(av_interleaved_write_frame(output, packet), "write packet");
        }
    }

    // Lossless FFV1 in Matroska, one solid color per frame. Matroska stores no
    // frame count, so probing has to estimate it from duration and frame rate.
    void writeSolidColorClip(const std::string &path, const std::vector<cv::Vec3b> &colors,
                             int width, int height, int fps)
    {
        OutputContext output;
        checkAv(avformat_alloc_output_context2(&output.ctx, nullptr, "matroska", path.c_str()), "allocate output");

        const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_FFV1);
        if (!codec)
            throw std::runtime_error("FFV1 encoder not available");

        AVStream *stream = avformat_new_stream(output.ctx, nullptr);
        if (!stream)
            throw std::runtime_error("Could not add stream");

        AVCodecContextRAII encoder(avcodec_alloc_context3(codec));
        encoder.get()->width = width;
        encoder.get()->height = height;
        encoder.get()->pix_fmt = AV_PIX_FMT_YUV444P;
        encoder.get()->time_base = AVRational{1, fps};
        encoder.get()->framerate = AVRational{fps, 1};
        if (output.ctx->oformat->flags & AVFMT_GLOBALHEADER)
            encoder.get()->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        checkAv(avcodec_open2(encoder.get(), codec, nullptr), "open encoder");
        checkAv(avcodec_parameters_from_context(stream->codecpar, encoder.get()), "copy parameters");
        stream->time_base = encoder.get()->time_base;
        stream->avg_frame_rate = AVRational{fps, 1};

        checkAv(avio_open(&output.ctx->pb, path.c_str(), AVIO_FLAG_WRITE), "open file");
        checkAv(avformat_write_header(output.ctx, nullptr), "write header");

        AVFrameRAII frame;
        AVPacketRAII packet;
        frame.get()->format = AV_PIX_FMT_YUV444P;
        frame.get()->width = width;
        frame.get()->height = height;
        checkAv(av_frame_get_buffer(frame.get(), 0), "allocate frame");

        SwsContextRAII scaler;
        scaler.set(sws_getContext(width, height, AV_PIX_FMT_RGB24, width, height, AV_PIX_FMT_YUV444P,
                                  SWS_POINT, nullptr, nullptr, nullptr));
        if (!scaler.get())
            throw std::runtime_error("Could not create scaler");

        for (size_t i = 0; i < colors.size(); i++)
        {
            cv::Mat rgb(height, width, CV_8UC3, cv::Scalar(colors[i][0], colors[i][1], colors[i][2]));
            const uint8_t *src_data[4] = {rgb.data, nullptr, nullptr, nullptr};
            int src_linesize[4] = {static_cast<int>(rgb.step[0]), 0, 0, 0};

            checkAv(av_frame_make_writable(frame.get()), "make frame writable");
            sws_scale(scaler.get(), src_data, src_linesize, 0, height, frame.get()->data, frame.get()->linesize);
            frame.get()->pts = static_cast<int64_t>(i);

            checkAv(avcodec_send_frame(encoder.get(), frame.get()), "send frame");
            writePackets(encoder.get(), output.ctx, stream, packet.get());
        }

        checkAv(avcodec_send_frame(encoder.get(), nullptr), "flush encoder");
        writePackets(encoder.get(), output.ctx, stream, packet.get());
        checkAv(av_write_trailer(output.ctx), "write trailer");
    }

    bool nearColor(const cv::Vec3b &actual, const cv::Vec3b &expected)
    {
        for (int c = 0; c < 3; c++)
        {
            if (std::abs(static_cast<int>(actual[c]) - static_cast<int>(expected[c])) > 8)
                return false;
        }
        return true;
    }
}

class FFmpegFrameDecoderTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        colors_ = {{255, 0, 0}, {0, 255, 0}, {0, 0, 255}, {255, 255, 0}, {0, 255, 255},
                   {255, 0, 255}, {128, 128, 128}, {255, 255, 255}, {0, 0, 0}, {200, 100, 50}};
        // Width 50 gives rows whose byte length is not a multiple of the codec's alignment
        clip_path_ = getTestFilesDir() + "/colors.mkv";
        writeSolidColorClip(clip_path_, colors_, WIDTH, HEIGHT, FPS);
    }

    cv::Vec3b centre(const cv::Mat &rgb) const { return rgb.at<cv::Vec3b>(rgb.rows / 2, rgb.cols / 2); }

    static constexpr int WIDTH = 50;
    static constexpr int HEIGHT = 30;
    static constexpr int FPS = 10;

    std::vector<cv::Vec3b> colors_;
    std::string clip_path_;
};

TEST_F(FFmpegFrameDecoderTest, ProbeReportsStreamProperties)
{
    FFmpegFrameDecoder decoder;
    VideoStreamInfo info = decoder.probe(clip_path_);

    EXPECT_EQ(info.width, WIDTH);
    EXPECT_EQ(info.height, HEIGHT);
    EXPECT_NEAR(info.fps, FPS, 0.5);
    EXPECT_NEAR(info.duration_seconds, 1.0, 0.15);
    EXPECT_NEAR(static_cast<double>(info.total_frames), 10.0, 1.0);
}

TEST_F(FFmpegFrameDecoderTest, DeliversRequestedFramesInRgbOrder)
{
    FFmpegFrameDecoder decoder;
    std::vector<int64_t> delivered;
    std::vector<cv::Mat> frames;

    decoder.decode(clip_path_, {0, 4, 9}, [&](int64_t index, cv::Mat rgb)
                   {
        delivered.push_back(index);
        frames.push_back(rgb);
        return true; });

    ASSERT_EQ(delivered, (std::vector<int64_t>{0, 4, 9}));
    for (size_t i = 0; i < frames.size(); i++)
    {
        ASSERT_EQ(frames[i].type(), CV_8UC3);
        EXPECT_EQ(frames[i].cols, WIDTH);
        EXPECT_EQ(frames[i].rows, HEIGHT);
        EXPECT_TRUE(nearColor(centre(frames[i]), colors_[delivered[i]]))
            << "frame " << delivered[i] << " centre " << centre(frames[i]);
        // Last column proves the row stride was honored
        EXPECT_TRUE(nearColor(frames[i].at<cv::Vec3b>(HEIGHT - 1, WIDTH - 1), colors_[delivered[i]]));
    }
}

TEST_F(FFmpegFrameDecoderTest, IndicesPastTheEndAreIgnored)
{
    FFmpegFrameDecoder decoder(2);
    std::vector<int64_t> delivered;
    decoder.decode(clip_path_, {8, 9, 25}, [&](int64_t index, cv::Mat)
                   {
        delivered.push_back(index);
        return true; });

    EXPECT_EQ(delivered, (std::vector<int64_t>{8, 9}));
}

TEST_F(FFmpegFrameDecoderTest, CallbackCanStopDecoding)
{
    FFmpegFrameDecoder decoder;
    int calls = 0;
    decoder.decode(clip_path_, {1, 2, 3}, [&](int64_t, cv::Mat)
                   {
        calls++;
        return false; });

    EXPECT_EQ(calls, 1);
}

TEST_F(FFmpegFrameDecoderTest, EvenSamplingOverRealClip)
{
    FFmpegFrameDecoder decoder;
    FrameSet frames = FrameSampler::sampleEvenly(decoder, clip_path_, 4);

    // The frame count is estimated, so only the first sample is fixed
    ASSERT_GE(frames.size(), 3u);
    EXPECT_TRUE(nearColor(centre(frames[0].rgb()), colors_[0]));
}

TEST_F(FFmpegFrameDecoderTest, UnreadableInputIsDecodeError)
{
    FFmpegFrameDecoder decoder;
    std::string garbage = createDummyFile("garbage.mp4", "this is not a video container");

    EXPECT_THROW(decoder.probe(garbage), DecodeError);
    EXPECT_THROW(decoder.probe(getTestFilesDir() + "/missing.mkv"), DecodeError);
    EXPECT_THROW(decoder.decode(garbage, {0}, [](int64_t, cv::Mat)
                                { return true; }),
                 DecodeError);
}
