#pragma once

#include "core/decoder/frame_decoder.hpp"

/**
 * @brief FrameDecoder backed by libavformat/libavcodec/libswscale
 */
class FFmpegFrameDecoder : public FrameDecoder
{
public:
    /**
     * @param decoder_threads Codec thread count, 0 lets libavcodec decide
     */
    explicit FFmpegFrameDecoder(int decoder_threads = 0);

    VideoStreamInfo probe(const std::string &path) override;

    void decode(const std::string &path,
                const std::vector<int64_t> &frame_indices,
                const FrameCallback &on_frame) override;

private:
    int decoder_threads_;
};
