#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/frame_types.hpp"

/**
 * @brief Container/codec capability consumed by the fixed-count sampler.
 *
 * Implementations must be callable from several threads at once; all decode
 * state lives inside a single call.
 */
class FrameDecoder
{
public:
    /**
     * @brief Receives one decoded frame
     * @param frame_index Position of the frame in decode order
     * @param rgb Freshly allocated CV_8UC3 raster in R,G,B order
     * @return false to stop decoding
     */
    using FrameCallback = std::function<bool(int64_t frame_index, cv::Mat rgb)>;

    virtual ~FrameDecoder() = default;

    /**
     * @brief Read stream properties of the best video stream
     * @throws DecodeError if the container cannot be opened or has no video stream
     */
    virtual VideoStreamInfo probe(const std::string &path) = 0;

    /**
     * @brief Decode the best video stream, converting only the wanted frames
     * @param path Video file
     * @param frame_indices Sorted, unique decode-order indices to deliver
     * @param on_frame Called for each wanted frame, in order
     * @throws DecodeError if the container or codec cannot be opened
     */
    virtual void decode(const std::string &path,
                        const std::vector<int64_t> &frame_indices,
                        const FrameCallback &on_frame) = 0;
};
