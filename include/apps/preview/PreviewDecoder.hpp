#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <Eigen/Core>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "apps/preview/FrameKind.hpp"
#include "msg/PreviewPacket.hpp"

namespace preview {

// ---------------------------------------------------------------------------
// Shared preview configuration.
// Created once by the owner of the device pipeline, read by every decode
// call. disp_scale_factor is filled in by the first depth decode.
// ---------------------------------------------------------------------------
struct PreviewConfig {
    // Packets carry MJPEG/PNG bitstreams instead of raw buffers
    bool low_bandwidth = false;
    // Streams are host-synced; encoder has no passthrough in that mode
    bool sync = false;

    // Stream feeding the NN; rectified sources arrive mirrored
    std::optional<FrameKind> nn_source{};

    // Stereo calibration
    float baseline_mm = 75.0f;
    float fov_deg     = 71.86f;          // horizontal field of view
    std::optional<float> focal_px{};     // overrides intrinsics and fov
    std::optional<Eigen::Matrix3f> intrinsics{}; // K of the depth-aligned camera

    // baseline * focal, cached after first use
    std::optional<float> disp_scale_factor{};

    // 255 / max_disparity (96 for the default stereo config)
    float disp_multiplier = 255.0f / 96.0f;

    int color_map = cv::COLORMAP_JET;
};

// ---------------------------------------------------------------------------
// PreviewDecoder: turns device packets into display frames.
// One entry point per input shape; dispatch is an exhaustive switch over
// FrameKind. Not thread-safe (shared config is written by depth decode).
// ---------------------------------------------------------------------------
class PreviewDecoder {
public:
    // Uses a private default config.
    PreviewDecoder();
    // Uses (and sanitises in place) a config shared with the caller.
    explicit PreviewDecoder(PreviewConfig& shared_cfg);

    PreviewDecoder(const PreviewDecoder&) = delete;
    PreviewDecoder& operator=(const PreviewDecoder&) = delete;

    const PreviewConfig& getConfig() const { return *m_cfg; }

    // Core API: one packet in, one display frame out.
    // DERIVED kinds decode the packet through their source kind first
    // (depth <- depth_raw, disparity_color <- disparity).
    bool decode(FrameKind kind, const msg::PreviewPacket& packet, cv::Mat& out);

    // Derived API: already decoded frame in (depth, disparity_color only).
    bool decode(FrameKind kind, const cv::Mat& frame, cv::Mat& out);

    // Same as above, kind selected by its registered name.
    bool decode(const std::string& name, const msg::PreviewPacket& packet, cv::Mat& out);
    bool decode(const std::string& name, const cv::Mat& frame, cv::Mat& out);

    // Scale factor used by depth decode for a frame 'width' pixels wide.
    // Computes and caches it on first call.
    float dispScaleFactor(int width);

    enum class Status : uint8_t {
        OK = 0,
        UNSUPPORTED_KIND,   // name not in FRAME_KINDS
        WRONG_INPUT,        // cv::Mat handed to a packet-only kind
        BAD_PACKET,         // malformed packet view
        DECODE_FAIL,        // bitstream rejected by the codec
        BAD_FRAME,          // derived input has wrong type
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    PreviewConfig  m_own_cfg{};
    PreviewConfig* m_cfg = nullptr;

    Status m_status = Status::OK;

    // Packet views
    bool nativeFrame(const msg::PreviewPacket& packet, cv::Mat& out);
    bool rawFrame(const msg::PreviewPacket& packet, cv::Mat& out);
    bool compressedFrame(const msg::PreviewPacket& packet, int imread_flags, cv::Mat& out);

    // One per FrameKind
    bool decodeNnInput(const msg::PreviewPacket& packet, cv::Mat& out);
    bool decodeColor(const msg::PreviewPacket& packet, cv::Mat& out);
    bool decodeMono(const msg::PreviewPacket& packet, cv::Mat& out);
    bool decodeRectifiedLeft(const msg::PreviewPacket& packet, cv::Mat& out);
    bool decodeRectifiedRight(const msg::PreviewPacket& packet, cv::Mat& out);
    bool decodeDepthRaw(const msg::PreviewPacket& packet, cv::Mat& out);
    bool decodeDepth(const cv::Mat& depth_raw, cv::Mat& out);
    bool decodeDisparity(const msg::PreviewPacket& packet, cv::Mat& out);
    bool colorizeDisparity(const cv::Mat& disparity, cv::Mat& out);

    bool fail(Status s, const char* what);
};

} // namespace preview
