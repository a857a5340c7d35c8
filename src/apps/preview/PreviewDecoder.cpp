// PreviewDecoder.cpp
#include "apps/preview/PreviewDecoder.hpp"

#include <climits>
#include <cmath>
#include <iostream>
#include <limits>

#include <opencv2/imgcodecs.hpp>

// scale / 0 must give +inf, not trap
static_assert(std::numeric_limits<double>::is_iec559, "IEEE 754 double required");

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr float DEG2RAD = static_cast<float>(PI / 180.0);

// double -> uint8 the way the display expects it:
// fraction dropped toward zero, then only the low 8 bits kept (796 -> 28).
// inf/nan (invalid depth) and values outside int64 -> 0.
inline uint8_t truncate_u8(double v) {
    if (!std::isfinite(v)) return 0;
    if (!(std::fabs(v) < 9.2e18)) return 0;
    return static_cast<uint8_t>(static_cast<int64_t>(v) & 0xFF);
}

void truncate_to_u8(const cv::Mat& f64, cv::Mat& out) {
    out.create(f64.size(), CV_8UC1);
    for (int r = 0; r < f64.rows; ++r) {
        const double* src = f64.ptr<double>(r);
        uint8_t* dst = out.ptr<uint8_t>(r);
        for (int c = 0; c < f64.cols; ++c) {
            dst[c] = truncate_u8(src[c]);
        }
    }
}

// Non-owning cv::Mat header over a packet buffer.
inline cv::Mat wrap(const msg::PreviewPacket& p, int rows, int type) {
    return cv::Mat(rows, static_cast<int>(p.width), type,
                   const_cast<uint8_t*>(p.data), static_cast<size_t>(p.stride));
}

int cv_type(msg::PixelFormat f) {
    switch (f) {
        case msg::PixelFormat::GRAY8:  return CV_8UC1;
        case msg::PixelFormat::RAW16:  return CV_16UC1;
        case msg::PixelFormat::BGR888: return CV_8UC3;
        case msg::PixelFormat::NV12:   return CV_8UC1;
        default:                       return -1;
    }
}

} // anonymous namespace

namespace preview {

// Replace invalid parameters with safe defaults.
// Applied in place: the config is shared with the caller.
static inline void sanitise(PreviewConfig& cfg) {
    const PreviewConfig defaults{};

    if (!(cfg.baseline_mm > 0.0f)) cfg.baseline_mm = defaults.baseline_mm;
    if (!(cfg.fov_deg > 0.0f && cfg.fov_deg < 180.0f)) cfg.fov_deg = defaults.fov_deg;

    if (cfg.focal_px && !(*cfg.focal_px > 0.0f)) cfg.focal_px.reset();
    if (cfg.intrinsics && !((*cfg.intrinsics)(0, 0) > 0.0f)) cfg.intrinsics.reset();
    if (cfg.disp_scale_factor && !std::isfinite(*cfg.disp_scale_factor)) cfg.disp_scale_factor.reset();

    if (!(cfg.disp_multiplier > 0.0f)) cfg.disp_multiplier = defaults.disp_multiplier;

    if (cfg.color_map < cv::COLORMAP_AUTUMN || cfg.color_map > cv::COLORMAP_DEEPGREEN) {
        cfg.color_map = defaults.color_map;
    }
}

PreviewDecoder::PreviewDecoder() : m_cfg(&m_own_cfg) {
    sanitise(*m_cfg);
}

PreviewDecoder::PreviewDecoder(PreviewConfig& shared_cfg) : m_cfg(&shared_cfg) {
    sanitise(*m_cfg);
}

// ------------------------------
// Dispatch
// ------------------------------

bool PreviewDecoder::decode(FrameKind kind, const msg::PreviewPacket& packet, cv::Mat& out) {
    m_status = Status::OK;

    switch (kind) {
        case FrameKind::NN_INPUT:        return decodeNnInput(packet, out);
        case FrameKind::COLOR:           return decodeColor(packet, out);
        case FrameKind::LEFT:            return decodeMono(packet, out);
        case FrameKind::RIGHT:           return decodeMono(packet, out);
        case FrameKind::RECTIFIED_LEFT:  return decodeRectifiedLeft(packet, out);
        case FrameKind::RECTIFIED_RIGHT: return decodeRectifiedRight(packet, out);
        case FrameKind::DEPTH_RAW:       return decodeDepthRaw(packet, out);
        case FrameKind::DEPTH: {
            cv::Mat depth_raw;
            if (!decodeDepthRaw(packet, depth_raw)) return false;
            return decodeDepth(depth_raw, out);
        }
        case FrameKind::DISPARITY:       return decodeDisparity(packet, out);
        case FrameKind::DISPARITY_COLOR: {
            cv::Mat disparity;
            if (!decodeDisparity(packet, disparity)) return false;
            return colorizeDisparity(disparity, out);
        }
    }
    return fail(Status::UNSUPPORTED_KIND, "frame kind out of range");
}

bool PreviewDecoder::decode(FrameKind kind, const cv::Mat& frame, cv::Mat& out) {
    m_status = Status::OK;

    if (static_cast<size_t>(kind) >= FRAME_KIND_COUNT) {
        return fail(Status::UNSUPPORTED_KIND, "frame kind out of range");
    }
    // Only kinds computed from another frame accept one
    if (Info(kind).input != InputType::DERIVED) {
        return fail(Status::WRONG_INPUT, FrameKindName(kind));
    }

    switch (kind) {
        case FrameKind::DEPTH:           return decodeDepth(frame, out);
        case FrameKind::DISPARITY_COLOR: return colorizeDisparity(frame, out);

        case FrameKind::NN_INPUT:
        case FrameKind::COLOR:
        case FrameKind::LEFT:
        case FrameKind::RIGHT:
        case FrameKind::RECTIFIED_LEFT:
        case FrameKind::RECTIFIED_RIGHT:
        case FrameKind::DEPTH_RAW:
        case FrameKind::DISPARITY:
            return fail(Status::WRONG_INPUT, FrameKindName(kind));
    }
    return fail(Status::UNSUPPORTED_KIND, "frame kind out of range");
}

bool PreviewDecoder::decode(const std::string& name, const msg::PreviewPacket& packet, cv::Mat& out) {
    FrameKind kind{};
    if (!FrameKindFromName(name, kind)) {
        return fail(Status::UNSUPPORTED_KIND, name.c_str());
    }
    return decode(kind, packet, out);
}

bool PreviewDecoder::decode(const std::string& name, const cv::Mat& frame, cv::Mat& out) {
    FrameKind kind{};
    if (!FrameKindFromName(name, kind)) {
        return fail(Status::UNSUPPORTED_KIND, name.c_str());
    }
    return decode(kind, frame, out);
}

// ------------------------------
// Packet views
// ------------------------------

// Equivalent of the device frame's "as displayed" view:
// colour conversion applied, memory owned by 'out'.
bool PreviewDecoder::nativeFrame(const msg::PreviewPacket& packet, cv::Mat& out) {
    if (packet.format != msg::PixelFormat::NV12) {
        return rawFrame(packet, out);
    }

    cv::Mat yuv;
    if (!rawFrame(packet, yuv)) return false;
    cv::cvtColor(yuv, out, cv::COLOR_YUV2BGR_NV12);
    return true;
}

// Buffer exactly as stored, copied out of the packet.
bool PreviewDecoder::rawFrame(const msg::PreviewPacket& packet, cv::Mat& out) {
    if (!packet.data) return fail(Status::BAD_PACKET, "null data");
    if (packet.format == msg::PixelFormat::ENCODED) {
        return fail(Status::BAD_PACKET, "encoded payload where a pixel buffer is expected");
    }
    if (packet.width == 0 || packet.height == 0) return fail(Status::BAD_PACKET, "zero extent");

    const int type = cv_type(packet.format);
    if (type < 0) return fail(Status::BAD_PACKET, "unknown pixel format");

    if (uint64_t(packet.stride) < uint64_t(packet.width) * msg::BytesPerPx(packet.format)) {
        return fail(Status::BAD_PACKET, "stride smaller than row");
    }

    uint64_t rows = packet.height;
    if (packet.format == msg::PixelFormat::NV12) {
        if ((packet.width % 2) != 0 || (packet.height % 2) != 0) {
            return fail(Status::BAD_PACKET, "NV12 needs even width and height");
        }
        rows += rows / 2;
    }

    // cv::Mat extents are int
    if (packet.width > uint32_t(INT_MAX) || rows > uint64_t(INT_MAX)) {
        return fail(Status::BAD_PACKET, "extent exceeds INT_MAX");
    }
    if (uint64_t(packet.size) < packet.byteSize()) {
        return fail(Status::BAD_PACKET, "buffer shorter than stride*rows");
    }

    out = wrap(packet, static_cast<int>(rows), type).clone();
    return true;
}

bool PreviewDecoder::compressedFrame(const msg::PreviewPacket& packet, int imread_flags, cv::Mat& out) {
    if (!packet.data || packet.size == 0) return fail(Status::BAD_PACKET, "empty bitstream");
    if (packet.size > uint32_t(INT_MAX)) return fail(Status::BAD_PACKET, "bitstream exceeds INT_MAX bytes");

    const cv::Mat bitstream(1, static_cast<int>(packet.size), CV_8UC1, const_cast<uint8_t*>(packet.data));
    try {
        out = cv::imdecode(bitstream, imread_flags);
    } catch (const cv::Exception& e) {
        return fail(Status::DECODE_FAIL, e.what());
    }
    if (out.empty()) return fail(Status::DECODE_FAIL, "imdecode returned no image");
    return true;
}

// ------------------------------
// Per-kind decoders
// ------------------------------

bool PreviewDecoder::decodeNnInput(const msg::PreviewPacket& packet, cv::Mat& out) {
    // Low-bandwidth is ignored here: the encoder cannot take passthrough
    // frames, so NN input always arrives raw.
    if (!nativeFrame(packet, out)) return false;

    if (m_cfg->nn_source && IsRectifiedKind(*m_cfg->nn_source)) {
        cv::flip(out, out, 1);
    }
    return true;
}

bool PreviewDecoder::decodeColor(const msg::PreviewPacket& packet, cv::Mat& out) {
    // MJPEG has no passthrough in sync mode, so synced streams stay raw
    if (m_cfg->low_bandwidth && !m_cfg->sync) {
        return compressedFrame(packet, cv::IMREAD_COLOR, out);
    }
    return nativeFrame(packet, out);
}

bool PreviewDecoder::decodeMono(const msg::PreviewPacket& packet, cv::Mat& out) {
    if (m_cfg->low_bandwidth && !m_cfg->sync) {
        return compressedFrame(packet, cv::IMREAD_GRAYSCALE, out);
    }
    return nativeFrame(packet, out);
}

bool PreviewDecoder::decodeRectifiedLeft(const msg::PreviewPacket& packet, cv::Mat& out) {
    cv::Mat frame;
    if (!decodeMono(packet, frame)) return false;
    cv::flip(frame, out, 1);
    return true;
}

bool PreviewDecoder::decodeRectifiedRight(const msg::PreviewPacket& packet, cv::Mat& out) {
    // Unlike rectified_left, the sync flag is not consulted here.
    cv::Mat frame;
    const bool ok = m_cfg->low_bandwidth ? compressedFrame(packet, cv::IMREAD_GRAYSCALE, frame)
                                         : nativeFrame(packet, frame);
    if (!ok) return false;
    cv::flip(frame, out, 1);
    return true;
}

bool PreviewDecoder::decodeDepthRaw(const msg::PreviewPacket& packet, cv::Mat& out) {
    // Depth is never encoded by the device, whatever low_bandwidth says.
    return rawFrame(packet, out);
}

float PreviewDecoder::dispScaleFactor(int width) {
    if (m_cfg->disp_scale_factor) return *m_cfg->disp_scale_factor;

    float focal = 0.0f;
    if (m_cfg->focal_px) {
        focal = *m_cfg->focal_px;
    } else if (m_cfg->intrinsics) {
        focal = (*m_cfg->intrinsics)(0, 0);
    } else {
        focal = static_cast<float>(width) / (2.0f * std::tan(m_cfg->fov_deg * DEG2RAD / 2.0f));
    }

    const float scale = m_cfg->baseline_mm * focal;
    m_cfg->disp_scale_factor = scale;

    std::cout << "[PREVIEW] disparity scale factor = " << scale
              << " (baseline=" << m_cfg->baseline_mm << "mm focal=" << focal << "px)\n";
    return scale;
}

bool PreviewDecoder::decodeDepth(const cv::Mat& depth_raw, cv::Mat& out) {
    if (depth_raw.empty() || depth_raw.type() != CV_16UC1) {
        return fail(Status::BAD_FRAME, "depth expects a 16-bit single channel frame");
    }

    const double scale = dispScaleFactor(depth_raw.cols);
    const double mult = m_cfg->disp_multiplier;

    // depth 0 = no measurement -> +inf disparity, mapped to 0 by truncate_u8
    cv::Mat disp_f(depth_raw.size(), CV_64FC1);
    for (int r = 0; r < depth_raw.rows; ++r) {
        const uint16_t* src = depth_raw.ptr<uint16_t>(r);
        double* dst = disp_f.ptr<double>(r);
        for (int c = 0; c < depth_raw.cols; ++c) {
            dst[c] = scale / static_cast<double>(src[c]) * mult;
        }
    }

    cv::Mat disp_u8;
    truncate_to_u8(disp_f, disp_u8);
    return colorizeDisparity(disp_u8, out);
}

bool PreviewDecoder::decodeDisparity(const msg::PreviewPacket& packet, cv::Mat& out) {
    cv::Mat raw;
    const bool ok = m_cfg->low_bandwidth ? compressedFrame(packet, cv::IMREAD_GRAYSCALE, raw)
                                         : rawFrame(packet, raw);
    if (!ok) return false;
    if (raw.channels() != 1) return fail(Status::BAD_PACKET, "disparity must be single channel");

    cv::Mat scaled;
    raw.convertTo(scaled, CV_64F, static_cast<double>(m_cfg->disp_multiplier));
    truncate_to_u8(scaled, out);
    return true;
}

bool PreviewDecoder::colorizeDisparity(const cv::Mat& disparity, cv::Mat& out) {
    if (disparity.empty() || disparity.type() != CV_8UC1) {
        return fail(Status::BAD_FRAME, "disparity_color expects an 8-bit single channel frame");
    }
    cv::applyColorMap(disparity, out, m_cfg->color_map);
    return true;
}

// ------------------------------
// FDIR
// ------------------------------

bool PreviewDecoder::fail(Status s, const char* what) {
    m_status = s;
    std::cerr << "[PREVIEW] " << StatusStr(s) << ": " << what << "\n";
    return false;
}

const char* PreviewDecoder::StatusStr(PreviewDecoder::Status s) {
    switch (s) {
        case PreviewDecoder::Status::OK:               return "OK";
        case PreviewDecoder::Status::UNSUPPORTED_KIND: return "UNSUPPORTED_KIND";
        case PreviewDecoder::Status::WRONG_INPUT:      return "WRONG_INPUT";
        case PreviewDecoder::Status::BAD_PACKET:       return "BAD_PACKET";
        case PreviewDecoder::Status::DECODE_FAIL:      return "DECODE_FAIL";
        case PreviewDecoder::Status::BAD_FRAME:        return "BAD_FRAME";
        default:                                       return "UNKNOWN";
    }
}

} // namespace preview
