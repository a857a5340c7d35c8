#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace preview {

// ---------------------------------------------------------------------------
// Closed set of preview streams. Order matches FRAME_KINDS below.
// ---------------------------------------------------------------------------
enum class FrameKind : uint8_t {
    NN_INPUT = 0,
    COLOR,
    LEFT,
    RIGHT,
    RECTIFIED_LEFT,
    RECTIFIED_RIGHT,
    DEPTH_RAW,
    DEPTH,
    DISPARITY,
    DISPARITY_COLOR,
};

constexpr std::size_t FRAME_KIND_COUNT = 10;

// What a decode function consumes.
// PACKET  -> msg::PreviewPacket straight from the device queue
// DERIVED -> an already decoded cv::Mat (packets are accepted too, see PreviewDecoder)
enum class InputType : uint8_t { PACKET = 0, DERIVED = 1 };

struct FrameKindInfo {
    FrameKind   kind;
    const char* name;
    InputType   input;
    uint8_t     channels;  // expected output channels, 0 = follows the packet
};

// Single point of truth for kind registration.
inline constexpr std::array<FrameKindInfo, FRAME_KIND_COUNT> FRAME_KINDS{{
    {FrameKind::NN_INPUT,        "nn_input",        InputType::PACKET,  0},
    {FrameKind::COLOR,           "color",           InputType::PACKET,  3},
    {FrameKind::LEFT,            "left",            InputType::PACKET,  1},
    {FrameKind::RIGHT,           "right",           InputType::PACKET,  1},
    {FrameKind::RECTIFIED_LEFT,  "rectified_left",  InputType::PACKET,  1},
    {FrameKind::RECTIFIED_RIGHT, "rectified_right", InputType::PACKET,  1},
    {FrameKind::DEPTH_RAW,       "depth_raw",       InputType::PACKET,  1},
    {FrameKind::DEPTH,           "depth",           InputType::DERIVED, 3},
    {FrameKind::DISPARITY,       "disparity",       InputType::PACKET,  1},
    {FrameKind::DISPARITY_COLOR, "disparity_color", InputType::DERIVED, 3},
}};

constexpr const FrameKindInfo& Info(FrameKind kind) {
    return FRAME_KINDS[static_cast<std::size_t>(kind)];
}

constexpr const char* FrameKindName(FrameKind kind) { return Info(kind).name; }

// Reverse lookup. Returns false for names outside the registered set.
bool FrameKindFromName(const std::string& name, FrameKind& out);

// Streams whose pixel values are distances (mm) or disparities (px).
constexpr bool IsDepthKind(FrameKind k) {
    return k == FrameKind::DEPTH_RAW || k == FrameKind::DEPTH;
}
constexpr bool IsDisparityKind(FrameKind k) {
    return k == FrameKind::DISPARITY || k == FrameKind::DISPARITY_COLOR;
}
constexpr bool IsRectifiedKind(FrameKind k) {
    return k == FrameKind::RECTIFIED_LEFT || k == FrameKind::RECTIFIED_RIGHT;
}

} // namespace preview
