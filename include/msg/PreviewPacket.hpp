#pragma once
#include <cstdint>

namespace msg {

// How the bytes behind PreviewPacket::data are laid out.
// ENCODED packets carry a JPEG/PNG bitstream (low-bandwidth mode) and have
// no usable width/height/stride until decoded.
enum class PixelFormat : uint8_t {
    GRAY8 = 0,  // 8-bit mono (mono cameras, RAW8 disparity)
    RAW16,      // 16-bit mono container (depth in mm, subpixel disparity)
    BGR888,     // interleaved 8-bit BGR
    NV12,       // Y plane followed by interleaved UV plane (color camera)
    ENCODED,    // compressed bitstream, 'size' bytes
};

struct PreviewPacket {
    // Non-owning pointer to the first byte of the payload.
    // The producer keeps the buffer alive until the decode call returns.
    const uint8_t* data;

    // Payload length in BYTES (whole bitstream for ENCODED, whole buffer otherwise)
    uint32_t size;

    // Image dimensions in pixels (0 for ENCODED)
    uint32_t width;
    uint32_t height;

    // Stride = number of BYTES between the start of row v and the start of row v+1.
    // For NV12 this is the luma stride; the chroma plane uses the same stride.
    uint32_t stride;

    PixelFormat format;

    uint64_t t_capture_us;  // device capture timestamp (µs)
    uint32_t frame_id;      // increasing counter

    // Bytes the pixel buffer must span for width/height/stride/format.
    // 64-bit: stride * rows does not fit 32 bits for large headers.
    constexpr uint64_t byteSize() const {
        const uint64_t rows = (format == PixelFormat::NV12)
                                  ? uint64_t(height) + height / 2
                                  : uint64_t(height);
        return uint64_t(stride) * rows;
    }
};

constexpr uint8_t BytesPerPx(PixelFormat f) {
    switch (f) {
        case PixelFormat::GRAY8:  return 1;
        case PixelFormat::RAW16:  return 2;
        case PixelFormat::BGR888: return 3;
        case PixelFormat::NV12:   return 1; // luma plane
        default:                  return 0;
    }
}

} // namespace msg
