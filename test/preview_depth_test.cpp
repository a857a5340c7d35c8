#include "apps/preview/PreviewDecoder.hpp"

#include <opencv2/opencv.hpp>
#include <Eigen/Core>
#include <cmath>
#include <iostream>
#include <string>

static int g_failures = 0;

static constexpr double PI = 3.14159265358979323846;

static void check(bool ok, const std::string& what) {
    std::cout << "  " << (ok ? "OK   " : "FAIL ") << what << "\n";
    if (!ok) ++g_failures;
}

// Color the display shows for one 8-bit disparity value.
static cv::Vec3b jet(uint8_t v) {
    cv::Mat one(1, 1, CV_8UC1, cv::Scalar(v));
    cv::Mat colored;
    cv::applyColorMap(one, colored, cv::COLORMAP_JET);
    return colored.at<cv::Vec3b>(0, 0);
}

int main() {
    using preview::FrameKind;
    using preview::PreviewDecoder;

    std::cout << "=== preview_depth_test ===\n";

    // ---------------------------------------------------------------
    std::cout << "\n[Test 0] Scale factor from field of view, cached\n";
    {
        preview::PreviewConfig cfg;
        PreviewDecoder dec(cfg);
        check(!cfg.disp_scale_factor.has_value(), "no scale factor before first frame");

        cv::Mat raw(400, 640, CV_16UC1, cv::Scalar(1000));
        cv::Mat out;
        check(dec.decode(FrameKind::DEPTH, raw, out), "decode(depth)");
        check(out.type() == CV_8UC3 && out.size() == raw.size(), "3-channel frame, same size");

        const double focal = 640.0 / (2.0 * std::tan((71.86 * PI / 180.0) / 2.0));
        const double expected = 75.0 * focal;
        check(cfg.disp_scale_factor.has_value(), "scale factor cached in config");
        check(std::fabs(*cfg.disp_scale_factor - expected) < 1e-4 * expected,
              "scale = baseline * width / (2 tan(fov/2))");

        // Changing calibration afterwards does not recompute
        const float cached = *cfg.disp_scale_factor;
        cfg.baseline_mm = 150.0f;
        check(dec.decode(FrameKind::DEPTH, raw, out), "decode(depth) again");
        check(*cfg.disp_scale_factor == cached, "cached value reused");
        check(dec.dispScaleFactor(1280) == cached, "width ignored once cached");
    }

    // ---------------------------------------------------------------
    std::cout << "\n[Test 1] Focal length sources\n";
    {
        preview::PreviewConfig cfg;
        cfg.focal_px = 400.0f;
        PreviewDecoder dec(cfg);
        check(dec.dispScaleFactor(640) == 30000.0f, "explicit focal: 75 * 400");

        preview::PreviewConfig kcfg;
        Eigen::Matrix3f K;
        K << 500.0f, 0.0f, 320.0f,
             0.0f, 500.0f, 200.0f,
             0.0f, 0.0f, 1.0f;
        kcfg.intrinsics = K;
        PreviewDecoder kdec(kcfg);
        check(kdec.dispScaleFactor(640) == 37500.0f, "intrinsics: 75 * K(0,0)");

        preview::PreviewConfig both = kcfg;
        both.focal_px = 400.0f;
        PreviewDecoder bdec(both);
        check(bdec.dispScaleFactor(640) == 30000.0f, "explicit focal wins over intrinsics");
    }

    // ---------------------------------------------------------------
    std::cout << "\n[Test 2] Depth to colored disparity\n";
    {
        preview::PreviewConfig cfg;
        cfg.focal_px = 400.0f;          // scale = 30000
        PreviewDecoder dec(cfg);

        cv::Mat raw(1, 4, CV_16UC1);
        raw.at<uint16_t>(0, 0) = 0;     // no measurement
        raw.at<uint16_t>(0, 1) = 1000;  // 30 px * 2.65625 = 79.6875
        raw.at<uint16_t>(0, 2) = 3000;  // 10 px * 2.65625 = 26.5625
        raw.at<uint16_t>(0, 3) = 100;   // 300 px * 2.65625 = 796.875, past the display range

        cv::Mat out;
        check(dec.decode(FrameKind::DEPTH, raw, out), "raw depth 0 does not fail");
        check(dec.lastStatus() == PreviewDecoder::Status::OK, "status OK");
        check(out.at<cv::Vec3b>(0, 0) == jet(0), "0 mm -> invalid disparity color");
        check(out.at<cv::Vec3b>(0, 1) == jet(79), "1000 mm -> 79");
        check(out.at<cv::Vec3b>(0, 2) == jet(26), "3000 mm -> 26");
        check(out.at<cv::Vec3b>(0, 3) == jet(28), "100 mm -> 796 wraps to 28");
    }

    // ---------------------------------------------------------------
    std::cout << "\n[Test 3] Out of range disparity keeps the low 8 bits\n";
    {
        preview::PreviewConfig cfg;
        cfg.focal_px = 320.0f;          // scale = 24000
        PreviewDecoder dec(cfg);

        cv::Mat raw(1, 4, CV_16UC1);
        raw.at<uint16_t>(0, 0) = 17;    // 24000 / 17 * 2.65625 = 3750 exactly
        raw.at<uint16_t>(0, 1) = 250;   // 255.0
        raw.at<uint16_t>(0, 2) = 249;   // 256.02 -> 256 -> 0
        raw.at<uint16_t>(0, 3) = 1;     // 63750 -> 6

        cv::Mat out;
        check(dec.decode(FrameKind::DEPTH, raw, out), "decode(depth)");
        check(out.at<cv::Vec3b>(0, 0) == jet(166), "17 mm -> 3750 & 0xFF = 166, no float rounding to 3749");
        check(out.at<cv::Vec3b>(0, 1) == jet(255), "250 mm -> 255");
        check(out.at<cv::Vec3b>(0, 2) == jet(0), "249 mm -> 256 wraps to 0");
        check(out.at<cv::Vec3b>(0, 3) == jet(6), "1 mm -> 63750 & 0xFF = 6");
    }

    // ---------------------------------------------------------------
    std::cout << "\n[Test 4] Depth from packet matches depth from depth_raw\n";
    {
        cv::Mat raw(60, 80, CV_16UC1);
        for (int r = 0; r < raw.rows; ++r)
            for (int c = 0; c < raw.cols; ++c)
                raw.at<uint16_t>(r, c) = static_cast<uint16_t>(r * 100 + c);

        msg::PreviewPacket pkt{};
        pkt.data   = raw.data;
        pkt.size   = static_cast<uint32_t>(raw.total() * raw.elemSize());
        pkt.width  = 80;
        pkt.height = 60;
        pkt.stride = static_cast<uint32_t>(raw.step[0]);
        pkt.format = msg::PixelFormat::RAW16;

        PreviewDecoder dec;
        cv::Mat depth_raw, from_frame, from_packet;
        check(dec.decode(FrameKind::DEPTH_RAW, pkt, depth_raw), "decode(depth_raw)");
        check(depth_raw.type() == CV_16UC1 && cv::norm(depth_raw, raw, cv::NORM_INF) == 0.0,
              "depth_raw is the buffer untouched");
        check(dec.decode(FrameKind::DEPTH, depth_raw, from_frame), "depth from frame");
        check(dec.decode(FrameKind::DEPTH, pkt, from_packet), "depth from packet");
        check(cv::norm(from_frame, from_packet, cv::NORM_INF) == 0.0, "same output");
    }

    // ---------------------------------------------------------------
    std::cout << "\n[Test 5] Wrong derived inputs\n";
    {
        PreviewDecoder dec;
        cv::Mat out;
        cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(5));
        cv::Mat depth(10, 10, CV_16UC1, cv::Scalar(5));

        check(!dec.decode(FrameKind::DEPTH, gray, out), "8-bit frame to depth");
        check(dec.lastStatus() == PreviewDecoder::Status::BAD_FRAME, "status BAD_FRAME");
        check(!dec.decode(FrameKind::DISPARITY_COLOR, depth, out), "16-bit frame to disparity_color");
        check(!dec.decode(FrameKind::DEPTH, cv::Mat(), out), "empty frame to depth");
        check(!dec.decode(std::string("depth_colour"), depth, out), "misspelled name");
        check(dec.lastStatus() == PreviewDecoder::Status::UNSUPPORTED_KIND, "status UNSUPPORTED_KIND");
        check(dec.decode(std::string("disparity_color"), gray, out) && out.channels() == 3,
              "disparity_color by name");
    }

    std::cout << "\n" << (g_failures == 0 ? "ALL PASSED" : "FAILURES: " + std::to_string(g_failures)) << "\n";
    return g_failures == 0 ? 0 : 1;
}
