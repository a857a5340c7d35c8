#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace preview {

// ---------------------------------------------------------------------------
// PointTracker: one selected pixel per preview window and the formatted
// value read from the last frame shown in it.
// Window names are frame kind names ("depth", "color", ...); the name picks
// the value unit.
// ---------------------------------------------------------------------------
class PointTracker {
public:
    // (event, x, y, flags), same arguments as a cv::MouseCallback minus userdata
    using ClickHandler = std::function<void(int, int, int, int)>;

    // Window binding for cv::setMouseCallback(name, OnMouse, &binding).
    // Must outlive the window callback registration.
    struct ClickBinding {
        PointTracker* tracker = nullptr;
        std::string   name;
    };

    PointTracker() = default;

    // Handlers and bindings hold 'this'
    PointTracker(const PointTracker&) = delete;
    PointTracker& operator=(const PointTracker&) = delete;
    PointTracker(PointTracker&&) = delete;
    PointTracker& operator=(PointTracker&&) = delete;

    // Handler bound to 'name'. Left button release at (x,y) selects the point;
    // releasing again on the same pixel clears the selection.
    ClickHandler selectPoint(const std::string& name);

    // cv::MouseCallback compatible trampoline; userdata is a ClickBinding*.
    static void OnMouse(int event, int x, int y, int flags, void* userdata);

    // Read the frame at the selected point of 'name' and store the text.
    // No selection -> no-op, returns true.
    bool extractValue(const std::string& name, const cv::Mat& frame);

    // Marker + value text at the selected point. No selection -> untouched.
    void drawOverlay(const std::string& name, cv::Mat& frame) const;

    std::optional<cv::Point> point(const std::string& name) const;
    std::optional<std::string> value(const std::string& name) const;

    void clear();

    enum class Status : uint8_t {
        OK = 0,
        OUT_OF_BOUNDS,   // selected point outside the frame
        EMPTY_FRAME,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    void onClick(const std::string& name, int event, int x, int y);

    std::map<std::string, cv::Point>   m_points;
    std::map<std::string, std::string> m_values;

    Status m_status = Status::OK;

    bool fail(Status s, const std::string& name);
};

} // namespace preview
