// PointTracker.cpp
#include "apps/preview/PointTracker.hpp"
#include "apps/preview/FrameKind.hpp"

#include <iostream>
#include <sstream>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace {

// One channel of one pixel, printed as its native type would print.
void put_channel(std::ostringstream& os, const cv::Mat& m, int row, int col, int ch) {
    const int i = col * m.channels() + ch;
    switch (m.depth()) {
        case CV_8U:  os << static_cast<int>(m.ptr<uint8_t>(row)[i]);  break;
        case CV_8S:  os << static_cast<int>(m.ptr<int8_t>(row)[i]);   break;
        case CV_16U: os << m.ptr<uint16_t>(row)[i]; break;
        case CV_16S: os << m.ptr<int16_t>(row)[i];  break;
        case CV_32S: os << m.ptr<int32_t>(row)[i];  break;
        case CV_32F: os << m.ptr<float>(row)[i];    break;
        case CV_64F: os << m.ptr<double>(row)[i];   break;
        default:     os << "?";                      break;
    }
}

// Scalar for single channel frames, "[c0 c1 ...]" in storage order otherwise.
std::string sample_text(const cv::Mat& m, int row, int col) {
    std::ostringstream os;
    if (m.channels() == 1) {
        put_channel(os, m, row, col, 0);
        return os.str();
    }
    os << "[";
    for (int ch = 0; ch < m.channels(); ++ch) {
        if (ch) os << " ";
        put_channel(os, m, row, col, ch);
    }
    os << "]";
    return os.str();
}

std::string channel_text(const cv::Mat& m, int row, int col, int ch) {
    std::ostringstream os;
    put_channel(os, m, row, col, ch);
    return os.str();
}

} // anonymous namespace

namespace preview {

PointTracker::ClickHandler PointTracker::selectPoint(const std::string& name) {
    return [this, name](int event, int x, int y, int /*flags*/) {
        onClick(name, event, x, y);
    };
}

void PointTracker::OnMouse(int event, int x, int y, int /*flags*/, void* userdata) {
    auto* binding = static_cast<ClickBinding*>(userdata);
    if (!binding || !binding->tracker) return;
    binding->tracker->onClick(binding->name, event, x, y);
}

void PointTracker::onClick(const std::string& name, int event, int x, int y) {
    if (event != cv::EVENT_LBUTTONUP) return;

    const cv::Point clicked(x, y);
    auto it = m_points.find(name);

    if (it != m_points.end() && it->second == clicked) {
        m_points.erase(it);
        m_values.erase(name);
        std::cout << "[TRACKER] " << name << " point cleared\n";
        return;
    }

    // Old value belongs to the old point
    m_points[name] = clicked;
    m_values.erase(name);
    std::cout << "[TRACKER] " << name << " point (" << x << "," << y << ")\n";
}

bool PointTracker::extractValue(const std::string& name, const cv::Mat& frame) {
    m_status = Status::OK;

    auto it = m_points.find(name);
    if (it == m_points.end()) return true;

    if (frame.empty()) {
        m_values.erase(name);
        return fail(Status::EMPTY_FRAME, name);
    }

    const int col = it->second.x;
    const int row = it->second.y;
    if (col < 0 || row < 0 || col >= frame.cols || row >= frame.rows) {
        m_values.erase(name);
        return fail(Status::OUT_OF_BOUNDS, name);
    }

    FrameKind kind{};
    const bool known = FrameKindFromName(name, kind);

    std::string text;
    if (known && IsDepthKind(kind)) {
        text = sample_text(frame, row, col) + "mm";
    } else if (known && IsDisparityKind(kind)) {
        text = sample_text(frame, row, col) + "px";
    } else if (frame.channels() == 3) {
        // stored BGR
        text = "R:" + channel_text(frame, row, col, 2) +
               ",G:" + channel_text(frame, row, col, 1) +
               ",B:" + channel_text(frame, row, col, 0);
    } else if (frame.channels() == 1) {
        text = "Gray:" + sample_text(frame, row, col);
    } else {
        text = sample_text(frame, row, col);
    }

    m_values[name] = text;
    return true;
}

void PointTracker::drawOverlay(const std::string& name, cv::Mat& frame) const {
    auto it = m_points.find(name);
    if (it == m_points.end() || frame.empty()) return;

    const cv::Point& pt = it->second;
    cv::circle(frame, pt, 3, cv::Scalar(255, 255, 255), cv::FILLED);
    cv::circle(frame, pt, 1, cv::Scalar(0, 0, 0), cv::FILLED);

    auto v = m_values.find(name);
    if (v == m_values.end()) return;

    // dark outline under light text so it reads on any colormap
    const cv::Point org = pt + cv::Point(5, 5);
    cv::putText(frame, v->second, org, cv::FONT_HERSHEY_TRIPLEX, 0.5, cv::Scalar(0, 0, 0), 4, cv::LINE_AA);
    cv::putText(frame, v->second, org, cv::FONT_HERSHEY_TRIPLEX, 0.5, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
}

std::optional<cv::Point> PointTracker::point(const std::string& name) const {
    auto it = m_points.find(name);
    if (it == m_points.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> PointTracker::value(const std::string& name) const {
    auto it = m_values.find(name);
    if (it == m_values.end()) return std::nullopt;
    return it->second;
}

void PointTracker::clear() {
    m_points.clear();
    m_values.clear();
    m_status = Status::OK;
}

bool PointTracker::fail(Status s, const std::string& name) {
    m_status = s;
    std::cerr << "[TRACKER] " << StatusStr(s) << ": " << name << "\n";
    return false;
}

const char* PointTracker::StatusStr(PointTracker::Status s) {
    switch (s) {
        case PointTracker::Status::OK:            return "OK";
        case PointTracker::Status::OUT_OF_BOUNDS: return "OUT_OF_BOUNDS";
        case PointTracker::Status::EMPTY_FRAME:   return "EMPTY_FRAME";
        default:                                  return "UNKNOWN";
    }
}

} // namespace preview
