#include "media_probe.hpp"
#include "logging.hpp"
#include <opencv2/videoio.hpp>

namespace mediaframes {

std::optional<double> OpenCvMediaProbe::duration(const std::string& path) {
    try {
        cv::VideoCapture cap(path);
        if (!cap.isOpened()) {
            return std::nullopt;
        }

        double total_frames = cap.get(cv::CAP_PROP_FRAME_COUNT);
        double fps = cap.get(cv::CAP_PROP_FPS);
        if (total_frames <= 0.0 || fps <= 0.0) {
            return std::nullopt;
        }
        return total_frames / fps;
    } catch (const cv::Exception& e) {
        log_debug("Probing " + path + " failed: " + e.what());
        return std::nullopt;
    }
}

} // namespace mediaframes
