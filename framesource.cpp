#include "framesource.h"

#include <catlogger/catlogger.h>

#include "detectlight.h"

namespace detectlight {

VideoFrameSource::VideoFrameSource(const std::string &_filename) :
    filename(_filename),
    capture(cv::makePtr<cv::VideoCapture>()) {
    try {
        capture->open(filename);
    }
    catch (cv::Exception const& e) {
        throw DecodeError("Opening video " + filename + " failed: " + e.what());
    }
    checkOpened();
}

VideoFrameSource::VideoFrameSource(cv::Ptr<cv::VideoCapture> _capture, const std::string &name) :
    filename(name),
    capture(_capture) {
    checkOpened();
}

void VideoFrameSource::checkOpened() {
    if (!capture || !capture->isOpened()) {
        exhausted = true;
        throw DecodeError("Could not open video " + filename + ", unsupported container or codec?");
    }
    try {
        double const count = capture->get(cv::CAP_PROP_FRAME_COUNT);
        if (count > 0) {
            frame_count_hint = size_t(count);
        }
    }
    catch (cv::Exception const& e) {
        clog::L(__func__, 1) << "Reading the frame count of " << filename << " failed: " << e.what() << std::endl;
    }
}

VideoFrameSource::~VideoFrameSource() {
    release();
}

bool VideoFrameSource::next(cv::Mat &frame) {
    size_t consecutive_failures = 0;
    while (!exhausted) {
        bool success = false;
        try {
            if (!capture->grab()) {
                release();
                return false;
            }
            success = capture->retrieve(frame) && !frame.empty();
        }
        catch (cv::Exception const& e) {
            clog::L(__func__, 1) << "Decoding a frame of " << filename << " failed: " << e.what() << std::endl;
        }
        if (success) {
            return true;
        }
        num_skipped++;
        consecutive_failures++;
        if (consecutive_failures >= max_consecutive_failures) {
            clog::L(__func__, 1) << consecutive_failures << " consecutive frames of " << filename
                                 << " failed to decode, ignoring the rest of the video." << std::endl;
            release();
        }
    }
    return false;
}

size_t VideoFrameSource::skipped() const {
    return num_skipped;
}

bool VideoFrameSource::isOpen() const {
    return capture && capture->isOpened();
}

size_t VideoFrameSource::frameCountHint() const {
    return frame_count_hint;
}

void VideoFrameSource::release() {
    exhausted = true;
    if (capture && capture->isOpened()) {
        capture->release();
    }
}

MatFrameSource::MatFrameSource(const std::vector<cv::Mat> &_frames) : frames(_frames) {}

bool MatFrameSource::next(cv::Mat &frame) {
    while (pos < frames.size()) {
        cv::Mat const& current = frames[pos++];
        if (current.empty()) {
            num_skipped++;
            continue;
        }
        frame = current;
        return true;
    }
    return false;
}

size_t MatFrameSource::skipped() const {
    return num_skipped;
}

} // namespace detectlight
