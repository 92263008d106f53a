#include "detectlight.h"

#include <sstream>

#include <catlogger/catlogger.h>

namespace detectlight {

std::string AnalysisResult::print() const {
    std::stringstream out;
    out << "frames: " << series.size() << ", skipped: " << skipped << std::endl
        << "values: " << stats.print() << std::endl
        << "largest rise: " << largest_rise << " at frame " << largest_rise_frame;
    return out.str();
}

VideoAnalyzer::VideoAnalyzer(const double _percentile, const bool _grayscale) :
    percentile_value(_percentile),
    grayscale(_grayscale) {}

AnalysisResult VideoAnalyzer::analyze(FrameSource &source, const std::string &name) const {
    AnalysisResult result;
    size_t failed_frames = 0;
    cv::Mat frame;
    while (true) {
        try {
            if (!source.next(frame)) {
                break;
            }
        }
        catch (cv::Exception const& e) {
            throw DecodeError("Reading video " + name + " failed: " + e.what());
        }
        try {
            double const value = percentile(toIntensity(frame, grayscale), percentile_value);
            result.series.push(value);
            result.stats.push_unsafe(value);
        }
        catch (DecodeError const& e) {
            failed_frames++;
            clog::L(__func__, 1) << "Skipping frame of " << name << ": " << e.what() << std::endl;
            continue;
        }
        catch (cv::Exception const& e) {
            failed_frames++;
            clog::L(__func__, 1) << "Skipping frame of " << name << ": " << e.what() << std::endl;
            continue;
        }
        if (progress_interval > 0 && result.series.size() % progress_interval == 0) {
            clog::L(__func__, 2) << name << ": processed " << result.series.size() << " frames..." << std::endl;
        }
    }
    result.skipped = source.skipped() + failed_frames;
    if (result.series.empty()) {
        throw DecodeError("No decodable frames in video " + name
                          + " (" + std::to_string(result.skipped) + " frames failed)");
    }
    result.largest_rise = result.series.largestRise(result.largest_rise_frame);
    return result;
}

AnalysisResult VideoAnalyzer::analyzeFile(const std::string &filename) const {
    VideoFrameSource source(filename);
    if (source.frameCountHint() > 0) {
        clog::L(__func__, 2) << filename << ": container reports " << source.frameCountHint() << " frames" << std::endl;
    }
    return analyze(source, filename);
}

void VideoAnalyzer::setProgressInterval(const size_t interval) {
    progress_interval = interval;
}

} // namespace detectlight
