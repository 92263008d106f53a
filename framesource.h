#ifndef DETECTLIGHT_FRAMESOURCE_H
#define DETECTLIGHT_FRAMESOURCE_H

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace detectlight {

/**
 * @brief The FrameSource class is a finite, pull-based sequence of frames in decode order.
 * Once next() returned false the source is exhausted and stays exhausted,
 * a new source has to be constructed in order to read the frames again.
 */
class FrameSource {
public:
    virtual ~FrameSource() {}

    /**
     * @brief next decodes the next frame.
     * @param[out] frame receives the frame, the previous content is overwritten.
     * @return false if there are no more frames.
     */
    virtual bool next(cv::Mat & frame) = 0;

    /**
     * @brief skipped returns the number of frames which could not be decoded and were left out.
     */
    virtual size_t skipped() const = 0;
};

/**
 * @brief The VideoFrameSource class reads a video file using cv::VideoCapture.
 * The capture handle is owned exclusively and released as soon as the sequence
 * is exhausted or the source is destroyed, whichever happens first.
 */
class VideoFrameSource : public FrameSource {
public:
    /**
     * @brief max_consecutive_failures Number of frames in a row which may fail to decode
     * before the remainder of the video is considered unreadable.
     */
    static const size_t max_consecutive_failures = 64;

    /**
     * @brief VideoFrameSource opens the video.
     * @throws DecodeError if the file can't be opened or no decoder is available.
     */
    explicit VideoFrameSource(std::string const& filename);

    /**
     * @brief VideoFrameSource takes over an already opened capture, name is used in log messages.
     * @throws DecodeError if the capture is null or not opened.
     */
    VideoFrameSource(cv::Ptr<cv::VideoCapture> _capture, std::string const& name);
    ~VideoFrameSource() override;

    VideoFrameSource(VideoFrameSource const&) = delete;
    void operator=(VideoFrameSource const&) = delete;

    bool next(cv::Mat & frame) override;

    size_t skipped() const override;

    bool isOpen() const;

    /**
     * @brief frameCountHint returns the number of frames reported by the container.
     * This is only an estimate, some containers report nothing or a wrong number.
     */
    size_t frameCountHint() const;

    void release();

private:
    std::string filename;
    cv::Ptr<cv::VideoCapture> capture;
    size_t num_skipped = 0;
    size_t frame_count_hint = 0;
    bool exhausted = false;

    void checkOpened();
};

/**
 * @brief The MatFrameSource class serves frames from memory, mostly for synthetic input.
 * Empty matrices in the list are reported as frames which failed to decode.
 */
class MatFrameSource : public FrameSource {
public:
    explicit MatFrameSource(std::vector<cv::Mat> const& _frames);

    bool next(cv::Mat & frame) override;

    size_t skipped() const override;

private:
    std::vector<cv::Mat> frames;
    size_t pos = 0;
    size_t num_skipped = 0;
};

} // namespace detectlight

#endif // DETECTLIGHT_FRAMESOURCE_H
