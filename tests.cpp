#include <iostream>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include "detectlight.h"

namespace fs = boost::filesystem;

static std::random_device rd;
static std::mt19937_64 engine(rd());

/**
 * @brief The TempDir struct creates a fresh folder below the system temp directory and removes it afterwards.
 */
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / fs::unique_path("detectlight-test-%%%%-%%%%-%%%%");
        fs::create_directories(path);
    }

    ~TempDir() {
        boost::system::error_code ignore_error_code;
        fs::remove_all(path, ignore_error_code);
    }

    std::string file(std::string const& name) const {
        return (path / name).string();
    }
};

/**
 * @brief referencePercentile sorts all samples and interpolates, the textbook definition.
 */
double referencePercentile(cv::Mat const& mat, double const p) {
    cv::Mat_<double> converted;
    mat.clone().reshape(1, 1).convertTo(converted, CV_64F);
    std::vector<double> values(converted.begin(), converted.end());
    std::sort(values.begin(), values.end());
    double const rank = p * double(values.size() - 1) / 100.0;
    size_t const lower = size_t(std::floor(rank));
    size_t const upper = std::min(lower + 1, values.size() - 1);
    return values[lower] + (rank - double(lower)) * (values[upper] - values[lower]);
}

cv::Mat randomFrame(int const rows, int const cols, int const type) {
    cv::Mat result(rows, cols, type);
    cv::randu(result, cv::Scalar::all(0), cv::Scalar::all(CV_MAT_DEPTH(type) == CV_8U ? 256 : 1000));
    return result;
}

void writeFile(std::string const& filename, std::string const& content) {
    std::ofstream out(filename, std::ios::binary);
    out << content;
}

std::string readFile(std::string const& filename) {
    std::ifstream in(filename, std::ios::binary);
    std::stringstream result;
    result << in.rdbuf();
    return result.str();
}

::testing::AssertionResult ContiguousFromZero(detectlight::PercentileSeries const& series) {
    for (size_t ii = 0; ii < series.size(); ++ii) {
        if (series[ii].frame_index != ii) {
            return ::testing::AssertionFailure() << "Point #" << ii << " has frame index " << series[ii].frame_index;
        }
    }
    return ::testing::AssertionSuccess();
}

/**
 * @brief writeTestVideo writes an MJPG video where frames [0, switch_frame) are dark and the rest is bright.
 * @return false if OpenCV can't write the video.
 */
bool writeTestVideo(std::string const& filename,
                    size_t const num_frames,
                    size_t const switch_frame,
                    uint8_t const dark = 50,
                    uint8_t const bright = 200) {
    cv::VideoWriter writer;
    writer.open(filename, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), 10, cv::Size(64, 48), true);
    if (!writer.isOpened()) {
        return false;
    }
    for (size_t ii = 0; ii < num_frames; ++ii) {
        uint8_t const value = ii < switch_frame ? dark : bright;
        cv::Mat_<cv::Vec3b> frame(48, 64, cv::Vec3b(value, value, value));
        writer.write(frame);
    }
    writer.release();
    return fs::is_regular_file(filename) && fs::file_size(filename) > 0;
}

/**
 * @brief The ScriptedCapture class replays a list of per-frame outcomes instead of decoding a file.
 */
class ScriptedCapture : public cv::VideoCapture {
public:
    enum Outcome {Good, Empty, RetrieveThrows, GrabThrows};

    explicit ScriptedCapture(std::vector<Outcome> const& _script) : script(_script) {}

    bool isOpened() const override {
        return opened;
    }

    void release() override {
        opened = false;
        releases++;
    }

    bool grab() override {
        if (!opened || pos >= script.size()) {
            return false;
        }
        current = script[pos++];
        if (current == GrabThrows) {
            CV_Error(cv::Error::StsError, "grab failed");
        }
        return true;
    }

    bool retrieve(cv::OutputArray image, int) override {
        if (current == RetrieveThrows) {
            CV_Error(cv::Error::StsError, "retrieve failed");
        }
        if (current == Empty) {
            image.release();
            return false;
        }
        cv::Mat(4, 4, CV_8UC1, cv::Scalar::all(double(pos))).copyTo(image);
        return true;
    }

    double get(int) const override {
        return double(script.size());
    }

    std::vector<Outcome> script;
    Outcome current = Good;
    size_t pos = 0;
    size_t releases = 0;
    bool opened = true;
};

std::vector<ScriptedCapture::Outcome> repeat(ScriptedCapture::Outcome const outcome, size_t const count) {
    return std::vector<ScriptedCapture::Outcome>(count, outcome);
}

void append(std::vector<ScriptedCapture::Outcome> & script, std::vector<ScriptedCapture::Outcome> const& tail) {
    script.insert(script.end(), tail.begin(), tail.end());
}

/**
 * @brief The FailingSource class serves a few frames and then throws from next().
 */
class FailingSource : public detectlight::FrameSource {
public:
    bool next(cv::Mat & frame) override {
        if (served >= 2) {
            CV_Error(cv::Error::StsError, "demuxer failed");
        }
        frame = cv::Mat_<uint8_t>(4, 4, uint8_t(10 * ++served));
        return true;
    }

    size_t skipped() const override {
        return 0;
    }

private:
    int served = 0;
};

TEST(Percentile, two_by_two) {
    cv::Mat_<uint8_t> frame(2, 2);
    frame << 10, 20, 30, 40;
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame, 50), 25);
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame, 100), 40);
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame, 0), 10);
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame, 25), 17.5);

    cv::Mat_<float> frame_f(2, 2);
    frame_f << 10, 20, 30, 40;
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame_f, 50), 25);
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame_f, 100), 40);
    EXPECT_DOUBLE_EQ(detectlight::percentile(frame_f, 0), 10);
}

TEST(Percentile, single_pixel) {
    cv::Mat_<uint8_t> frame(1, 1, uint8_t(77));
    for (double const p : {0.0, 12.5, 50.0, 95.0, 100.0}) {
        EXPECT_DOUBLE_EQ(detectlight::percentile(frame, p), 77);
    }
}

TEST(Percentile, min_median_max) {
    for (int const type : {CV_8UC1, CV_8UC3, CV_16UC1, CV_32FC1}) {
        for (int const cols : {1, 7, 64}) {
            cv::Mat const frame = randomFrame(5, cols, type);
            double min = 0, max = 0;
            cv::minMaxLoc(frame.reshape(1), &min, &max);
            EXPECT_DOUBLE_EQ(detectlight::percentile(frame, 0), min);
            EXPECT_DOUBLE_EQ(detectlight::percentile(frame, 100), max);
            EXPECT_NEAR(detectlight::percentile(frame, 50), referencePercentile(frame, 50), 1e-9);
        }
    }
}

TEST(Percentile, matches_reference) {
    std::uniform_real_distribution<double> p_dist(0, 100);
    for (size_t ii = 0; ii < 200; ++ii) {
        int const type = (ii % 2 == 0) ? CV_8UC1 : CV_64FC1;
        cv::Mat const frame = randomFrame(1 + int(ii % 13), 1 + int(ii % 17), type);
        double const p = p_dist(engine);
        double const result = detectlight::percentile(frame, p);
        ASSERT_NEAR(result, referencePercentile(frame, p), 1e-9) << "p: " << p << ", type: " << type;

        double min = 0, max = 0;
        cv::minMaxLoc(frame, &min, &max);
        ASSERT_GE(result, min);
        ASSERT_LE(result, max);
    }
}

TEST(Percentile, histogram_and_sorting_agree) {
    cv::Mat const frame8 = randomFrame(37, 41, CV_8UC1);
    cv::Mat frame16;
    frame8.convertTo(frame16, CV_16U);
    for (double const p : {0.0, 1.0, 33.3, 50.0, 95.0, 99.9, 100.0}) {
        EXPECT_NEAR(detectlight::percentile(frame8, p), detectlight::percentile(frame16, p), 1e-9);
    }
}

TEST(Percentile, non_continuous_roi) {
    cv::Mat_<uint8_t> frame(10, 10, uint8_t(0));
    cv::Mat_<uint8_t> roi = frame(cv::Rect(2, 2, 2, 2));
    roi << 10, 20, 30, 40;
    ASSERT_FALSE(roi.isContinuous());
    EXPECT_DOUBLE_EQ(detectlight::percentile(roi, 50), 25);

    cv::Mat_<float> frame_f(10, 10, 0.0f);
    cv::Mat_<float> roi_f = frame_f(cv::Rect(2, 2, 2, 2));
    roi_f << 10, 20, 30, 40;
    EXPECT_DOUBLE_EQ(detectlight::percentile(roi_f, 50), 25);
}

TEST(Percentile, errors) {
    cv::Mat_<uint8_t> frame(2, 2, uint8_t(5));
    EXPECT_THROW(detectlight::percentile(frame, -0.1), detectlight::InputError);
    EXPECT_THROW(detectlight::percentile(frame, 100.1), detectlight::InputError);
    EXPECT_THROW(detectlight::percentile(frame, std::nan("")), detectlight::InputError);
    EXPECT_THROW(detectlight::percentile(cv::Mat(), 50), detectlight::DecodeError);
}

TEST(Percentile, rank) {
    EXPECT_DOUBLE_EQ(detectlight::percentileRank(4, 50), 1.5);
    EXPECT_DOUBLE_EQ(detectlight::percentileRank(4, 100), 3);
    EXPECT_DOUBLE_EQ(detectlight::percentileRank(1, 95), 0);
    EXPECT_DOUBLE_EQ(detectlight::percentileRank(101, 95), 95);
}

TEST(Intensity, grayscale) {
    cv::Mat_<cv::Vec3b> red(3, 3, cv::Vec3b(0, 0, 255));
    cv::Mat const gray = detectlight::toIntensity(red, true);
    ASSERT_EQ(gray.channels(), 1);
    EXPECT_EQ(gray.size(), red.size());
    EXPECT_NEAR(detectlight::percentile(gray, 50), 0.299*255, 1);

    cv::Mat_<cv::Vec4b> bgra(3, 3, cv::Vec4b(100, 100, 100, 255));
    EXPECT_NEAR(detectlight::percentile(detectlight::toIntensity(bgra, true), 50), 100, 1);

    cv::Mat_<uint8_t> single(3, 3, uint8_t(42));
    EXPECT_TRUE(detectlight::toIntensity(single, true).data == single.data);
}

TEST(Intensity, pooled_channels) {
    cv::Mat_<cv::Vec3b> frame(4, 4, cv::Vec3b(10, 20, 30));
    cv::Mat const pooled = detectlight::toIntensity(frame, false);
    ASSERT_EQ(pooled.channels(), 3);
    EXPECT_DOUBLE_EQ(detectlight::percentile(pooled, 0), 10);
    EXPECT_DOUBLE_EQ(detectlight::percentile(pooled, 50), 20);
    EXPECT_DOUBLE_EQ(detectlight::percentile(pooled, 100), 30);
}

TEST(PercentileSeries, push_and_append) {
    detectlight::PercentileSeries series;
    EXPECT_TRUE(series.empty());
    series.push(1.5);
    series.push(2.5);
    series.push(0.5);
    ASSERT_EQ(series.size(), 3);
    EXPECT_TRUE(ContiguousFromZero(series));
    EXPECT_DOUBLE_EQ(series[1].value, 2.5);

    EXPECT_THROW(series.append(2, 7), std::logic_error);
    EXPECT_THROW(series.append(1, 7), std::logic_error);
    series.append(10, 7);
    EXPECT_EQ(series[3].frame_index, 10);
    series.push(8);
    EXPECT_EQ(series[4].frame_index, 11);
}

TEST(PercentileSeries, largestRise) {
    detectlight::PercentileSeries series;
    size_t frame = 99;
    EXPECT_DOUBLE_EQ(series.largestRise(frame), 0);
    for (double const v : {5.0, 5.0, 4.0, 40.0, 41.0, 10.0}) {
        series.push(v);
    }
    EXPECT_DOUBLE_EQ(series.largestRise(frame), 36);
    EXPECT_EQ(frame, 3);
}

TEST(Config, validate) {
    detectlight::Config config;
    EXPECT_THROW(config.validate(), detectlight::InputError);
    config.input_dir = "videos";
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.outputDir(), "videos");
    EXPECT_EQ(config.logFile(), (fs::path("videos") / "detectlight.log").string());

    config.output_dir = "out";
    EXPECT_EQ(config.outputDir(), "out");

    config.percentile = 100.5;
    EXPECT_THROW(config.validate(), detectlight::InputError);
    config.percentile = -1;
    EXPECT_THROW(config.validate(), detectlight::InputError);
    config.percentile = 0;
    EXPECT_NO_THROW(config.validate());

    config.precision = 30;
    EXPECT_THROW(config.validate(), detectlight::InputError);
    config.precision = 3;

    config.extensions.clear();
    EXPECT_THROW(config.validate(), detectlight::InputError);
    config.setExtensions({" .MOV", "MP4, avi;", "mp4"});
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.extensions, std::vector<std::string>({".mov", ".mp4", ".avi"}));
}

TEST(Config, isVideo) {
    detectlight::Config config;
    EXPECT_TRUE(config.isVideo("a/b/clip.mp4"));
    EXPECT_TRUE(config.isVideo("clip.MP4"));
    EXPECT_TRUE(config.isVideo("clip.Mkv"));
    EXPECT_FALSE(config.isVideo("clip.mp4.csv"));
    EXPECT_FALSE(config.isVideo("clip"));
    EXPECT_FALSE(config.isVideo("notes.txt"));
}

TEST(Config, formatPercentile) {
    EXPECT_EQ(detectlight::formatPercentile(95), "95");
    EXPECT_EQ(detectlight::formatPercentile(99.5), "99.5");
    EXPECT_EQ(detectlight::formatPercentile(0), "0");
    EXPECT_EQ(detectlight::formatPercentile(100), "100");
    EXPECT_EQ(detectlight::formatPercentile(20), "20");
    EXPECT_EQ(detectlight::formatPercentile(0.25), "0.25");

    // No rounding to six significant digits.
    EXPECT_EQ(detectlight::formatPercentile(99.9999999), "99.9999999");
    EXPECT_EQ(detectlight::formatPercentile(12.3456789), "12.3456789");
    EXPECT_EQ(detectlight::formatPercentile(12.3457), "12.3457");
    EXPECT_NE(detectlight::formatPercentile(12.3456789), detectlight::formatPercentile(12.3457));

    std::uniform_real_distribution<double> dist(0, 100);
    for (size_t ii = 0; ii < 1000; ++ii) {
        double const p = dist(engine);
        std::string const formatted = detectlight::formatPercentile(p);
        EXPECT_EQ(std::stod(formatted), p) << formatted;
    }
}

TEST(VideoAnalyzer, skips_bad_frames) {
    std::vector<cv::Mat> frames;
    frames.push_back(cv::Mat_<uint8_t>(4, 4, uint8_t(10)));
    frames.push_back(cv::Mat());
    frames.push_back(cv::Mat_<uint8_t>(4, 4, uint8_t(20)));
    frames.push_back(cv::Mat(4, 4, CV_8UC2, cv::Scalar::all(1)));
    frames.push_back(cv::Mat_<cv::Vec3b>(4, 4, cv::Vec3b(30, 30, 30)));

    detectlight::MatFrameSource source(frames);
    detectlight::VideoAnalyzer analyzer(50, true);
    detectlight::AnalysisResult const result = analyzer.analyze(source, "synthetic");

    ASSERT_EQ(result.series.size(), 3);
    EXPECT_EQ(result.skipped, 2);
    EXPECT_TRUE(ContiguousFromZero(result.series));
    EXPECT_DOUBLE_EQ(result.series[0].value, 10);
    EXPECT_DOUBLE_EQ(result.series[1].value, 20);
    EXPECT_NEAR(result.series[2].value, 30, 1);
    EXPECT_EQ(result.stats.getCount(), 3);
    EXPECT_NEAR(result.largest_rise, 10, 1);
    EXPECT_EQ(result.largest_rise_frame, 1);

    cv::Mat frame;
    EXPECT_FALSE(source.next(frame));
}

TEST(VideoAnalyzer, no_frames) {
    detectlight::VideoAnalyzer analyzer(95, true);
    detectlight::MatFrameSource empty((std::vector<cv::Mat>()));
    EXPECT_THROW(analyzer.analyze(empty), detectlight::DecodeError);
    detectlight::MatFrameSource broken({cv::Mat(), cv::Mat()});
    EXPECT_THROW(analyzer.analyze(broken), detectlight::DecodeError);
}

TEST(VideoAnalyzer, missing_file) {
    TempDir dir;
    detectlight::VideoAnalyzer analyzer(95, true);
    EXPECT_THROW(analyzer.analyzeFile(dir.file("missing.mp4")), detectlight::DecodeError);
    EXPECT_THROW(detectlight::VideoFrameSource(dir.file("missing.mp4")), detectlight::DecodeError);
}

TEST(VideoAnalyzer, video_file) {
    TempDir dir;
    std::string const video = dir.file("light.avi");
    if (!writeTestVideo(video, 10, 6)) {
        GTEST_SKIP() << "OpenCV can't write MJPG videos here";
    }
    {
        detectlight::VideoFrameSource source(video);
        EXPECT_TRUE(source.isOpen());
        cv::Mat frame;
        size_t count = 0;
        while (source.next(frame)) {
            count++;
        }
        EXPECT_EQ(count, 10);
        EXPECT_FALSE(source.isOpen());
        EXPECT_FALSE(source.next(frame));
    }
    detectlight::VideoAnalyzer analyzer(95, true);
    detectlight::AnalysisResult const result = analyzer.analyzeFile(video);
    ASSERT_EQ(result.series.size(), 10);
    EXPECT_TRUE(ContiguousFromZero(result.series));
    for (size_t ii = 0; ii < result.series.size(); ++ii) {
        EXPECT_NEAR(result.series[ii].value, ii < 6 ? 50 : 200, 3) << "frame " << ii;
    }
    EXPECT_EQ(result.largest_rise_frame, 6);
}

TEST(VideoFrameSource, consecutive_failure_limit) {
    size_t const limit = detectlight::VideoFrameSource::max_consecutive_failures;
    std::vector<ScriptedCapture::Outcome> script = repeat(ScriptedCapture::Good, 2);
    append(script, repeat(ScriptedCapture::Empty, limit));
    append(script, repeat(ScriptedCapture::Good, 3));
    cv::Ptr<ScriptedCapture> capture = cv::makePtr<ScriptedCapture>(script);

    detectlight::VideoFrameSource source(capture, "scripted");
    EXPECT_EQ(source.frameCountHint(), script.size());
    cv::Mat frame;
    size_t count = 0;
    while (source.next(frame)) {
        count++;
    }
    EXPECT_EQ(count, 2);
    EXPECT_EQ(source.skipped(), limit);
    EXPECT_EQ(capture->pos, 2 + limit);
    EXPECT_FALSE(source.isOpen());
    EXPECT_EQ(capture->releases, 1);
    EXPECT_FALSE(source.next(frame));
}

TEST(VideoFrameSource, failures_below_limit) {
    size_t const limit = detectlight::VideoFrameSource::max_consecutive_failures;
    std::vector<ScriptedCapture::Outcome> script = repeat(ScriptedCapture::Good, 1);
    for (size_t ii = 0; ii + 1 < limit; ++ii) {
        append(script, repeat(ii % 3 == 0 ? ScriptedCapture::Empty
                                          : (ii % 3 == 1 ? ScriptedCapture::RetrieveThrows : ScriptedCapture::GrabThrows), 1));
    }
    append(script, repeat(ScriptedCapture::Good, 1));
    // The counter starts over after every good frame.
    append(script, repeat(ScriptedCapture::Empty, limit - 1));
    append(script, repeat(ScriptedCapture::Good, 1));
    cv::Ptr<ScriptedCapture> capture = cv::makePtr<ScriptedCapture>(script);

    detectlight::VideoFrameSource source(capture, "scripted");
    std::vector<double> values;
    cv::Mat frame;
    while (source.next(frame)) {
        values.push_back(frame.at<uint8_t>(0, 0));
    }
    ASSERT_EQ(values.size(), 3);
    EXPECT_EQ(values[0], 1);
    EXPECT_EQ(values[1], 1 + limit);
    EXPECT_EQ(values[2], 2 * limit + 1);
    EXPECT_EQ(source.skipped(), 2 * (limit - 1));
    EXPECT_EQ(capture->pos, script.size());
    EXPECT_EQ(capture->releases, 1);
}

TEST(VideoFrameSource, released_when_destroyed_early) {
    cv::Ptr<ScriptedCapture> capture = cv::makePtr<ScriptedCapture>(repeat(ScriptedCapture::Good, 10));
    {
        detectlight::VideoFrameSource source(capture, "scripted");
        cv::Mat frame;
        EXPECT_TRUE(source.next(frame));
        EXPECT_TRUE(source.next(frame));
        EXPECT_TRUE(source.isOpen());
        EXPECT_EQ(capture->releases, 0);
    }
    EXPECT_FALSE(capture->isOpened());
    EXPECT_EQ(capture->releases, 1);
    EXPECT_EQ(capture->pos, 2);
}

TEST(VideoFrameSource, not_opened) {
    cv::Ptr<ScriptedCapture> capture = cv::makePtr<ScriptedCapture>(repeat(ScriptedCapture::Good, 10));
    capture->opened = false;
    EXPECT_THROW(detectlight::VideoFrameSource(capture, "closed"), detectlight::DecodeError);
    EXPECT_THROW(detectlight::VideoFrameSource(cv::Ptr<cv::VideoCapture>(), "null"), detectlight::DecodeError);
}

TEST(VideoFrameSource, partially_read_video) {
    TempDir dir;
    std::string const video = dir.file("partial.avi");
    if (!writeTestVideo(video, 10, 6)) {
        GTEST_SKIP() << "OpenCV can't write MJPG videos here";
    }
    {
        detectlight::VideoFrameSource source(video);
        cv::Mat frame;
        for (size_t ii = 0; ii < 3; ++ii) {
            ASSERT_TRUE(source.next(frame));
        }
        EXPECT_TRUE(source.isOpen());
        source.release();
        EXPECT_FALSE(source.isOpen());
        EXPECT_FALSE(source.next(frame));
        EXPECT_EQ(source.skipped(), 0);
    }
    {
        detectlight::VideoFrameSource source(video);
        cv::Mat frame;
        ASSERT_TRUE(source.next(frame));
        EXPECT_TRUE(source.isOpen());
    }
    detectlight::VideoFrameSource source(video);
    cv::Mat frame;
    size_t count = 0;
    while (source.next(frame)) {
        count++;
    }
    EXPECT_EQ(count, 10);
}

TEST(VideoAnalyzer, grab_exceptions_skip_frames) {
    std::vector<ScriptedCapture::Outcome> script = repeat(ScriptedCapture::Good, 3);
    append(script, repeat(ScriptedCapture::GrabThrows, 2));
    append(script, repeat(ScriptedCapture::RetrieveThrows, 1));
    append(script, repeat(ScriptedCapture::Good, 2));
    detectlight::VideoFrameSource source(cv::makePtr<ScriptedCapture>(script), "scripted");

    detectlight::VideoAnalyzer analyzer(50, true);
    detectlight::AnalysisResult const result = analyzer.analyze(source, "scripted");
    ASSERT_EQ(result.series.size(), 5);
    EXPECT_EQ(result.skipped, 3);
    EXPECT_TRUE(ContiguousFromZero(result.series));
    EXPECT_DOUBLE_EQ(result.series[2].value, 3);
    EXPECT_DOUBLE_EQ(result.series[3].value, 7);
}

TEST(VideoAnalyzer, source_exception) {
    FailingSource source;
    detectlight::VideoAnalyzer analyzer(50, true);
    EXPECT_THROW(analyzer.analyze(source, "failing"), detectlight::DecodeError);
}

TEST(OutputWriter, names) {
    detectlight::OutputWriter writer("out", 95, 6, false);
    EXPECT_EQ(writer.csvPath("/data/videos/clip.mp4"), (fs::path("out") / "clip_percentile95.csv").string());
    EXPECT_EQ(writer.plotPath("clip.MOV"), (fs::path("out") / "clip_percentile95.png").string());

    detectlight::OutputWriter writer2("out", 99.5, 6, false);
    EXPECT_EQ(writer2.csvPath("a.b.mkv"), (fs::path("out") / "a.b_percentile99.5.csv").string());

    detectlight::OutputWriter writer3("out", 99.9999999, 6, false);
    EXPECT_EQ(writer3.plotPath("clip.mp4"), (fs::path("out") / "clip_percentile99.9999999.png").string());
}

TEST(OutputWriter, formatCsv) {
    detectlight::PercentileSeries series;
    series.push(25);
    series.push(1.0/3.0);
    detectlight::OutputWriter writer("out", 50, 3, false);
    EXPECT_EQ(writer.formatCsv(series), "frame_index,value\n0,25.000\n1,0.333\n");
}

TEST(OutputWriter, roundtrip_and_idempotence) {
    TempDir dir;
    std::uniform_real_distribution<double> value_dist(0, 255);
    detectlight::PercentileSeries series;
    for (size_t ii = 0; ii < 500; ++ii) {
        series.push(value_dist(engine));
    }
    int const precision = 6;
    detectlight::OutputWriter writer((dir.path / "out").string(), 95, precision, false);
    writer.write("video.mp4", series);

    std::string const csv = writer.csvPath("video.mp4");
    ASSERT_TRUE(fs::is_regular_file(csv));
    EXPECT_FALSE(fs::exists(writer.plotPath("video.mp4")));
    EXPECT_FALSE(fs::exists(csv + ".tmp"));

    detectlight::PercentileSeries const read = detectlight::readSeriesCsv(csv);
    ASSERT_EQ(read.size(), series.size());
    for (size_t ii = 0; ii < series.size(); ++ii) {
        EXPECT_EQ(read[ii].frame_index, series[ii].frame_index);
        EXPECT_NEAR(read[ii].value, series[ii].value, 0.5 * std::pow(10.0, -precision) + 1e-12);
    }

    std::string const first = readFile(csv);
    writeFile(csv, "garbage");
    writer.write("video.mp4", series);
    EXPECT_EQ(readFile(csv), first);
}

TEST(OutputWriter, unwritable) {
    TempDir dir;
    std::string const blocker = dir.file("not-a-folder");
    writeFile(blocker, "x");
    detectlight::PercentileSeries series;
    series.push(1);
    detectlight::OutputWriter writer((fs::path(blocker) / "out").string(), 95, 6, false);
    EXPECT_THROW(writer.write("video.mp4", series), detectlight::WriteError);
}

TEST(OutputWriter, plot) {
    if (std::system("gnuplot --version > /dev/null 2>&1") != 0) {
        GTEST_SKIP() << "gnuplot not available";
    }
    TempDir dir;
    detectlight::PercentileSeries series;
    for (size_t ii = 0; ii < 100; ++ii) {
        series.push(ii < 50 ? 20 : 180);
    }
    detectlight::OutputWriter writer(dir.path.string(), 95, 6, true);
    writer.write("it's a video.mp4", series);
    EXPECT_TRUE(fs::is_regular_file(writer.csvPath("it's a video.mp4")));
    std::string const png = writer.plotPath("it's a video.mp4");
    ASSERT_TRUE(fs::is_regular_file(png));
    EXPECT_EQ(readFile(png).substr(1, 3), "PNG");
}

TEST(OutputWriter, missing_gnuplot) {
    TempDir dir;
    detectlight::PercentileSeries series;
    // More data than fits into a pipe buffer.
    for (size_t ii = 0; ii < 100000; ++ii) {
        series.push(ii % 256);
    }
    detectlight::OutputWriter writer(dir.path.string(), 95, 6, true);
    writer.setGnuplotCommand("detectlight-missing-gnuplot 2> /dev/null");

    std::signal(SIGPIPE, SIG_DFL);
    EXPECT_THROW(writer.writePlot("long.mp4", series), detectlight::WriteError);

    // Artifacts of an earlier run don't survive a failed plot.
    std::string const csv = writer.csvPath("long.mp4");
    std::string const png = writer.plotPath("long.mp4");
    writeFile(csv, "old table");
    writeFile(png, "old plot");
    EXPECT_THROW(writer.write("long.mp4", series), detectlight::WriteError);
    EXPECT_FALSE(fs::exists(csv));
    EXPECT_FALSE(fs::exists(png));
    EXPECT_FALSE(fs::exists(csv + ".tmp"));
    EXPECT_FALSE(fs::exists(png + ".tmp.png"));

    void (*const handler)(int) = std::signal(SIGPIPE, SIG_DFL);
    EXPECT_TRUE(handler == SIG_DFL);
}

TEST(readSeriesCsv, malformed) {
    TempDir dir;
    EXPECT_THROW(detectlight::readSeriesCsv(dir.file("missing.csv")), detectlight::InputError);

    writeFile(dir.file("noheader.csv"), "0,1.0\n");
    EXPECT_THROW(detectlight::readSeriesCsv(dir.file("noheader.csv")), detectlight::InputError);

    writeFile(dir.file("bad.csv"), "frame_index,value\n0,1.0\nfoo\n");
    EXPECT_THROW(detectlight::readSeriesCsv(dir.file("bad.csv")), detectlight::InputError);

    writeFile(dir.file("order.csv"), "frame_index,value\n1,1.0\n0,2.0\n");
    EXPECT_THROW(detectlight::readSeriesCsv(dir.file("order.csv")), detectlight::InputError);

    writeFile(dir.file("crlf.csv"), "frame_index,value\r\n0,1.5\r\n1,2.5\r\n");
    detectlight::PercentileSeries const series = detectlight::readSeriesCsv(dir.file("crlf.csv"));
    ASSERT_EQ(series.size(), 2);
    EXPECT_DOUBLE_EQ(series[1].value, 2.5);
}

TEST(BatchRunner, empty_folder) {
    TempDir dir;
    writeFile(dir.file("notes.txt"), "no video here");
    fs::create_directories(dir.path / "sub.mp4");
    detectlight::Config config;
    config.input_dir = dir.path.string();
    config.validate();
    detectlight::BatchRunner runner(config);
    EXPECT_THROW(runner.scan(), detectlight::InputError);
    EXPECT_THROW(runner.run(), detectlight::InputError);

    size_t num_entries = 0;
    for (fs::directory_iterator it(dir.path), end; it != end; ++it) {
        num_entries++;
    }
    EXPECT_EQ(num_entries, 2);
}

TEST(BatchRunner, missing_folder) {
    TempDir dir;
    detectlight::Config config;
    config.input_dir = dir.file("missing");
    config.validate();
    detectlight::BatchRunner runner(config);
    EXPECT_THROW(runner.scan(), detectlight::InputError);
}

TEST(BatchRunner, scan_order_and_filter) {
    TempDir dir;
    for (std::string const name : {"c.MP4", "a.avi", "b.mkv", "b.txt", "d.mp4.csv"}) {
        writeFile(dir.file(name), "x");
    }
    fs::create_directories(dir.path / "sub");
    writeFile((dir.path / "sub" / "e.mp4").string(), "x");

    detectlight::Config config;
    config.input_dir = dir.path.string();
    config.validate();
    std::vector<std::string> const files = detectlight::BatchRunner(config).scan();
    ASSERT_EQ(files.size(), 3);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "a.avi");
    EXPECT_EQ(fs::path(files[1]).filename().string(), "b.mkv");
    EXPECT_EQ(fs::path(files[2]).filename().string(), "c.MP4");

    config.setExtensions({"mkv"});
    config.validate();
    std::vector<std::string> const mkv = detectlight::BatchRunner(config).scan();
    ASSERT_EQ(mkv.size(), 1);
    EXPECT_EQ(fs::path(mkv[0]).filename().string(), "b.mkv");
}

TEST(BatchRunner, valid_and_corrupted) {
    TempDir dir;
    if (!writeTestVideo(dir.file("good.avi"), 12, 4)) {
        GTEST_SKIP() << "OpenCV can't write MJPG videos here";
    }
    std::string garbage(4096, '\0');
    std::uniform_int_distribution<int> byte_dist(0, 255);
    for (char& c : garbage) {
        c = char(byte_dist(engine));
    }
    writeFile(dir.file("bad.mp4"), garbage);

    detectlight::Config config;
    config.input_dir = dir.path.string();
    config.output_dir = (dir.path / "results").string();
    config.percentile = 95;
    config.plot = false;
    config.validate();

    detectlight::BatchRunner runner(config);
    detectlight::BatchSummary const summary = runner.run();
    ASSERT_EQ(summary.numProcessed(), 2);
    ASSERT_EQ(summary.succeeded.size(), 1);
    ASSERT_EQ(summary.failed.size(), 1);
    EXPECT_EQ(fs::path(summary.succeeded[0].filename).filename().string(), "good.avi");
    EXPECT_EQ(summary.succeeded[0].frames, 12);
    EXPECT_EQ(fs::path(summary.failed[0].filename).filename().string(), "bad.mp4");
    EXPECT_EQ(summary.failed[0].kind, "DecodeError");
    EXPECT_FALSE(summary.failed[0].reason.empty());

    EXPECT_EQ(summary.exitCode(false), 0);
    EXPECT_EQ(summary.exitCode(true), 3);

    detectlight::OutputWriter const writer(config.outputDir(), config.percentile, config.precision, false);
    std::string const good_csv = writer.csvPath("good.avi");
    ASSERT_TRUE(fs::is_regular_file(good_csv));
    EXPECT_FALSE(fs::exists(writer.csvPath("bad.mp4")));

    detectlight::PercentileSeries const series = detectlight::readSeriesCsv(good_csv);
    ASSERT_EQ(series.size(), 12);
    EXPECT_TRUE(ContiguousFromZero(series));
    EXPECT_NEAR(series[0].value, 50, 3);
    EXPECT_NEAR(series[11].value, 200, 3);

    std::string const first = readFile(good_csv);
    detectlight::BatchSummary const second = runner.run();
    EXPECT_EQ(second.succeeded.size(), 1);
    EXPECT_EQ(readFile(good_csv), first);

    std::stringstream text;
    summary.print(text);
    EXPECT_NE(text.str().find("1 succeeded, 1 failed"), std::string::npos);
}

TEST(BatchSummary, exitCode) {
    detectlight::BatchSummary summary;
    EXPECT_EQ(summary.exitCode(true), 0);
    detectlight::FileReport ok;
    ok.success = true;
    summary.add(ok);
    EXPECT_EQ(summary.exitCode(true), 0);
    summary.add(detectlight::FileReport());
    EXPECT_EQ(summary.exitCode(false), 0);
    EXPECT_EQ(summary.exitCode(true), 3);
}

TEST(Error, kinds) {
    EXPECT_EQ(detectlight::InputError("x").kindName(), "InputError");
    EXPECT_EQ(detectlight::DecodeError("x").kindName(), "DecodeError");
    EXPECT_EQ(detectlight::WriteError("x").kindName(), "WriteError");
    EXPECT_EQ(detectlight::WriteError("x").kind(), detectlight::Error::Write);
    try {
        throw detectlight::DecodeError("broken");
    }
    catch (detectlight::Error const& e) {
        EXPECT_STREQ(e.what(), "broken");
    }
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    int const result = RUN_ALL_TESTS();
    std::cout << "RUN_ALL_TESTS return value: " << result << std::endl;
    return result;
}
