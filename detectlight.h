#ifndef DETECTLIGHT_H
#define DETECTLIGHT_H

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <boost/filesystem.hpp>

#include <runningstats/runningstats.h>

#include "framesource.h"
#include "percentile.h"

namespace detectlight {
namespace fs = boost::filesystem;

/**
 * @brief The Error class is the common base of all errors reported per file or per run.
 */
class Error : public std::runtime_error {
public:
    enum Kind {
        Input,
        Decode,
        Write
    };

    Error(Kind const _kind, std::string const& what);

    Kind kind() const;

    /**
     * @brief kindName returns "InputError", "DecodeError" or "WriteError".
     */
    std::string kindName() const;

    static std::string kindName(Kind const kind);

private:
    Kind error_kind;
};

/**
 * @brief InputError: the input folder is missing, unreadable, contains no video, or the configuration is invalid.
 * Fatal for the whole run.
 */
class InputError : public Error {
public:
    explicit InputError(std::string const& what);
};

/**
 * @brief DecodeError: a video or a single frame can't be decoded.
 */
class DecodeError : public Error {
public:
    explicit DecodeError(std::string const& what);
};

/**
 * @brief WriteError: an output artifact can't be written.
 */
class WriteError : public Error {
public:
    explicit WriteError(std::string const& what);
};

/**
 * @brief The Config struct holds all parameters of one batch run.
 * It is filled once at startup and validated before anything is read.
 */
struct Config {
    std::string input_dir;

    /**
     * @brief percentile in [0, 100], the same for all videos of the run.
     */
    double percentile = 95;

    /**
     * @brief output_dir Folder for the CSV and plot files. Empty means input_dir.
     */
    std::string output_dir;

    /**
     * @brief extensions Lower case file extensions including the leading dot.
     */
    std::vector<std::string> extensions = defaultExtensions();

    bool grayscale = true;

    bool plot = true;

    /**
     * @brief strict If true any failed file results in a non-zero exit status.
     */
    bool strict = false;

    /**
     * @brief precision Number of digits after the decimal point in the CSV export.
     */
    int precision = 6;

    /**
     * @brief log_file Empty means detectlight.log in the output folder.
     */
    std::string log_file;

    static std::vector<std::string> defaultExtensions();

    /**
     * @brief normalizeExtension converts "MP4", ".Mp4" etc. to ".mp4".
     */
    static std::string normalizeExtension(std::string ext);

    /**
     * @brief setExtensions replaces the extension list, splitting entries at commas and semicolons.
     */
    void setExtensions(std::vector<std::string> const& args);

    /**
     * @brief validate checks all parameters and normalizes the extension list.
     * @throws InputError describing the first problem found.
     */
    void validate();

    std::string outputDir() const;

    std::string logFile() const;

    /**
     * @brief isVideo checks the extension of a path against the list, ignoring case.
     */
    bool isVideo(fs::path const& path) const;

    void print(std::ostream& out) const;
};

/**
 * @brief formatPercentile formats a percentile for use in file names: 95 -> "95", 99.5 -> "99.5".
 * Uses the shortest representation which parses back to exactly p, so distinct values get distinct names.
 */
std::string formatPercentile(double const p);

struct SeriesPoint {
    size_t frame_index = 0;
    double value = 0;

    SeriesPoint(size_t const _frame_index, double const _value);
    SeriesPoint();
};

/**
 * @brief The PercentileSeries class stores one value per decoded frame of a video, in decode order.
 * Frame indices are strictly increasing.
 */
class PercentileSeries {
public:
    /**
     * @brief append adds a point.
     * @throws std::logic_error if frame_index isn't larger than the last index.
     */
    void append(size_t const frame_index, double const value);

    /**
     * @brief push appends the value using the next contiguous frame index.
     */
    void push(double const value);

    size_t size() const;
    bool empty() const;

    SeriesPoint const& operator[](size_t const index) const;

    std::vector<SeriesPoint>::const_iterator begin() const;
    std::vector<SeriesPoint>::const_iterator end() const;

    std::vector<SeriesPoint> const& points() const;

    /**
     * @brief largestRise finds the largest increase between two consecutive points.
     * @param[out] frame_index index of the second frame of the pair.
     * @return the increase, 0 if the series never increases.
     */
    double largestRise(size_t & frame_index) const;

private:
    std::vector<SeriesPoint> data;
};

/**
 * @brief readSeriesCsv parses a CSV file written by OutputWriter::writeCsv.
 * @throws InputError if the file can't be read or is malformed.
 */
PercentileSeries readSeriesCsv(std::string const& filename);

struct AnalysisResult {
    PercentileSeries series;

    /**
     * @brief skipped Number of frames which failed to decode and are missing in the series.
     */
    size_t skipped = 0;

    runningstats::RunningStats stats;

    size_t largest_rise_frame = 0;
    double largest_rise = 0;

    std::string print() const;
};

class VideoAnalyzer {
public:
    VideoAnalyzer(double const _percentile, bool const _grayscale);

    /**
     * @brief analyze pulls all frames from the source and reduces each of them to its percentile value.
     * Frames which can't be processed are skipped and don't get an index.
     * @throws DecodeError if not a single frame could be processed or the source itself fails.
     */
    AnalysisResult analyze(FrameSource & source, std::string const& name = "") const;

    /**
     * @brief analyzeFile opens the video and runs analyze() on it. The video is closed before returning.
     * @throws DecodeError if the video can't be opened or yields no frames.
     */
    AnalysisResult analyzeFile(std::string const& filename) const;

    void setProgressInterval(size_t const interval);

private:
    double percentile_value;
    bool grayscale;
    size_t progress_interval = 500;
};

class OutputWriter {
public:
    OutputWriter(std::string const& _output_dir, double const _percentile, int const _precision, bool const _plot);

    /**
     * @brief csvPath returns <output_dir>/<stem>_percentile<P>.csv
     */
    std::string csvPath(std::string const& video) const;

    /**
     * @brief plotPath returns <output_dir>/<stem>_percentile<P>.png
     */
    std::string plotPath(std::string const& video) const;

    /**
     * @brief write writes the CSV export and, if enabled, the plot. Existing files are replaced.
     * If the plot fails both artifacts of the video are removed, including those of earlier runs.
     * @throws WriteError
     */
    void write(std::string const& video, PercentileSeries const& series) const;

    void writeCsv(std::string const& video, PercentileSeries const& series) const;

    void writePlot(std::string const& video, PercentileSeries const& series) const;

    /**
     * @brief formatCsv renders the CSV content: header "frame_index,value", one row per point,
     * values in fixed notation with the configured number of decimals.
     */
    std::string formatCsv(PercentileSeries const& series) const;

    /**
     * @brief setGnuplotCommand sets the command used for plotting, default is "gnuplot".
     */
    void setGnuplotCommand(std::string const& command);

private:
    std::string output_dir;
    double percentile_value;
    int precision;
    bool plot;
    std::string gnuplot_command = "gnuplot";

    fs::path artifactPath(std::string const& video, std::string const& extension) const;

    void ensureOutputDir() const;
};

struct FileReport {
    std::string filename;
    bool success = false;

    /**
     * @brief kind Name of the error category for failed files.
     */
    std::string kind;
    std::string reason;
    size_t frames = 0;
    size_t skipped = 0;
};

struct BatchSummary {
    std::vector<FileReport> succeeded;
    std::vector<FileReport> failed;

    void add(FileReport const& report);

    size_t numProcessed() const;

    /**
     * @brief exitCode 0 unless strict is set and at least one file failed, then 3.
     */
    int exitCode(bool const strict) const;

    void print(std::ostream& out) const;
};

class BatchRunner {
public:
    explicit BatchRunner(Config const& _config);

    /**
     * @brief scan lists the videos directly inside the input folder, sorted by filename.
     * @throws InputError if the folder can't be read or contains no video.
     */
    std::vector<std::string> scan() const;

    /**
     * @brief run processes all videos found by scan(). Failures of single files are recorded
     * in the summary, only an InputError from scan() propagates.
     */
    BatchSummary run() const;

    /**
     * @brief run processes the given videos in the given order.
     */
    BatchSummary run(std::vector<std::string> const& files) const;

    /**
     * @brief processFile analyzes one video and writes its output.
     * Never throws, errors are reported in the returned FileReport.
     */
    FileReport processFile(std::string const& filename) const;

private:
    Config config;
    VideoAnalyzer analyzer;
    OutputWriter writer;
};

} // namespace detectlight

#endif // DETECTLIGHT_H
