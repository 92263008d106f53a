#include "detectlight.h"

#include <algorithm>
#include <map>

#include <catlogger/catlogger.h>
#include <ParallelTime/paralleltime.h>

namespace detectlight {

void BatchSummary::add(const FileReport &report) {
    if (report.success) {
        succeeded.push_back(report);
    }
    else {
        failed.push_back(report);
    }
}

size_t BatchSummary::numProcessed() const {
    return succeeded.size() + failed.size();
}

int BatchSummary::exitCode(const bool strict) const {
    if (strict && !failed.empty()) {
        return 3;
    }
    return 0;
}

void BatchSummary::print(std::ostream &out) const {
    out << "Processed " << numProcessed() << " video(s): "
        << succeeded.size() << " succeeded, " << failed.size() << " failed." << std::endl;
    for (FileReport const& it : succeeded) {
        out << "  ok      " << it.filename << " (" << it.frames << " frames";
        if (it.skipped > 0) {
            out << ", " << it.skipped << " skipped";
        }
        out << ")" << std::endl;
    }
    for (FileReport const& it : failed) {
        out << "  FAILED  " << it.filename << ": " << it.kind << ": " << it.reason << std::endl;
    }
}

BatchRunner::BatchRunner(const Config &_config) :
    config(_config),
    analyzer(_config.percentile, _config.grayscale),
    writer(_config.outputDir(), _config.percentile, _config.precision, _config.plot) {}

std::vector<std::string> BatchRunner::scan() const {
    fs::path const dir(config.input_dir);
    boost::system::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw InputError("Input folder " + config.input_dir + " does not exist or is not a folder");
    }
    std::vector<std::string> result;
    try {
        for (fs::directory_iterator it(dir), end; it != end; ++it) {
            if (!fs::is_regular_file(it->status())) {
                continue;
            }
            if (config.isVideo(it->path())) {
                result.push_back(it->path().string());
            }
        }
    }
    catch (fs::filesystem_error const& e) {
        throw InputError("Reading input folder " + config.input_dir + " failed: " + e.what());
    }
    if (result.empty()) {
        throw InputError("No video files found in input folder " + config.input_dir);
    }
    std::sort(result.begin(), result.end());

    std::map<std::string, std::string> stems;
    for (std::string const& file : result) {
        std::string const stem = fs::path(file).stem().string();
        auto const it = stems.find(stem);
        if (it != stems.end()) {
            clog::L(__func__, 1) << "Warning: " << it->second << " and " << file
                                 << " share the name " << stem << ", the output of the latter replaces the former." << std::endl;
        }
        stems[stem] = file;
    }
    return result;
}

FileReport BatchRunner::processFile(const std::string &filename) const {
    FileReport report;
    report.filename = filename;
    ParallelTime t;
    try {
        AnalysisResult const result = analyzer.analyzeFile(filename);
        clog::L(__func__, 2) << filename << ":" << std::endl << result.print() << std::endl;
        writer.write(filename, result.series);
        report.success = true;
        report.frames = result.series.size();
        report.skipped = result.skipped;
    }
    catch (Error const& e) {
        report.kind = e.kindName();
        report.reason = e.what();
    }
    catch (std::exception const& e) {
        report.kind = "Error";
        report.reason = e.what();
    }
    if (report.success) {
        clog::L(__func__, 2) << "Finished " << filename << " in " << t.print() << std::endl;
    }
    else {
        clog::L(__func__, 1) << "Processing " << filename << " failed with " << report.kind << ": " << report.reason << std::endl;
    }
    return report;
}

BatchSummary BatchRunner::run() const {
    return run(scan());
}

BatchSummary BatchRunner::run(const std::vector<std::string> &files) const {
    clog::L(__func__, 2) << "Processing " << files.size() << " video(s) from " << config.input_dir << std::endl;
    BatchSummary summary;
    for (size_t ii = 0; ii < files.size(); ++ii) {
        clog::L(__func__, 2) << "[" << ii+1 << "/" << files.size() << "] Processing " << files[ii] << std::endl;
        summary.add(processFile(files[ii]));
    }
    return summary;
}

} // namespace detectlight
