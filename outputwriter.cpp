#include "detectlight.h"

#include <csignal>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <catlogger/catlogger.h>
#include <gnuplot-iostream.h>

namespace  {
/**
 * @brief gnuplotQuote wraps a string in single quotes for gnuplot, doubling contained single quotes.
 */
std::string gnuplotQuote(std::string const& in) {
    std::string result = "'";
    for (char c : in) {
        if (c == '\'') {
            result += "''";
        }
        else {
            result += c;
        }
    }
    return result + "'";
}

void removeQuietly(detectlight::fs::path const& path) {
    boost::system::error_code ignore_error_code;
    detectlight::fs::remove(path, ignore_error_code);
}

/**
 * @brief The IgnoreSigpipe class ignores SIGPIPE while it exists, so writing to a gnuplot
 * which isn't installed or exited early fails with an error instead of killing the process.
 */
class IgnoreSigpipe {
public:
    IgnoreSigpipe() : previous(std::signal(SIGPIPE, SIG_IGN)) {}
    ~IgnoreSigpipe() {
        if (previous != SIG_ERR) {
            std::signal(SIGPIPE, previous);
        }
    }

    IgnoreSigpipe(IgnoreSigpipe const&) = delete;
    void operator=(IgnoreSigpipe const&) = delete;

private:
    void (*previous)(int);
};

/**
 * @brief commit replaces target by the finished temporary file.
 */
void commit(detectlight::fs::path const& tmp, detectlight::fs::path const& target) {
    boost::system::error_code ec;
    detectlight::fs::rename(tmp, target, ec);
    if (ec) {
        removeQuietly(tmp);
        throw detectlight::WriteError("Could not move " + tmp.string() + " to " + target.string() + ": " + ec.message());
    }
}
} // anonymous namespace

namespace detectlight {

OutputWriter::OutputWriter(
        const std::string &_output_dir,
        const double _percentile,
        const int _precision,
        const bool _plot) :
    output_dir(_output_dir),
    percentile_value(_percentile),
    precision(_precision),
    plot(_plot) {}

std::string OutputWriter::csvPath(const std::string &video) const {
    return artifactPath(video, ".csv").string();
}

std::string OutputWriter::plotPath(const std::string &video) const {
    return artifactPath(video, ".png").string();
}

fs::path OutputWriter::artifactPath(const std::string &video, const std::string &extension) const {
    std::string const stem = fs::path(video).stem().string();
    return fs::path(output_dir) / (stem + "_percentile" + formatPercentile(percentile_value) + extension);
}

void OutputWriter::ensureOutputDir() const {
    boost::system::error_code ec;
    if (fs::is_directory(output_dir, ec)) {
        return;
    }
    fs::create_directories(output_dir, ec);
    if (ec || !fs::is_directory(output_dir)) {
        throw WriteError("Could not create output folder " + output_dir + (ec ? ": " + ec.message() : ""));
    }
}

void OutputWriter::write(const std::string &video, const PercentileSeries &series) const {
    ensureOutputDir();
    writeCsv(video, series);
    if (!plot) {
        return;
    }
    try {
        writePlot(video, series);
    }
    catch (WriteError const&) {
        removeQuietly(csvPath(video));
        removeQuietly(plotPath(video));
        throw;
    }
}

std::string OutputWriter::formatCsv(const PercentileSeries &series) const {
    std::stringstream out;
    out << "frame_index,value\n" << std::fixed << std::setprecision(precision);
    for (SeriesPoint const& it : series) {
        out << it.frame_index << "," << it.value << "\n";
    }
    return out.str();
}

void OutputWriter::setGnuplotCommand(const std::string &command) {
    gnuplot_command = command;
}

void OutputWriter::writeCsv(const std::string &video, const PercentileSeries &series) const {
    fs::path const target = artifactPath(video, ".csv");
    fs::path const tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!out) {
            throw WriteError("Could not open " + tmp.string() + " for writing");
        }
        out << formatCsv(series);
        out.close();
        if (out.fail()) {
            removeQuietly(tmp);
            throw WriteError("Writing " + tmp.string() + " failed");
        }
    }
    commit(tmp, target);
    clog::L(__func__, 2) << "Wrote " << target.string() << std::endl;
}

void OutputWriter::writePlot(const std::string &video, const PercentileSeries &series) const {
    fs::path const target = artifactPath(video, ".png");
    fs::path const tmp = target.string() + ".tmp.png";
    removeQuietly(tmp);

    std::vector<std::pair<double, double> > data;
    data.reserve(series.size());
    for (SeriesPoint const& it : series) {
        data.push_back({double(it.frame_index), it.value});
    }

    IgnoreSigpipe const sigpipe_guard;
    try {
        gnuplotio::Gnuplot plt(gnuplot_command);
        plt << "set term png size 1920,1440 background rgb 'white';\n"
            << "set output " << gnuplotQuote(tmp.string()) << ";\n"
            << "set title " << gnuplotQuote(fs::path(video).filename().string()) << " noenhanced;\n"
            << "set xlabel 'Frame number';\n"
            << "set ylabel " << gnuplotQuote(formatPercentile(percentile_value) + "th percentile pixel intensity (AU)") << ";\n"
            << "set border 3;\n"
            << "set xtics nomirror out;\n"
            << "set ytics nomirror out;\n"
            << "set key off;\n"
            << "plot '-' u 1:2 w l lw 2 notitle\n";
        plt.send1d(data);
        plt << "set output;\n";
    }
    catch (std::exception const& e) {
        removeQuietly(tmp);
        throw WriteError("Plotting " + target.string() + " failed: " + e.what());
    }

    boost::system::error_code ec;
    if (!fs::is_regular_file(tmp, ec) || fs::file_size(tmp, ec) == 0 || ec) {
        removeQuietly(tmp);
        throw WriteError(gnuplot_command + " didn't produce " + target.string() + ", is gnuplot installed and the folder writable?");
    }
    commit(tmp, target);
    clog::L(__func__, 2) << "Wrote " << target.string() << std::endl;
}

} // namespace detectlight
