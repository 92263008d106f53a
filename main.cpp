/**
* @file main.cpp
* @brief detectlight command line tool: per-frame percentile pixel intensity of all videos in a folder.
*/

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <tclap/CmdLine.h>
#include <ParallelTime/paralleltime.h>
#include <catlogger/catlogger.h>

#include "detectlight.h"

namespace fs = boost::filesystem;

#define TIMELOG(descr) { \
    time_log << descr << ": " << t.print() << std::endl;\
    t.start();\
    std::cout << time_log.str() << "Total time: " << total_time.print() << std::endl << std::endl;\
    }

int main(int argc, char* argv[]) {
    // A gnuplot which is missing or dies early must fail only the current plot.
    std::signal(SIGPIPE, SIG_IGN);
    clog::Logger::getInstance().addListener(std::cout);

    ParallelTime t, total_time;
    std::stringstream time_log;

    detectlight::Config config;

    try {
        TCLAP::CmdLine cmd("detectlight: computes a percentile of the pixel intensities of every frame "
                           "of each video in a folder and writes a CSV table and a plot per video.", ' ', "0.1");

        TCLAP::UnlabeledValueArg<std::string> input_arg("folder",
                                                        "Folder containing the video files. Subfolders are ignored.",
                                                        true, "", "folder");
        cmd.add(input_arg);

        TCLAP::ValueArg<double> percentile_arg("p", "percentile",
                                               "Percentile of the pixel intensities computed for each frame, "
                                               "linear interpolation between neighbouring ranks.",
                                               false, 95, "percentile [0-100]");
        cmd.add(percentile_arg);

        TCLAP::ValueArg<std::string> output_arg("o", "output",
                                                "Folder for the CSV and plot files. Defaults to the input folder.",
                                                false, "", "folder");
        cmd.add(output_arg);

        TCLAP::MultiArg<std::string> ext_arg("e", "ext",
                                             "Video file extension(s) to process, case insensitive. "
                                             "May be given multiple times or as comma separated list. "
                                             "Default: mp4,avi,mov,mkv,m4v,wmv,mpg,mpeg,webm",
                                             false, "extension");
        cmd.add(ext_arg);

        TCLAP::SwitchArg no_grayscale_arg("", "no-grayscale",
                                          "Don't convert color frames to luma, pool the samples of all channels instead.",
                                          false);
        cmd.add(no_grayscale_arg);

        TCLAP::SwitchArg no_plot_arg("", "no-plot",
                                     "Only write the CSV files, don't run gnuplot.",
                                     false);
        cmd.add(no_plot_arg);

        TCLAP::SwitchArg strict_arg("", "strict",
                                    "Exit with status 3 if any video failed.",
                                    false);
        cmd.add(strict_arg);

        TCLAP::ValueArg<int> precision_arg("", "precision",
                                           "Number of digits after the decimal point in the CSV files.",
                                           false, 6, "digits");
        cmd.add(precision_arg);

        TCLAP::ValueArg<std::string> log_arg("", "log",
                                             "Log file. Defaults to detectlight.log in the output folder, "
                                             "which is the input folder unless -o is given.",
                                             false, "", "filename");
        cmd.add(log_arg);

        cmd.parse(argc, argv);

        config.input_dir = input_arg.getValue();
        config.percentile = percentile_arg.getValue();
        config.output_dir = output_arg.getValue();
        if (ext_arg.isSet()) {
            config.setExtensions(ext_arg.getValue());
        }
        config.grayscale = !no_grayscale_arg.getValue();
        config.plot = !no_plot_arg.getValue();
        config.strict = strict_arg.getValue();
        config.precision = precision_arg.getValue();
        config.log_file = log_arg.getValue();

        config.validate();
    }
    catch (TCLAP::ArgException const & e) {
        std::cerr << e.error() << " for argument " << e.argId() << std::endl;
        return EXIT_FAILURE;
    }
    catch (detectlight::InputError const& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::stringstream params;
    config.print(params);
    clog::L("tclap", 2) << "Parameters: " << std::endl << params.str() << std::endl;

    TIMELOG("Argument parsing");

    detectlight::BatchRunner runner(config);
    std::vector<std::string> files;
    try {
        files = runner.scan();
    }
    catch (detectlight::InputError const& e) {
        clog::L("main", 1) << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    for (std::string const& file : files) {
        clog::L("main", 2) << "Found video " << file << std::endl;
    }

    TIMELOG("Scanning input folder");

    // The log file is only created once there is something to process.
    std::ofstream logfile;
    {
        boost::system::error_code ec;
        fs::create_directories(config.outputDir(), ec);
        logfile.open(config.logFile(), std::ofstream::out);
        if (logfile) {
            clog::Logger::getInstance().addListener(logfile);
        }
        else {
            clog::L("main", 1) << "Could not open log file " << config.logFile() << std::endl;
        }
    }

    detectlight::BatchSummary const summary = runner.run(files);

    TIMELOG("Processing videos");

    std::stringstream summary_text;
    summary.print(summary_text);
    clog::L("main", 2) << summary_text.str();

    return summary.exitCode(config.strict);
}
