#include "detectlight.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace  {
void trim(std::string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
        return !std::isspace(ch);
    }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

std::vector<std::string> commaSeparate(std::vector<std::string> const& args) {
    std::vector<std::string> result;
    for (std::string const& s : args) {
        std::string current;
        for (char c : s) {
            if (c == ',' || c == ';') {
                trim(current);
                if (!current.empty()) {
                    result.push_back(current);
                }
                current = "";
            }
            else {
                current += c;
            }
        }
        trim(current);
        if (!current.empty()) {
            result.push_back(current);
        }
    }
    return result;
}
} // anonymous namespace

namespace detectlight {

Error::Error(const Error::Kind _kind, const std::string &what) : std::runtime_error(what), error_kind(_kind) {}

Error::Kind Error::kind() const {
    return error_kind;
}

std::string Error::kindName() const {
    return kindName(error_kind);
}

std::string Error::kindName(const Error::Kind kind) {
    switch (kind) {
    case Input: return "InputError";
    case Decode: return "DecodeError";
    case Write: return "WriteError";
    }
    return "Error";
}

InputError::InputError(const std::string &what) : Error(Input, what) {}

DecodeError::DecodeError(const std::string &what) : Error(Decode, what) {}

WriteError::WriteError(const std::string &what) : Error(Write, what) {}

std::vector<std::string> Config::defaultExtensions() {
    return {".mp4", ".avi", ".mov", ".mkv", ".m4v", ".wmv", ".mpg", ".mpeg", ".webm"};
}

std::string Config::normalizeExtension(std::string ext) {
    trim(ext);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return char(std::tolower(c));
    });
    if (!ext.empty() && ext[0] != '.') {
        ext = "." + ext;
    }
    return ext;
}

void Config::setExtensions(const std::vector<std::string> &args) {
    extensions = commaSeparate(args);
}

void Config::validate() {
    if (input_dir.empty()) {
        throw InputError("No input folder given");
    }
    if (!std::isfinite(percentile) || percentile < 0 || percentile > 100) {
        std::stringstream msg;
        msg << "Percentile must be in [0, 100], got " << percentile;
        throw InputError(msg.str());
    }
    if (precision < 0 || precision > 17) {
        throw InputError("Precision must be in [0, 17], got " + std::to_string(precision));
    }
    std::vector<std::string> normalized;
    for (std::string const& ext : extensions) {
        std::string const n = normalizeExtension(ext);
        if (n.size() > 1 && std::find(normalized.begin(), normalized.end(), n) == normalized.end()) {
            normalized.push_back(n);
        }
    }
    if (normalized.empty()) {
        throw InputError("No video file extensions given");
    }
    extensions = normalized;
}

std::string Config::outputDir() const {
    return output_dir.empty() ? input_dir : output_dir;
}

std::string Config::logFile() const {
    if (!log_file.empty()) {
        return log_file;
    }
    return (fs::path(outputDir()) / "detectlight.log").string();
}

bool Config::isVideo(const fs::path &path) const {
    std::string const ext = normalizeExtension(path.extension().string());
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

void Config::print(std::ostream &out) const {
    out << "input folder: " << input_dir << std::endl
        << "output folder: " << outputDir() << std::endl
        << "percentile: " << percentile << std::endl
        << "extensions:";
    for (std::string const& ext : extensions) {
        out << " " << ext;
    }
    out << std::endl
        << "grayscale: " << (grayscale ? "true" : "false") << std::endl
        << "plot: " << (plot ? "true" : "false") << std::endl
        << "strict: " << (strict ? "true" : "false") << std::endl
        << "CSV precision: " << precision;
}

std::string formatPercentile(const double p) {
    int const max_digits = std::numeric_limits<double>::max_digits10;
    for (int decimals = 0; decimals <= max_digits; ++decimals) {
        std::stringstream out;
        out << std::fixed << std::setprecision(decimals) << p;
        double parsed = 0;
        if (out >> parsed && parsed == p) {
            return out.str();
        }
    }
    std::stringstream out;
    out << std::setprecision(max_digits) << p;
    return out.str();
}

} // namespace detectlight
