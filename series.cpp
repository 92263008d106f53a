#include "detectlight.h"

#include <fstream>
#include <sstream>

namespace detectlight {

SeriesPoint::SeriesPoint(const size_t _frame_index, const double _value) : frame_index(_frame_index), value(_value) {}

SeriesPoint::SeriesPoint() {}

void PercentileSeries::append(const size_t frame_index, const double value) {
    if (!data.empty() && frame_index <= data.back().frame_index) {
        throw std::logic_error("Frame index " + std::to_string(frame_index)
                               + " is not larger than the previous index " + std::to_string(data.back().frame_index));
    }
    data.push_back(SeriesPoint(frame_index, value));
}

void PercentileSeries::push(const double value) {
    data.push_back(SeriesPoint(data.empty() ? 0 : data.back().frame_index + 1, value));
}

size_t PercentileSeries::size() const {
    return data.size();
}

bool PercentileSeries::empty() const {
    return data.empty();
}

const SeriesPoint &PercentileSeries::operator[](const size_t index) const {
    return data[index];
}

std::vector<SeriesPoint>::const_iterator PercentileSeries::begin() const {
    return data.begin();
}

std::vector<SeriesPoint>::const_iterator PercentileSeries::end() const {
    return data.end();
}

const std::vector<SeriesPoint> &PercentileSeries::points() const {
    return data;
}

double PercentileSeries::largestRise(size_t &frame_index) const {
    double result = 0;
    frame_index = data.empty() ? 0 : data.front().frame_index;
    for (size_t ii = 1; ii < data.size(); ++ii) {
        double const rise = data[ii].value - data[ii-1].value;
        if (rise > result) {
            result = rise;
            frame_index = data[ii].frame_index;
        }
    }
    return result;
}

PercentileSeries readSeriesCsv(const std::string &filename) {
    std::ifstream in(filename);
    if (!in) {
        throw InputError("Could not open CSV file " + filename);
    }
    std::string line;
    if (!std::getline(in, line) || line.find("frame_index,value") != 0) {
        throw InputError("CSV file " + filename + " lacks the header \"frame_index,value\"");
    }
    PercentileSeries result;
    size_t line_number = 1;
    while (std::getline(in, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        std::stringstream stream(line);
        size_t frame_index = 0;
        char separator = 0;
        double value = 0;
        stream >> frame_index >> separator >> value;
        if (stream.fail() || separator != ',') {
            throw InputError("Malformed line " + std::to_string(line_number) + " in " + filename + ": " + line);
        }
        try {
            result.append(frame_index, value);
        }
        catch (std::logic_error const& e) {
            throw InputError("Line " + std::to_string(line_number) + " in " + filename + ": " + e.what());
        }
    }
    return result;
}

} // namespace detectlight
