#include "actiscope/CsvBatchReader.h"
#include "actiscope/Errors.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace actiscope {

namespace {

std::string trim(const std::string& s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) fields.push_back(trim(item));
    // getline drops an empty last field
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    std::size_t used = 0;
    try {
        out = std::stod(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    return used == text.size();
}

} // namespace

AccelerationBatch read_csv_batch(std::istream& in, int samplingRateHz) {
    AccelerationBatch batch;
    batch.dataType = "acceleration";
    batch.samplingRateHz = samplingRateHz;

    std::string line;
    std::size_t lineNo = 0;
    bool seenRow = false;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string row = trim(line);
        if (row.empty() || row[0] == '#') continue;

        const auto fields = split_fields(row);
        Sample s;
        const bool ok = fields.size() == 4 && parse_double(fields[0], s.timestamp) &&
                        parse_double(fields[1], s.x) && parse_double(fields[2], s.y) &&
                        parse_double(fields[3], s.z);
        if (!ok) {
            // first non-comment row may be the column header
            if (!seenRow && fields.size() == 4 && fields[0] == "timestamp") {
                seenRow = true;
                continue;
            }
            throw ValidationError("malformed sample on line " + std::to_string(lineNo) + ": " + row);
        }
        seenRow = true;
        batch.samples.push_back(s);
    }

    batch.startTime = batch.samples.empty() ? 0.0 : batch.samples.front().timestamp;
    return batch;
}

AccelerationBatch load_csv_batch(const std::string& path, int samplingRateHz) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("cannot open sample file " + path);
    }
    AccelerationBatch batch = read_csv_batch(file, samplingRateHz);
    batch.id = path;
    return batch;
}

}  // namespace actiscope
