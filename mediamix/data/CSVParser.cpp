#include "mediamix/data/CSVParser.hpp"
#include <sstream>
#include <stdexcept>

namespace mediamix { namespace data {

CSVParser::CSVParser(const std::string &filename) {

    f_.exceptions(f_.badbit);
    f_.open(filename, std::ios_base::in);
    if (not f_.is_open()) throw std::ios_base::failure("Unable to open `" + filename + "'");

    std::string header;
    lineno_ = 1;
    std::getline(f_, header);
    if (not header.empty() and header.back() == '\r') header.pop_back();
    header_ = split(header);

    updateFields();
}

bool CSVParser::readRow() {
    std::string line;
    do {
        if (not std::getline(f_, line)) return false;
        lineno_++;
        if (not line.empty() and line.back() == '\r') line.pop_back();
    } while (line.empty() or line[0] == '#');

    auto fields = split(line);
    if (fields.size() != header_.size())
        throw std::invalid_argument("Invalid data on line " + std::to_string(lineno_) + ": number of fields (" + std::to_string(fields.size())
                + ") differs from that of the header (" + std::to_string(header_.size()) + ")");

    row_.resize(fields_.size());
    row_skipped_.clear();
    Eigen::Index pos = 0;
    for (size_t fieldnum = 0; fieldnum < fields.size(); fieldnum++) {
        if (skip_.count(header_[fieldnum])) {
            row_skipped_[header_[fieldnum]] = fields[fieldnum];
        }
        else {
            auto &field = fields[fieldnum];
            size_t parse_pos = 0;
            double d;
            try {
                d = std::stod(field, &parse_pos);
                while (parse_pos < field.length() and field[parse_pos] == ' ') parse_pos++;
                if (parse_pos != field.length()) throw std::invalid_argument("trailing garbage");
            }
            catch (const std::invalid_argument &e) {
                throw std::invalid_argument("CSVParser::readRow: found non-double value `" + field + "' for " +
                        header_[fieldnum] + ", line " + std::to_string(lineno_) + " (" + e.what() + ")");
            }
            catch (const std::out_of_range &e) {
                throw std::invalid_argument("CSVParser::readRow: value `" + field + "' for " +
                        header_[fieldnum] + ", line " + std::to_string(lineno_) + " is out of range");
            }
            row_[pos++] = d;
        }
    }

    return true;
}

CSVParser::iterator CSVParser::begin() {
    return iterator(*this, false);
}

CSVParser::iterator CSVParser::end() {
    return iterator(*this, true);
}

std::vector<std::string> CSVParser::split(const std::string &csr) {
    std::vector<std::string> results;
    std::stringstream ss(csr);
    std::string val;
    while (std::getline(ss, val, ',')) {
        results.push_back(val);
    }
    // getline drops a trailing empty field
    if (not csr.empty() and csr.back() == ',') results.emplace_back();
    return results;
}

void CSVParser::skip(const std::string &name) {
    skip_.insert(name);
    updateFields();
}

void CSVParser::dontSkip(const std::string &name) {
    skip_.erase(name);
    updateFields();
}

void CSVParser::updateFields() {
    fields_.clear();
    for (const auto &f: header_) {
        if (not skip_.count(f)) fields_.push_back(f);
    }
}

}}
