#include "util/util.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

std::string read_file(const std::string &fname) {
    std::ifstream f(fname);
    if (!f.good()) {
        throw std::invalid_argument("Cannot open file " + fname);
    }
    std::string str;

    f.seekg(0, std::ios::end);
    str.reserve(f.tellg());
    f.seekg(0, std::ios::beg);

    str.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return str;
}

std::string trim(const std::string &s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto b = std::find_if(s.begin(), s.end(), not_space);
    auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return b < e ? std::string(b, e) : std::string();
}

std::vector<std::string> split(const std::string &s, char c) {
    std::string segment;
    std::vector<std::string> result;
    std::stringstream in(s);

    while (std::getline(in, segment, c)) {
        segment = trim(segment);
        if (!segment.empty()) {
            result.push_back(segment);
        }
    }
    return result;
}

std::vector<uint8_t> parse_assignment(const std::string &s) {
    std::vector<uint8_t> result;
    for (const std::string &label : split(s, ',')) {
        if (label == "A" || label == "a" || label == "0") {
            result.push_back(0);
        } else if (label == "B" || label == "b" || label == "1") {
            result.push_back(1);
        } else {
            throw std::invalid_argument("Invalid coin label: " + label + ". Should be A or B");
        }
    }
    return result;
}
