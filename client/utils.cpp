#include "utils.h"
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

namespace {

bool write_fresh_array(const std::string& path, const std::string& obj)
{
    std::ofstream out(path, std::ios::trunc);
    out << "[" << obj << "]\n";
    return out.good();
}

}

// If the file doesn't exist, is empty, or doesn't hold an array, it is
// replaced by a single-element array.
bool append_result_to_file(const RunSummary& r, const std::string& path) {
    std::string obj = r.ToJson();

    std::ifstream in(path);
    if (!in.good()) {
        return write_fresh_array(path, obj);
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    while (!content.empty() && isspace(static_cast<unsigned char>(content.back()))) content.pop_back();

    size_t first_non_ws = content.find_first_not_of(" \t\n\r");
    size_t last_bracket = content.find_last_of(']');
    if (first_non_ws == std::string::npos || content[first_non_ws] != '[' ||
        last_bracket == std::string::npos || last_bracket < first_non_ws) {
        std::cerr << "[Agent] " << path << " is not a JSON array, overwriting" << std::endl;
        return write_fresh_array(path, obj);
    }

    bool array_empty = true;
    for (size_t i = first_non_ws + 1; i < last_bracket; ++i) {
        if (!isspace(static_cast<unsigned char>(content[i]))) { array_empty = false; break; }
    }
    if (array_empty) {
        return write_fresh_array(path, obj);
    }

    std::ofstream out(path, std::ios::trunc);
    out << content.substr(0, last_bracket) << ",\n" << obj << "]\n";
    return out.good();
}

bool append_summary_to_log(const RunSummary& r, const std::string& path) {
    std::ofstream out(path, std::ios::app);
    out << r.Format();
    return out.good();
}
