#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace gist {

/**
 * Strip leading and trailing whitespace.
 */
inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

/**
 * Split a command string on whitespace ("code --wait" -> {"code", "--wait"}).
 * No quoting rules; editor commands are expected to be simple.
 */
inline std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        parts.push_back(token);
    }
    return parts;
}

/**
 * Join argv for log output.
 */
inline std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += " ";
        out += args[i];
    }
    return out;
}

}  // namespace gist
