#include "config/Parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "util/Logging.hpp"

namespace xdrtraj {

namespace {

std::string trim(const std::string& input) {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string> splitWhitespace(const std::string& input) {
    std::istringstream iss(input);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

const std::string& requireValue(const std::string& key, const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        throw std::runtime_error("Missing value for " + key);
    }
    return tokens[0];
}

std::string parseFormat(const std::string& token) {
    std::string upper = toUpper(token);
    if (upper == "XTC") return "xtc";
    if (upper == "TRR") return "trr";
    if (upper == "AUTO") return "";
    throw std::runtime_error("Unsupported trajectory format: " + token);
}

float parsePrecision(const std::string& token) {
    float value = 0.0f;
    try {
        std::size_t used = 0;
        value = std::stof(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid precision: " + token);
    }
    if (!std::isfinite(value) || value <= 0.0f) {
        throw std::runtime_error("Precision must be positive: " + token);
    }
    return value;
}

TrrPrecision parseTrrPrecision(const std::string& token) {
    std::string upper = toUpper(token);
    if (upper == "SINGLE" || upper == "FLOAT") return TrrPrecision::Single;
    if (upper == "DOUBLE") return TrrPrecision::Double;
    throw std::runtime_error("Unsupported TRR precision: " + token);
}

}  // namespace

TrajectoryOptions parseConfigStream(std::istream& input) {
    TrajectoryOptions options;
    std::string line;
    bool inBlock = false;
    while (std::getline(input, line)) {
        auto commentPos = line.find('#');
        if (commentPos != std::string::npos) {
            line = line.substr(0, commentPos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        std::string upper = toUpper(line);
        if (!inBlock) {
            if (upper.rfind("XDRTRAJ", 0) == 0) {
                inBlock = true;
            }
            continue;
        }
        if (upper == "... XDRTRAJ" || upper == "...XDRTRAJ") {
            break;
        }
        auto tokens = splitWhitespace(line);
        std::string key = toUpper(tokens[0]);
        tokens.erase(tokens.begin());
        if (key == "FORMAT") {
            options.format = parseFormat(requireValue(key, tokens));
        } else if (key == "PRECISION") {
            options.precision = parsePrecision(requireValue(key, tokens));
        } else if (key == "TRR_PRECISION") {
            options.trrPrecision = parseTrrPrecision(requireValue(key, tokens));
        } else {
            logWarn("Ignoring unknown configuration key: " + key);
        }
    }
    return options;
}

TrajectoryOptions parseConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open configuration file: " + path);
    }
    return parseConfigStream(file);
}

}  // namespace xdrtraj
