// ConfigParser.cpp
/*
 * Lenstra elliptic curve factorization
 *
 * Options for a single factorization attempt, read from a whitespace
 * separated config file ("-seed 42 -maxiter 10000 -log run.log -verbose").
 *
 * This code is released as free software.
 */
#include "io/ConfigParser.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace io {

static uint64_t parseU64(const std::string& opt, const std::string& s) {
    bool digits = !s.empty();
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
    if (!digits) {
        throw std::invalid_argument("Option " + opt + " expects an unsigned integer, got '" + s + "'");
    }
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Option " + opt + " value out of range: " + s);
    }
}

SearchOptions ConfigParser::parseTokens(const std::vector<std::string>& tokens) {
    SearchOptions opts;
    const size_t n = tokens.size();

    for (size_t i = 0; i < n; ++i) {
        const std::string& t = tokens[i];
        if (t == "-seed" && i + 1 < n) {
            opts.seed = parseU64(t, tokens[++i]);
        }
        else if (t == "-maxiter" && i + 1 < n) {
            opts.max_iterations = parseU64(t, tokens[++i]);
        }
        else if (t == "-log" && i + 1 < n) {
            opts.log_file = tokens[++i];
        }
        else if ((t == "-seed" || t == "-maxiter" || t == "-log") && i + 1 == n) {
            throw std::invalid_argument("Option " + t + " expects a value");
        }
        else if (t == "-verbose") {
            opts.verbose = true;
        }
        else {
            std::cerr << "Warning: Unknown option '" << t << "'\n";
        }
    }
    return opts;
}

std::vector<std::string> ConfigParser::tokenizeFile(const std::string& path) {
    std::ifstream config(path);
    std::vector<std::string> args;
    std::string line;

    if (!config.is_open()) {
        std::cerr << "Warning: no config file: " << path << std::endl;
        return args;
    }

    while (std::getline(config, line)) {
        size_t a = line.find_first_not_of(" \t\r\n");
        if (a == std::string::npos || line[a] == '#') continue;
        std::istringstream iss(line);
        std::string token;
        while (iss >> token) args.push_back(token);
    }
    return args;
}

SearchOptions ConfigParser::loadFile(const std::string& path) {
    return parseTokens(tokenizeFile(path));
}

} // namespace io
