// ConfigParser.hpp
#ifndef IO_CONFIGPARSER_HPP
#define IO_CONFIGPARSER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace io {

struct SearchOptions {
    uint64_t seed = 0;              // 0: derived from the clock
    uint64_t max_iterations = 0;    // 0: unbounded
    std::string log_file = "lenstra.log";
    bool verbose = false;
};

class ConfigParser {
public:
    static SearchOptions parseTokens(const std::vector<std::string>& tokens);
    static SearchOptions loadFile(const std::string& path);
    static std::vector<std::string> tokenizeFile(const std::string& path);
};

} // namespace io

#endif // IO_CONFIGPARSER_HPP
