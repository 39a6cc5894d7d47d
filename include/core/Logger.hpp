// include/core/Logger.hpp
#pragma once

#include "math/CurveGroup.hpp"
#include "math/Point.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <gmpxx.h>

namespace core {

class Logger {
public:
    explicit Logger(const std::string& logFile, bool verbose = false);
    void logStart(const mpz_class& N, uint64_t seed);
    void logCurve(const math::CurveGroup& curve, const math::Point& P);
    void logEnd(const std::string& status, const mpz_class& factor,
                uint64_t iterations, double elapsed);
    void logmsg(const char* fmt, ...);
    void flush_log();

    const std::vector<std::string>& pending() const { return _messages; }

private:
    std::string _logFile;
    bool _verbose;
    std::vector<std::string> _messages;
};

} // namespace core
