// src/core/Logger.cpp
/*
 * Lenstra elliptic curve factorization
 *
 * Attempt log: lines are buffered in memory and appended to the log file on
 * flush. Verbose mode echoes them to the console with the [ECM] prefix.
 *
 * This code is released as free software.
 */
#include "core/Logger.hpp"
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace core {

Logger::Logger(const std::string& logFile, bool verbose)
  : _logFile(logFile), _verbose(verbose)
{}

void Logger::logStart(const mpz_class& N, uint64_t seed) {
    logmsg("=== Start : N=%s (%u digits), seed=%llu\n",
           N.get_str().c_str(),
           static_cast<unsigned>(mpz_sizeinbase(N.get_mpz_t(), 10)),
           static_cast<unsigned long long>(seed));
}

void Logger::logCurve(const math::CurveGroup& curve, const math::Point& P) {
    logmsg("Curve : y^2 = x^3 + %s*x + %s, P0 %s\n",
           curve.a().get_str().c_str(),
           curve.b().get_str().c_str(),
           P.toString().c_str());
}

void Logger::logEnd(const std::string& status, const mpz_class& factor,
                    uint64_t iterations, double elapsed) {
    logmsg("=== End : status=%s, factor=%s, iterations=%llu, elapsed=%.3f s\n",
           status.c_str(),
           factor.get_str().c_str(),
           static_cast<unsigned long long>(iterations),
           elapsed);
}

void Logger::logmsg(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    va_list ap2;
    va_copy(ap2, ap);
    char buf[1024];
    int len = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (len < 0) {
        va_end(ap2);
        return;
    }
    std::string msg;
    if (static_cast<size_t>(len) < sizeof(buf)) {
        msg.assign(buf, static_cast<size_t>(len));
    } else {
        // N and the curve coefficients can exceed the stack buffer
        msg.resize(static_cast<size_t>(len) + 1);
        vsnprintf(&msg[0], msg.size(), fmt, ap2);
        msg.resize(static_cast<size_t>(len));
    }
    va_end(ap2);
    if (_verbose) std::cout << "[ECM] " << msg << std::flush;
    _messages.push_back(std::move(msg));
}

void Logger::flush_log() {
    if (_messages.empty()) return;
    std::ofstream out(_logFile, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open log file " + _logFile);
    }
    for (auto& m : _messages) {
        out << m;
    }
    _messages.clear();
}

} // namespace core
