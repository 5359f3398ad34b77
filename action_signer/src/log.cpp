#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

static std::mutex g_log_mtx;

bool debug_enabled() {
    static const bool enabled = [] {
        const char* v = std::getenv("ACTION_SIGNER_DEBUG");
        if (!v) return false;
        const std::string s(v);
        return !s.empty() && s != "0";
    }();
    return enabled;
}

void log_line(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::cerr << "[" << tag << "] " << msg << "\n";
}

void log_debug(const std::string& tag, const std::string& msg) {
    if (!debug_enabled()) return;
    log_line(tag, msg);
}
