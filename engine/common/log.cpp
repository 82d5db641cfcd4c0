#include "engine/common/log.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace gridduel {
namespace {

std::once_flag g_log_init_once;
std::atomic<bool> g_log_on{false};

void init_from_env() {
    std::call_once(g_log_init_once, []() {
        const char* v = std::getenv("GRIDDUEL_LOG");
        if (v && *v && std::strcmp(v, "0") != 0) g_log_on.store(true);
    });
}

} // namespace

bool log_enabled() {
    init_from_env();
    return g_log_on.load(std::memory_order_relaxed);
}

void set_log_enabled(bool on) {
    init_from_env();
    g_log_on.store(on);
}

} // namespace gridduel
