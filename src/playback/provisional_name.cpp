#include "playctl/playback/provisional_name.h"

#include <atomic>

namespace playctl {
namespace naming {

namespace {

std::atomic<uint64_t> g_sequence{0};

}  // namespace

std::string nextProvisionalName(const std::string& prefix) {
    return prefix + std::to_string(g_sequence.fetch_add(1, std::memory_order_relaxed));
}

uint64_t peekNextSequence() {
    return g_sequence.load(std::memory_order_relaxed);
}

}  // namespace naming
}  // namespace playctl
