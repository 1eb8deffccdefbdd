#pragma once

#include <cstdint>
#include <string>

namespace playctl {

// Process-wide provisional name sequence.
//
// Backed by a single atomic counter that starts at 0 when the process loads the library,
// only ever increases, and is never reset. Names are unique within the process; two
// processes using the same prefix will produce the same names.
namespace naming {

// Returns "<prefix><n>" and advances the counter. Safe to call from any thread.
std::string nextProvisionalName(const std::string& prefix);

// Value the next call will use (for diagnostics and tests)
uint64_t peekNextSequence();

}  // namespace naming
}  // namespace playctl
