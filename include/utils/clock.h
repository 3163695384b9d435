#pragma once

#include <cstdint>
#include <functional>

namespace substrate {
namespace utils {

// Millisecond wall clock. Components take a Clock so that rolling windows
// and deadlines can be driven explicitly.
using Clock = std::function<uint64_t()>;

uint64_t nowMillis();
Clock systemClock();

}
}
