#include "utils/clock.h"
#include <chrono>

namespace substrate {
namespace utils {

uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

Clock systemClock() {
    return []() { return nowMillis(); };
}

}
}
