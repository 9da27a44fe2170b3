#include "guestdrop/core/random.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace guestdrop {

std::string random_hex(std::size_t byte_count) {
    thread_local std::mt19937_64 rng{[] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }()};
    std::uniform_int_distribution<std::uint32_t> dist(0, 255);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < byte_count; ++i) {
        oss << std::setw(2) << dist(rng);
    }
    return oss.str();
}

} // namespace guestdrop
