#pragma once

#include <cstddef>
#include <string>

namespace guestdrop {

/// Lowercase hex string built from `byte_count` random bytes.
std::string random_hex(std::size_t byte_count);

} // namespace guestdrop
