#pragma once

#include <cstdint>
#include <string>

namespace hs::util {

static constexpr uintmax_t KILOBYTE = 1024;
static constexpr uintmax_t MEGABYTE = KILOBYTE * KILOBYTE;
static constexpr uintmax_t GIGABYTE = KILOBYTE * MEGABYTE;

// 512B, 1.2K, 34.0M, 1.5G
std::string humanBytes(uintmax_t bytes);

}
