#include "util/bytes.hpp"

#include <fmt/format.h>

std::string hs::util::humanBytes(const uintmax_t bytes) {
    if (bytes >= GIGABYTE) return fmt::format("{:.1f}G", static_cast<double>(bytes) / GIGABYTE);
    if (bytes >= MEGABYTE) return fmt::format("{:.1f}M", static_cast<double>(bytes) / MEGABYTE);
    if (bytes >= KILOBYTE) return fmt::format("{:.1f}K", static_cast<double>(bytes) / KILOBYTE);
    return fmt::format("{}B", bytes);
}
