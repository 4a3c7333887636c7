#include "util/date.hpp"

#include <cctype>
#include <ctime>
#include <fmt/format.h>

using namespace std::chrono;

namespace hs::util {

Date today() {
    const std::time_t now = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    ::localtime_r(&now, &tm);
    return year{tm.tm_year + 1900} / month{static_cast<unsigned>(tm.tm_mon + 1)} / day{static_cast<unsigned>(tm.tm_mday)};
}

std::string toString(const Date& d) {
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<int>(d.year()),
                       static_cast<unsigned>(d.month()),
                       static_cast<unsigned>(d.day()));
}

bool isDateFolderName(const std::string& name) {
    if (name.size() != 10 || name[4] != '-' || name[7] != '-') return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
    }
    return true;
}

std::vector<Date> window(const Date& d, const unsigned int days) {
    std::vector<Date> out;
    out.reserve(days);
    const sys_days base{d};
    for (unsigned int i = 0; i < days; ++i) out.emplace_back(base - std::chrono::days{i});
    return out;
}

std::string formatTimestamp(const system_clock::time_point tp) {
    const std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

}
