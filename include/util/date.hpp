#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace hs::util {

using Date = std::chrono::year_month_day;

// Calendar date in the local time zone
Date today();

// "YYYY-MM-DD"
std::string toString(const Date& d);

bool isDateFolderName(const std::string& name);

// Most recent first: {d, d-1, ..., d-(days-1)}
std::vector<Date> window(const Date& d, unsigned int days);

std::string formatTimestamp(std::chrono::system_clock::time_point tp);

}
