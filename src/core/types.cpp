#include "core/types.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <fmt/format.h>

// H. Hinnant days_from_civil / civil_from_days
Date make_date(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<Date>(era * 146097 + static_cast<int>(doe) - 719468);
}

void civil_from_date(Date dt, int& y, unsigned& m, unsigned& d) {
    const int z = dt + 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + era * 400 + (m <= 2);
}

Date parse_date(const std::string& s) {
    int y = 0; unsigned m = 0, d = 0; char tail = 0;
    if (s.size() < 10 || std::sscanf(s.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3)
        throw std::invalid_argument(fmt::format("invalid date '{}', expected YYYY-MM-DD", s));
    if (m < 1 || m > 12 || d < 1 || d > 31)
        throw std::invalid_argument(fmt::format("invalid date '{}'", s));
    const Date dt = make_date(y, m, d);
    int yy; unsigned mm, dd;
    civil_from_date(dt, yy, mm, dd);
    if (yy != y || mm != m || dd != d)
        throw std::invalid_argument(fmt::format("invalid calendar day '{}'", s));
    return dt;
}

std::string to_string_date(Date dt) {
    int y; unsigned m, d;
    civil_from_date(dt, y, m, d);
    return fmt::format("{:04d}-{:02d}-{:02d}", y, m, d);
}

Date today_utc() {
    using namespace std::chrono;
    const auto days = duration_cast<hours>(system_clock::now().time_since_epoch()).count() / 24;
    return static_cast<Date>(days);
}
