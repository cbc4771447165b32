#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Naptári nap: napok száma 1970-01-01 (UTC) óta
using Date = std::int32_t;

// Hiányzó érték (null) helyett optional
using OptDouble = std::optional<double>;

Date make_date(int y, unsigned m, unsigned d);
void civil_from_date(Date dt, int& y, unsigned& m, unsigned& d);

// "YYYY-MM-DD" <-> Date; hibás szövegre std::invalid_argument
Date parse_date(const std::string& s);
std::string to_string_date(Date dt);

// A mai UTC nap
Date today_utc();

// Napi piaci megfigyelés (elsődleges eszköz OHLCV + referencia zárók)
struct DailyMarketObservation {
    Date date{};
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
    // csak azokon a napokon van kulcs, amikor a referencia kereskedett
    std::map<std::string, double> reference_close;
};

// Irány
enum class Direction { Down = 0, Up = 1 };

inline const char* to_string(Direction d) {
    return d == Direction::Up ? "UP" : "DOWN";
}
