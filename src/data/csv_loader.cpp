#include "data/csv_loader.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace data {

static std::string trim(std::string s){
    auto ws = [](unsigned char c){ return std::isspace(c); };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

static std::vector<std::string> split(const std::string& line){
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string x;
    while (std::getline(ss, x, ',')) out.push_back(trim(x));
    if (!line.empty() && line.back()==',') out.emplace_back();
    return out;
}

static std::vector<std::string> lowercase(std::vector<std::string> v){
    for (auto& s : v)
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return v;
}

static Date csv_date(const std::string& s){
    return parse_date(s.substr(0, 10));
}

std::vector<DailyMarketObservation> load_market_csv(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw MissingUpstreamData(fmt::format("cannot open market csv '{}'", path));

    std::string line;
    if (!std::getline(f, line)) throw MissingUpstreamData(fmt::format("market csv '{}' is empty", path));
    const auto header = lowercase(split(line));
    const std::vector<std::string> fixed{"date", "open", "high", "low", "close", "volume"};
    if (header.size() < fixed.size() || !std::equal(fixed.begin(), fixed.end(), header.begin()))
        throw PipelineError(fmt::format("market csv '{}': header must start with date,open,high,low,close,volume", path));

    std::vector<DailyMarketObservation> out;
    std::size_t lineno = 1, bad = 0;
    while (std::getline(f, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        const auto cells = split(line);
        try {
            if (cells.size() < fixed.size()) throw std::invalid_argument("too few columns");
            DailyMarketObservation o;
            o.date   = csv_date(cells[0]);
            o.open   = std::stod(cells[1]);
            o.high   = std::stod(cells[2]);
            o.low    = std::stod(cells[3]);
            o.close  = std::stod(cells[4]);
            o.volume = cells[5].empty() ? 0.0 : std::stod(cells[5]);
            for (std::size_t i=fixed.size(); i<header.size() && i<cells.size(); ++i)
                if (!cells[i].empty()) o.reference_close[header[i]] = std::stod(cells[i]);
            out.push_back(std::move(o));
        } catch (const std::exception& e) {
            // hibás sor: kihagyjuk, a többi betöltődik
            spdlog::warn("market csv {}:{}: skipped ({})", path, lineno, e.what());
            ++bad;
        }
    }
    spdlog::info("market csv '{}': {} rows loaded, {} skipped", path, out.size(), bad);
    return out;
}

std::map<Date, std::vector<double>> load_article_scores_csv(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw MissingUpstreamData(fmt::format("cannot open article csv '{}'", path));

    std::string line;
    std::getline(f, line);   // header: date,score

    std::map<Date, std::vector<double>> out;
    std::size_t lineno = 1, n = 0, bad = 0;
    while (std::getline(f, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        const auto cells = split(line);
        try {
            if (cells.size() < 2) throw std::invalid_argument("too few columns");
            const double s = std::stod(cells[1]);
            if (!std::isfinite(s)) throw std::invalid_argument("score is not finite");
            out[csv_date(cells[0])].push_back(std::clamp(s, -1.0, 1.0));
            ++n;
        } catch (const std::exception& e) {
            spdlog::warn("article csv {}:{}: skipped ({})", path, lineno, e.what());
            ++bad;
        }
    }
    spdlog::info("article csv '{}': {} articles over {} days, {} skipped", path, n, out.size(), bad);
    return out;
}

} // namespace data
