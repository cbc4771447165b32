#include "features/feature_assembler.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace feat {

FeatureAssembler::FeatureAssembler(const FeatureContract& contract, std::size_t sma_window)
    : contract_(contract),
      sma_ratio_col_(fmt::format("close_to_sma{}_ratio", sma_window)),
      q2_x_sma_col_(fmt::format("sent_q2_flag_x_close_to_sma{}", sma_window)) {}

static OptDouble product(double flag, const OptDouble& x){
    if (!x) return std::nullopt;
    return flag * *x;
}

std::map<std::string, OptDouble> FeatureAssembler::named_values(const ind::DailyIndicatorRow& i,
                                                                const sent::DailySentimentRow& s) const {
    std::map<std::string, OptDouble> v = i.values;

    v["mean_sentiment"] = s.mean_sentiment;
    v["sent_3d"]        = s.sent_3d;
    v["sent_5d"]        = s.sent_5d;
    v["sent_vol"]       = s.sent_vol;
    v["sent_delta"]     = s.sent_delta;
    v["sent_accel"]     = s.sent_accel;
    v["sent_q2_flag"]   = s.q2_flag ? 1.0 : 0.0;
    v["sent_q5_flag"]   = s.q5_flag ? 1.0 : 0.0;
    v["sent_cross_up"]  = s.cross_up ? 1.0 : 0.0;
    v["sent_neg"]       = s.negative ? 1.0 : 0.0;

    // pontos skalár szorzat, null tényező -> null
    const OptDouble range = i.get("high_low_range");
    v[q2_x_sma_col_]                    = product(s.q2_flag ? 1.0 : 0.0, i.get(sma_ratio_col_));
    v["sent_cross_up_x_high_low_range"] = product(s.cross_up ? 1.0 : 0.0, range);
    v["sent_neg_x_high_low_range"]      = product(s.negative ? 1.0 : 0.0, range);
    return v;
}

AssemblyResult FeatureAssembler::assemble(const std::vector<ind::DailyIndicatorRow>& indicators,
                                          const std::vector<sent::DailySentimentRow>& sentiment) const {
    AssemblyResult out;

    std::map<Date, const sent::DailySentimentRow*> by_date;
    for (const auto& s : sentiment) by_date[s.date] = &s;
    std::map<Date, double> close;
    for (const auto& i : indicators) close[i.date] = i.close;

    for (const auto& i : indicators){
        auto it = by_date.find(i.date);
        if (it==by_date.end()) continue;    // inner join
        ++out.joined;

        FeatureRow row;
        row.date = i.date;
        try {
            row.values = contract_.extract(named_values(i, *it->second), i.date);
        } catch (const IncompleteFeatureRow& e) {
            spdlog::debug("assembler: {} dropped, null: {}", to_string_date(i.date), fmt::join(e.missing(), ", "));
            ++out.dropped;
            out.dropped_dates.push_back(i.date);
            continue;
        }

        // célváltozó csak ha a következő naptári nap zárója ismert
        auto next = close.find(i.date + 1);
        if (next!=close.end()) row.target = next->second > i.close ? 1 : 0;
        out.rows.push_back(std::move(row));
    }

    if (out.dropped)
        spdlog::warn("assembler: {} of {} joined days dropped (incomplete feature row)", out.dropped, out.joined);
    spdlog::info("assembler: {} indicator rows, {} sentiment rows -> {} feature rows ({})",
                 indicators.size(), sentiment.size(), out.rows.size(), contract_.version());
    return out;
}

} // namespace feat
