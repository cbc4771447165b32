#include "indicators/indicator_engine.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/gap_fill.hpp"
#include "indicators/rolling.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ind {

IndicatorEngine::IndicatorEngine(IndicatorConfig cfg) : cfg_(std::move(cfg)) {}

std::size_t IndicatorEngine::warmup_rows() const {
    // roc_3d 3 sort, a hozam alapú ablakok +1 sort igényelnek
    return std::max({cfg_.sma_window - 1, cfg_.bb_window - 1, std::size_t{3},
                     cfg_.corr_window, cfg_.beta_window});
}

std::string IndicatorEngine::sma_ratio_column() const {
    return fmt::format("close_to_sma{}_ratio", cfg_.sma_window);
}
std::string IndicatorEngine::corr_column(const std::string& ref) const {
    return fmt::format("{}_{}_corr_{}d", cfg_.primary, ref, cfg_.corr_window);
}
std::string IndicatorEngine::beta_column(const std::string& ref) const {
    return fmt::format("{}_{}_beta_{}d", cfg_.primary, ref, cfg_.beta_window);
}

IndicatorTable IndicatorEngine::compute(std::vector<DailyMarketObservation> obs) const {
    IndicatorTable out;
    std::stable_sort(obs.begin(), obs.end(),
                     [](const auto& a, const auto& b){ return a.date < b.date; });
    // duplikált nap: backfill javítás -> az utolsó nyer
    std::vector<DailyMarketObservation> uniq;
    uniq.reserve(obs.size());
    for (auto& o : obs){
        if (!uniq.empty() && uniq.back().date==o.date) uniq.back() = std::move(o);
        else uniq.push_back(std::move(o));
    }
    if (uniq.size() != obs.size())
        spdlog::warn("indicators: {} duplicate observation dates collapsed", obs.size()-uniq.size());

    const std::size_t n = uniq.size();
    std::vector<Date> calendar(n);
    std::vector<double> close(n), high(n), low(n), volume(n);
    std::size_t gaps=0;
    for (std::size_t i=0;i<n;++i){
        calendar[i] = uniq[i].date;
        close[i]  = uniq[i].close;
        high[i]   = uniq[i].high;
        low[i]    = uniq[i].low;
        volume[i] = uniq[i].volume;
        if (i>0 && calendar[i]-calendar[i-1] > 1) ++gaps;
    }
    if (gaps) spdlog::warn("indicators: primary series has {} calendar gaps", gaps);

    const Series c = to_series(close);
    const Series hi = to_series(high);
    const Series lo = to_series(low);

    std::vector<std::pair<std::string, Series>> cols;

    cols.emplace_back(sma_ratio_column(), divide(c, rolling_mean(c, cfg_.sma_window)));

    Series range(n);
    for (std::size_t i=0;i<n;++i)
        if (hi[i] && lo[i]) range[i] = *hi[i] - *lo[i];
    cols.emplace_back("high_low_range", divide(range, c));

    cols.emplace_back("roc_1d", scale(pct_change(c, 1), 100.0));
    cols.emplace_back("roc_3d", scale(pct_change(c, 3), 100.0));
    cols.emplace_back("bb_width", bb_width(c, cfg_.bb_window, cfg_.bb_k));
    cols.emplace_back("volume_change_1d", pct_change(to_series(volume), 1));

    const Series ret = pct_change(c, 1);
    for (const auto& ref : cfg_.references){
        std::map<Date, double> ref_close;
        for (const auto& o : uniq){
            auto it = o.reference_close.find(ref);
            if (it!=o.reference_close.end()) ref_close.emplace(o.date, it->second);
        }
        const Series aligned = align_to_calendar(calendar, ref_close);
        if (all_null(aligned)){
            spdlog::warn("indicators: reference '{}' has no data, correlation/beta columns excluded", ref);
            out.missing_references.push_back(ref);
            continue;
        }
        const Series ref_ret = pct_change(aligned, 1);
        cols.emplace_back(corr_column(ref), rolling_corr(ret, ref_ret, cfg_.corr_window));
        // beta = cov / var(ref); nulla variancia -> null
        cols.emplace_back(beta_column(ref),
                          divide(rolling_cov(ret, ref_ret, cfg_.beta_window),
                                 rolling_var(ref_ret, cfg_.beta_window)));
    }

    for (const auto& col : cols) out.columns.push_back(col.first);

    const std::size_t warmup = warmup_rows();
    for (std::size_t i=warmup; i<n; ++i){
        DailyIndicatorRow row;
        row.date = calendar[i];
        row.close = close[i];
        for (const auto& col : cols) row.values.emplace(col.first, col.second[i]);
        out.rows.push_back(std::move(row));
    }
    spdlog::info("indicators: {} observations -> {} rows ({} columns, warmup {})",
                 n, out.rows.size(), out.columns.size(), warmup);
    return out;
}

} // namespace ind
