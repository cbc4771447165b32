#include "sentiment/sentiment_aggregator.hpp"
#include "indicators/gap_fill.hpp"
#include "indicators/rolling.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace sent {

OptDouble mean_article_sentiment(const std::vector<std::string>& texts,
                                 const SentimentScorer& scorer){
    double sum=0.0; std::size_t n=0;
    for (const auto& t : texts){
        if (std::all_of(t.begin(), t.end(), [](unsigned char c){ return std::isspace(c); }))
            continue;
        double s;
        try {
            s = scorer(t);
        } catch (const std::exception& e) {
            spdlog::warn("sentiment scorer failed on article: {}", e.what());
            continue;
        }
        if (!std::isfinite(s)) continue;
        sum += std::clamp(s, -1.0, 1.0);
        ++n;
    }
    if (n==0) return std::nullopt;
    return sum/static_cast<double>(n);
}

static double sample_quantile(const std::vector<double>& sorted, double p){
    const double h = p * static_cast<double>(sorted.size()-1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(h));
    if (lo+1 >= sorted.size()) return sorted.back();
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[lo+1]-sorted[lo]);
}

int quantile_bucket(std::vector<double> sample, double x, std::size_t q){
    if (sample.empty() || q==0) throw std::invalid_argument("quantile_bucket: empty sample");
    std::sort(sample.begin(), sample.end());
    std::vector<double> distinct = sample;
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    if (distinct.size() <= 1) return static_cast<int>(q/2 + 1);   // q=5 -> 3, nincs flag
    q = std::min(q, distinct.size());

    std::vector<double> edges;
    for (std::size_t k=0;k<=q;++k)
        edges.push_back(sample_quantile(sample, static_cast<double>(k)/static_cast<double>(q)));
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

    // (e0,e1], (e1,e2], ... ; az alsó határ a legelső vödörbe esik
    if (x <= edges.front()) return 1;
    auto it = std::lower_bound(edges.begin()+1, edges.end(), x);
    if (it==edges.end()) return static_cast<int>(edges.size()-1);
    return static_cast<int>(it - edges.begin());
}

SentimentAggregator::SentimentAggregator(SentimentConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<DailySentimentRow> SentimentAggregator::aggregate(
        const std::map<Date, std::vector<double>>& scores, Date from, Date to) const {
    std::vector<DailySentimentRow> rows;
    if (to < from) return rows;
    rows.reserve(static_cast<std::size_t>(to-from+1));
    for (Date d=from; d<=to; ++d){
        DailySentimentRow r;
        r.date = d;
        auto it = scores.find(d);
        if (it!=scores.end() && !it->second.empty()){
            const auto& v = it->second;
            r.mean_sentiment = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
            r.article_count = v.size();
        }
        rows.push_back(r);
    }
    return rows;
}

std::size_t SentimentAggregator::interpolate(std::vector<DailySentimentRow>& rows){
    ind::Series s(rows.size());
    for (std::size_t i=0;i<rows.size();++i) s[i] = rows[i].mean_sentiment;

    const bool none = ind::all_null(s);
    ind::fill_forward(s);
    ind::fill_backward(s);
    ind::interpolate_linear(s);

    std::size_t filled=0;
    std::vector<std::string> dates;
    for (std::size_t i=0;i<rows.size();++i){
        if (rows[i].mean_sentiment) continue;
        rows[i].mean_sentiment = s[i] ? *s[i] : 0.0;
        rows[i].provenance = Provenance::Interpolated;
        dates.push_back(to_string_date(rows[i].date));
        ++filled;
    }
    if (none && !rows.empty())
        spdlog::warn("sentiment: no articles in the whole batch, using neutral 0.0 for {} days", rows.size());
    else if (filled)
        spdlog::info("sentiment: interpolated {} days without articles: {}", filled, fmt::join(dates, ", "));
    return filled;
}

void SentimentAggregator::derive(std::vector<DailySentimentRow>& rows) const {
    ind::Series s(rows.size());
    for (std::size_t i=0;i<rows.size();++i){
        if (!rows[i].mean_sentiment)
            throw std::logic_error(fmt::format("sentiment: {} not interpolated before derive",
                                               to_string_date(rows[i].date)));
        s[i] = rows[i].mean_sentiment;
    }

    const auto m3  = ind::rolling_mean(s, 3);
    const auto m5  = ind::rolling_mean(s, 5);
    const auto sd5 = ind::rolling_std(s, 5);

    for (std::size_t i=0;i<rows.size();++i){
        auto& r = rows[i];
        const double x = *r.mean_sentiment;
        // nem teljes ablak -> 0 (mint a tanító adatsorban)
        r.sent_3d  = m3[i].value_or(0.0);
        r.sent_5d  = m5[i].value_or(0.0);
        r.sent_vol = sd5[i].value_or(0.0);
        r.sent_delta = i>0 ? x - *rows[i-1].mean_sentiment : 0.0;
        r.sent_accel = i>0 ? r.sent_delta - rows[i-1].sent_delta : 0.0;
        r.cross_up = x > r.sent_3d && x > 0.0;
        r.negative = x < cfg_.negative_threshold;

        const std::size_t w = std::max<std::size_t>(1, cfg_.quantile_window);
        const std::size_t start = i+1 >= w ? i+1-w : 0;
        std::vector<double> sample;
        sample.reserve(i+1-start);
        for (std::size_t k=start;k<=i;++k) sample.push_back(*rows[k].mean_sentiment);
        r.quantile_bucket = quantile_bucket(std::move(sample), x, cfg_.quantile_buckets);
        r.q2_flag = r.quantile_bucket == 2;
        r.q5_flag = r.quantile_bucket == 5;
    }
}

std::vector<DailySentimentRow> SentimentAggregator::build(
        const std::map<Date, std::vector<double>>& scores, Date from, Date to) const {
    auto rows = aggregate(scores, from, to);
    interpolate(rows);
    derive(rows);
    return rows;
}

} // namespace sent
