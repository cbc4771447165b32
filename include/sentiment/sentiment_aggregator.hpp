#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace sent {

enum class Provenance { Observed, Interpolated };

inline const char* to_string(Provenance p) {
    return p == Provenance::Observed ? "observed" : "interpolated";
}

struct DailySentimentRow {
    Date date{};
    OptDouble mean_sentiment;      // [-1,1], interpoláció után mindig van értéke
    Provenance provenance{Provenance::Observed};
    std::size_t article_count{0};

    // gördülő mezők az interpolált soron
    double sent_3d{0.0};
    double sent_5d{0.0};
    double sent_vol{0.0};          // 5 napos szórás
    double sent_delta{0.0};
    double sent_accel{0.0};

    int quantile_bucket{0};        // 1-alapú vödör a trailing eloszlásban
    bool q2_flag{false};
    bool q5_flag{false};
    bool cross_up{false};          // mean > 3d átlag és mean > 0
    bool negative{false};          // mean < negatív küszöb
};

// Fekete doboz: szöveg -> [-1,1]
using SentimentScorer = std::function<double(const std::string&)>;

// Üres szövegeket kihagyja, a hibázó / nem véges pontszámot eldobja,
// a többit [-1,1]-re vágja. Nincs használható cikk -> nullopt.
OptDouble mean_article_sentiment(const std::vector<std::string>& texts,
                                 const SentimentScorer& scorer);

// 1-alapú kvantilis vödör a minta alapján (pandas qcut szemantika:
// lineáris kvantilisek, jobbról zárt, duplikált határok elhagyva).
// Kevesebb különböző érték mint q -> q = különbözők száma;
// egyetlen különböző érték -> fix középső vödör.
int quantile_bucket(std::vector<double> sample, double x, std::size_t q);

class SentimentAggregator {
public:
    explicit SentimentAggregator(SentimentConfig cfg = {});

    // Naptári naponként [from, to]; cikk nélküli nap -> mean null
    std::vector<DailySentimentRow> aggregate(const std::map<Date, std::vector<double>>& scores,
                                             Date from, Date to) const;

    // ffill -> bfill -> lineáris; ha minden null, 0.0 (semleges). Visszaadja a kitöltöttek számát.
    static std::size_t interpolate(std::vector<DailySentimentRow>& rows);

    // Gördülő mezők és flag-ek; interpolált sorokat vár
    void derive(std::vector<DailySentimentRow>& rows) const;

    // aggregate + interpolate + derive
    std::vector<DailySentimentRow> build(const std::map<Date, std::vector<double>>& scores,
                                         Date from, Date to) const;

    const SentimentConfig& config() const { return cfg_; }

private:
    SentimentConfig cfg_;
};

} // namespace sent
