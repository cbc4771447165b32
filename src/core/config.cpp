#include "core/config.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

// Egész érték előjelesen olvasva, hogy a negatív szám ne forduljon át size_t-re
static long long read_int(const json& obj, const char* key, long long dflt, long long min) {
    if (!obj.contains(key)) return dflt;
    const auto& v = obj[key];
    if (!v.is_number_integer())
        throw PipelineError(fmt::format("config: '{}' must be an integer", key));
    const long long x = v.get<long long>();
    if (x < min)
        throw PipelineError(fmt::format("config: '{}' must be >= {}, got {}", key, min, x));
    return x;
}

template <class T>
static void read_into(T& out, const json& obj, const char* key, long long min) {
    out = static_cast<T>(read_int(obj, key, static_cast<long long>(out), min));
}

PipelineConfig load_pipeline_config(const std::string& path) {
    PipelineConfig cfg;
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::warn("config '{}' not found, using defaults", path);
        return cfg;
    }

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw PipelineError(fmt::format("config '{}' parse error: {}", path, e.what()));
    }

    cfg.store_dir = j.value("store_dir", cfg.store_dir);
    cfg.model_dir = j.value("model_dir", cfg.model_dir);
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (j.contains("indicators")) {
        const auto& i = j["indicators"];
        auto& c = cfg.indicators;
        c.primary     = i.value("primary", c.primary);
        c.references  = i.value("references", c.references);
        c.bb_k        = i.value("bb_k", c.bb_k);
        read_into(c.sma_window, i, "sma_window", 1);
        read_into(c.bb_window, i, "bb_window", 2);
        read_into(c.corr_window, i, "corr_window", 2);
        read_into(c.beta_window, i, "beta_window", 2);
    }
    if (j.contains("sentiment")) {
        const auto& s = j["sentiment"];
        auto& c = cfg.sentiment;
        read_into(c.quantile_window, s, "quantile_window", 1);
        read_into(c.quantile_buckets, s, "quantile_buckets", 1);
        c.negative_threshold = s.value("negative_threshold", c.negative_threshold);
    }
    if (j.contains("assembly")) {
        const auto& a = j["assembly"];
        auto& c = cfg.assembly;
        read_into(c.buffer_days, a, "buffer_days", 0);
        read_into(c.history_days, a, "history_days", 0);
        read_into(c.write_retries, a, "write_retries", 0);
        c.persist_intermediate = a.value("persist_intermediate", c.persist_intermediate);
    }
    if (j.contains("ensemble")) {
        const auto& e = j["ensemble"];
        cfg.ensemble.threshold   = e.value("threshold", cfg.ensemble.threshold);
        read_into(cfg.ensemble.window_size, e, "window_size", 1);
    }

    spdlog::info("config loaded from '{}'", path);
    return cfg;
}

void apply_log_level(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}
