#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Indikátor motor beállításai
struct IndicatorConfig {
    std::string primary{"btc"};
    std::vector<std::string> references{"nasdaq", "gld"};
    std::size_t sma_window{10};
    std::size_t bb_window{20};
    double bb_k{2.0};
    std::size_t corr_window{5};
    std::size_t beta_window{10};
};

// Szentiment aggregátor beállításai
struct SentimentConfig {
    std::size_t quantile_window{60};  // trailing minta a kvantilis vödrökhöz
    std::size_t quantile_buckets{5};
    double negative_threshold{-0.2};
};

// Feature assembler / inkrementális frissítés
struct AssemblyConfig {
    int buffer_days{10};     // a watermark előtt ennyi napot mindig újraszámolunk
    int history_days{90};    // ennyi extra előzményt olvasunk be a gördülő ablakokhoz
    int write_retries{2};
    bool persist_intermediate{true};
};

// Ensemble
struct EnsembleConfig {
    double threshold{0.5};
    std::size_t window_size{5};
};

struct PipelineConfig {
    IndicatorConfig indicators;
    SentimentConfig sentiment;
    AssemblyConfig assembly;
    EnsembleConfig ensemble;
    std::string store_dir{"data"};
    std::string model_dir{"bitcoin_prediction_model"};
    std::string log_level{"info"};
};

// JSON fájlból tölti, a hiányzó kulcsok az alapértéken maradnak.
// Nem létező fájl -> alapértelmezett config (warn log).
PipelineConfig load_pipeline_config(const std::string& path);

// spdlog szint beállítása ("trace".."off")
void apply_log_level(const std::string& level);
