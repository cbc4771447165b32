#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "data/csv_loader.hpp"
#include "data/json_table_store.hpp"
#include "features/feature_contract.hpp"
#include "pipeline/pipeline.hpp"
#include "strategy/model_registry.hpp"

static void usage() {
    std::cout << "Hasznalat: nextday [--config <path>] <command> [args]\n"
                 "  import-market <csv>          date,open,high,low,close,volume[,<ref>...]\n"
                 "  import-articles <csv>        date,score\n"
                 "  assemble [--update-only]     feature tabla ujraszamolasa\n"
                 "  predict [YYYY-MM-DD]         masnapi irany (alap: mai UTC nap)\n"
                 "  run                          assemble --update-only + predict\n";
}

// kilépési kódok
enum Exit { Ok = 0, Usage = 1, NoData = 2, NoModels = 3, Failure = 4 };

static int cmd_predict(pipeline::Pipeline& p, const PipelineConfig& cfg,
                       const feat::FeatureContract& contract, Date as_of) {
    auto engine = strategy::ModelRegistry::instance().get(cfg.model_dir, cfg.ensemble, contract);
    const auto d = p.predict_next_day(as_of, *engine);
    std::cout << to_string_date(d.target_date) << " " << to_string(d.direction)
              << " | p_up: " << d.probability_up
              << " | confidence: " << d.confidence << "\n";
    for (const auto& c : d.components) {
        std::cout << "  " << c.id << " w=" << c.weight << " " << strategy::to_string(c.status);
        if (c.probability_up) std::cout << " p=" << *c.probability_up;
        if (!c.error.empty()) std::cout << " (" << c.error << ")";
        std::cout << "\n";
    }
    return Ok;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = "config/pipeline.json";
    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        usage();
        return Usage;
    }
    const std::string cmd = args[0];

    try {
        const PipelineConfig cfg = load_pipeline_config(config_path);
        apply_log_level(cfg.log_level);

        const auto& contract = feat::FeatureContract::v13();
        data::JsonTableStore store(cfg.store_dir, contract);
        pipeline::Pipeline p(cfg, store, contract);

        if (cmd == "import-market" && args.size() >= 2) {
            const auto rows = data::load_market_csv(args[1]);
            store.begin_batch();
            for (const auto& o : rows) store.upsert_market(o);
            store.flush();
            std::cout << "Imported " << rows.size() << " market rows\n";
            return Ok;
        }
        if (cmd == "import-articles" && args.size() >= 2) {
            const auto days = data::load_article_scores_csv(args[1]);
            store.begin_batch();
            for (const auto& [date, scores] : days) store.upsert_article_scores(date, scores);
            store.flush();
            std::cout << "Imported article scores for " << days.size() << " days\n";
            return Ok;
        }
        if (cmd == "assemble") {
            const bool update_only = args.size() >= 2 && args[1] == "--update-only";
            const auto rep = p.assemble_features(update_only);
            std::cout << "Features: " << rep.written << " written"
                      << " | dropped: " << rep.dropped
                      << " | erased: " << rep.erased
                      << " | failed: " << rep.failed << "\n";
            return rep.failed ? Failure : Ok;
        }
        if (cmd == "predict") {
            const Date as_of = args.size() >= 2 ? parse_date(args[1]) : today_utc();
            return cmd_predict(p, cfg, contract, as_of);
        }
        if (cmd == "run") {
            const auto rep = p.assemble_features(true);
            std::cout << "Features: " << rep.written << " written | dropped: " << rep.dropped
                      << " | failed: " << rep.failed << "\n";
            return cmd_predict(p, cfg, contract, today_utc());
        }
        usage();
        return Usage;
    } catch (const MissingUpstreamData& e) {
        spdlog::error("missing upstream data: {}", e.what());
        return NoData;
    } catch (const NoViableModelComponents& e) {
        spdlog::error("{}", e.what());
        return NoModels;
    } catch (const std::invalid_argument& e) {
        spdlog::error("invalid argument: {}", e.what());
        return Usage;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return Failure;
    }
}
