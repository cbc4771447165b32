#include "strategy/models.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <fstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace strategy {

static double sigmoid(double z){
    return 1.0 / (1.0 + std::exp(-z));
}

static json read_json(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw PipelineError(fmt::format("cannot open '{}'", path));
    try {
        return json::parse(f);
    } catch (const json::parse_error& e) {
        throw PipelineError(fmt::format("'{}': {}", path, e.what()));
    }
}

StandardScaler::StandardScaler(std::vector<double> mean, std::vector<double> scale)
    : mean_(std::move(mean)), scale_(std::move(scale)) {
    if (mean_.size()!=scale_.size())
        throw PipelineError(fmt::format("scaler: mean has {} values, scale has {}", mean_.size(), scale_.size()));
}

std::vector<double> StandardScaler::transform(const std::vector<double>& x) const {
    if (x.size()!=mean_.size())
        throw PipelineError(fmt::format("scaler expects {} features, got {}", mean_.size(), x.size()));
    std::vector<double> out(x.size());
    for (std::size_t i=0;i<x.size();++i){
        // sklearn: nulla szórású oszlop skálája 1
        const double s = scale_[i]==0.0 ? 1.0 : scale_[i];
        out[i] = (x[i]-mean_[i]) / s;
    }
    return out;
}

StandardScaler StandardScaler::load(const std::string& path){
    const json j = read_json(path);
    return StandardScaler(j.at("mean").get<std::vector<double>>(),
                          j.at("scale").get<std::vector<double>>());
}

LogisticModel::LogisticModel(std::string id, std::vector<std::string> inputs,
                             std::vector<double> coef, double intercept)
    : id_(std::move(id)), inputs_(std::move(inputs)), coef_(std::move(coef)), intercept_(intercept) {
    if (coef_.size()!=inputs_.size())
        throw PipelineError(fmt::format("{}: {} coefficients for {} inputs", id_, coef_.size(), inputs_.size()));
}

double LogisticModel::predict(const FeatureMatrix& x) const {
    if (x.size()!=1 || x[0].size()!=coef_.size())
        throw PipelineError(fmt::format("{}: expected 1x{} input", id_, coef_.size()));
    double z = intercept_;
    for (std::size_t i=0;i<coef_.size();++i) z += coef_[i]*x[0][i];
    return sigmoid(z);
}

WindowLogisticModel::WindowLogisticModel(std::string id, std::vector<std::string> inputs,
                                         std::size_t window, std::vector<double> coef, double intercept)
    : id_(std::move(id)), inputs_(std::move(inputs)), window_(window),
      coef_(std::move(coef)), intercept_(intercept) {
    if (window_==0 || coef_.size()!=window_*inputs_.size())
        throw PipelineError(fmt::format("{}: {} coefficients for window {} x {} inputs",
                                        id_, coef_.size(), window_, inputs_.size()));
}

double WindowLogisticModel::predict(const FeatureMatrix& x) const {
    if (x.size()!=window_)
        throw PipelineError(fmt::format("{}: expected {} rows, got {}", id_, window_, x.size()));
    const std::size_t n = inputs_.size();
    double z = intercept_;
    for (std::size_t t=0;t<window_;++t){
        if (x[t].size()!=n)
            throw PipelineError(fmt::format("{}: row {} has {} values, expected {}", id_, t, x[t].size(), n));
        for (std::size_t i=0;i<n;++i) z += coef_[t*n+i]*x[t][i];
    }
    return sigmoid(z);
}

std::shared_ptr<const IModelComponent> load_model_artifact(const std::string& path,
                                                           const std::string& id,
                                                           InputShape expected){
    const json j = read_json(path);
    const std::string kind = j.at("kind").get<std::string>();
    auto inputs = j.at("input_names").get<std::vector<std::string>>();
    auto coef   = j.at("coef").get<std::vector<double>>();
    const double intercept = j.value("intercept", 0.0);

    if (kind=="logistic"){
        if (expected.kind!=InputKind::SingleRow)
            throw PipelineError(fmt::format("{}: artifact kind 'logistic' but shape {}", id, expected.str()));
        return std::make_shared<LogisticModel>(id, std::move(inputs), std::move(coef), intercept);
    }
    if (kind=="window_logistic"){
        const std::size_t w = j.at("window").get<std::size_t>();
        if (expected.kind!=InputKind::Window || expected.rows!=w)
            throw PipelineError(fmt::format("{}: artifact window {} but shape {}", id, w, expected.str()));
        return std::make_shared<WindowLogisticModel>(id, std::move(inputs), w, std::move(coef), intercept);
    }
    throw PipelineError(fmt::format("{}: unknown model kind '{}'", id, kind));
}

} // namespace strategy
