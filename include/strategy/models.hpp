#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/module.hpp"

namespace strategy {

// Külső, rögzített skálázó: (x - mean) / scale
class StandardScaler {
public:
    StandardScaler(std::vector<double> mean, std::vector<double> scale);

    std::vector<double> transform(const std::vector<double>& x) const;
    std::size_t size() const { return mean_.size(); }

    // {"mean": [...], "scale": [...]}
    static StandardScaler load(const std::string& path);

private:
    std::vector<double> mean_;
    std::vector<double> scale_;
};

// single_row logisztikus regresszió
class LogisticModel final : public IModelComponent {
public:
    LogisticModel(std::string id, std::vector<std::string> inputs,
                  std::vector<double> coef, double intercept);

    std::string id() const override { return id_; }
    InputShape shape() const override { return InputShape::single_row(); }
    const std::vector<std::string>& input_names() const override { return inputs_; }
    double predict(const FeatureMatrix& x) const override;

private:
    std::string id_;
    std::vector<std::string> inputs_;
    std::vector<double> coef_;
    double intercept_;
};

// window:N modell: időlépésenként és inputonként egy együttható (sorfolytonos, legrégebbi elöl)
class WindowLogisticModel final : public IModelComponent {
public:
    WindowLogisticModel(std::string id, std::vector<std::string> inputs, std::size_t window,
                        std::vector<double> coef, double intercept);

    std::string id() const override { return id_; }
    InputShape shape() const override { return InputShape::window(window_); }
    const std::vector<std::string>& input_names() const override { return inputs_; }
    double predict(const FeatureMatrix& x) const override;

private:
    std::string id_;
    std::vector<std::string> inputs_;
    std::size_t window_;
    std::vector<double> coef_;
    double intercept_;
};

// Tetszőleges hívható (beágyazás, tesztek)
class CallbackModel final : public IModelComponent {
public:
    using Fn = std::function<double(const FeatureMatrix&)>;

    CallbackModel(std::string id, InputShape shape, std::vector<std::string> inputs, Fn fn)
        : id_(std::move(id)), shape_(shape), inputs_(std::move(inputs)), fn_(std::move(fn)) {}

    std::string id() const override { return id_; }
    InputShape shape() const override { return shape_; }
    const std::vector<std::string>& input_names() const override { return inputs_; }
    double predict(const FeatureMatrix& x) const override { return fn_(x); }

private:
    std::string id_;
    InputShape shape_;
    std::vector<std::string> inputs_;
    Fn fn_;
};

// JSON artefakt: {"kind": "logistic"|"window_logistic", "input_names": [...],
// "coef": [...], "intercept": x, "window": N}. A kind-nak egyeznie kell a várt alakkal.
std::shared_ptr<const IModelComponent> load_model_artifact(const std::string& path,
                                                           const std::string& id,
                                                           InputShape expected);

} // namespace strategy
