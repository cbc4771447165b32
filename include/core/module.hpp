#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Bemeneti alak: egy sor vagy N soros ablak
enum class InputKind { SingleRow, Window };

struct InputShape {
    InputKind kind{InputKind::SingleRow};
    std::size_t rows{1};

    static InputShape single_row() { return {InputKind::SingleRow, 1}; }
    static InputShape window(std::size_t n) { return {InputKind::Window, n}; }

    // "single_row" vagy "window:N"; hibára std::invalid_argument
    static InputShape parse(const std::string& s);
    std::string str() const;
};

// Sorok időrendben (legrégebbi elöl), oszlopok a modell input_names() sorrendjében
using FeatureMatrix = std::vector<std::vector<double>>;

// Modell komponens interfész: minden betanított modell ezt valósítja meg.
// Betöltés után nem változik.
class IModelComponent {
public:
    virtual ~IModelComponent() = default;

    // Egyedi azonosító (pl. "lr", "xgb", "gru")
    virtual std::string id() const = 0;

    virtual InputShape shape() const = 0;

    // A tanításkori oszlopnevek, ebben a sorrendben várja a bemenetet
    virtual const std::vector<std::string>& input_names() const = 0;

    // P(holnap fel) [0,1]-ben; hibánál kivételt dob
    virtual double predict(const FeatureMatrix& x) const = 0;
};
