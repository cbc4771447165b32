#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Pipeline hibák. Az egyedi rekord/komponens hibákat helyben kezeljük,
// a teljes ciklust érintőek a hívóig jutnak.
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Forrás adat hiányzik / üres a kért tartományra
class MissingUpstreamData : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// Join után egy vagy több kontrakt mező null -> a nap kimarad
class IncompleteFeatureRow : public PipelineError {
public:
    IncompleteFeatureRow(const std::string& what, std::vector<std::string> missing)
        : PipelineError(what), missing_(std::move(missing)) {}
    const std::vector<std::string>& missing() const { return missing_; }
private:
    std::vector<std::string> missing_;
};

// Modell bemenet nem képezhető le kontrakt mezőre (csak az adott komponensre végzetes)
class UnresolvedFeatureAlias : public PipelineError {
public:
    UnresolvedFeatureAlias(const std::string& what, std::vector<std::string> missing)
        : PipelineError(what), missing_(std::move(missing)) {}
    const std::vector<std::string>& missing() const { return missing_; }
private:
    std::vector<std::string> missing_;
};

// Egyetlen komponens sem adott jóslatot
class NoViableModelComponents : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// Tároló írási hiba (rekord szinten)
class UpstreamWriteFailure : public PipelineError {
public:
    using PipelineError::PipelineError;
};
