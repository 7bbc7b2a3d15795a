#pragma once

#include "simulation/SimulationTypes.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mtfcast {
namespace simulation {

// Opaque fit/predict unit driven by the backtest runner.
class ITrainableModel {
public:
    virtual ~ITrainableModel() = default;

    // Model identification
    virtual std::string GetModelType() const = 0;
    virtual std::string GetDescription() const = 0;

    // Core training and prediction. Long-running implementations should poll the token.
    virtual TrainingResult Fit(
        const FeatureMatrix& X_train,
        const std::vector<double>& y_train,
        const CancellationToken& token
    ) = 0;

    virtual PredictionResult Predict(
        const FeatureMatrix& X_test,
        const CancellationToken& token
    ) = 0;

    // Drop all learned state.
    virtual void Reset() = 0;

    struct Capabilities {
        bool supports_online_learning = false;
        bool supports_regularization = false;
        bool requires_feature_scaling = false;
    };
    virtual Capabilities GetCapabilities() const = 0;
};

// Construction parameters forwarded to registered creators.
struct ModelParameters {
    double ridge_alpha = 1.0;
};

// Factory for creating models by name
class ModelFactory {
public:
    struct ModelRegistration {
        std::function<std::unique_ptr<ITrainableModel>(const ModelParameters&)> create_model;
        std::string category;
        std::string description;
    };

    static void RegisterModel(
        const std::string& model_type,
        const ModelRegistration& registration
    );

    // nullptr for an unknown type.
    static std::unique_ptr<ITrainableModel> CreateModel(
        const std::string& model_type,
        const ModelParameters& params = {}
    );

    static std::map<std::string, std::vector<std::string>> GetModelsByCategory();
    static std::vector<std::string> GetAllModels();
    static bool IsModelAvailable(const std::string& model_type);

private:
    static std::map<std::string, ModelRegistration>& GetRegistry();
};

// Registers the built-in models. Safe to call more than once.
void InitializeModels();

} // namespace simulation
} // namespace mtfcast
