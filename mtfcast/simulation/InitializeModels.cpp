#include "simulation/ITrainableModel.h"
#include "simulation/models/LinearRegressionModel.h"
#include "simulation/models/NaivePersistenceModel.h"

namespace mtfcast {
namespace simulation {

// Called once at startup to register all built-in models
void InitializeModels() {
    ModelFactory::RegisterModel("naive", {
        .create_model = [](const ModelParameters&) {
            return std::make_unique<models::NaivePersistenceModel>();
        },
        .category = "Baseline",
        .description = "Predicts the last observed reference close"
    });

    ModelFactory::RegisterModel("linear", {
        .create_model = [](const ModelParameters& params) {
            return std::make_unique<models::LinearRegressionModel>(params.ridge_alpha);
        },
        .category = "Linear Models",
        .description = "Ridge regression on standardized features"
    });
}

} // namespace simulation
} // namespace mtfcast
