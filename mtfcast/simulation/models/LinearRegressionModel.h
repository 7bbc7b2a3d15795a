#pragma once

#include "simulation/ITrainableModel.h"

#include <Eigen/Dense>

namespace mtfcast {
namespace simulation {
namespace models {

// Ridge regression on standardized features with an unpenalized intercept.
class LinearRegressionModel : public ITrainableModel {
public:
    explicit LinearRegressionModel(double alpha = 1.0);
    ~LinearRegressionModel() override;

    std::string GetModelType() const override { return "linear"; }
    std::string GetDescription() const override {
        return "Ridge regression (alpha=" + std::to_string(m_alpha) + ")";
    }

    TrainingResult Fit(const FeatureMatrix& X_train,
                       const std::vector<double>& y_train,
                       const CancellationToken& token) override;

    PredictionResult Predict(const FeatureMatrix& X_test,
                             const CancellationToken& token) override;

    void Reset() override;

    Capabilities GetCapabilities() const override {
        return {
            .supports_online_learning = false,
            .supports_regularization = true,
            .requires_feature_scaling = false
        };
    }

    bool IsFitted() const { return m_fitted; }
    const Eigen::VectorXd& GetCoefficients() const { return m_coefficients; }
    double GetIntercept() const { return m_intercept; }

private:
    double m_alpha;
    bool m_fitted = false;
    Eigen::VectorXd m_featureMean;
    Eigen::VectorXd m_featureScale;
    Eigen::VectorXd m_coefficients;
    double m_intercept = 0.0;
};

} // namespace models
} // namespace simulation
} // namespace mtfcast
