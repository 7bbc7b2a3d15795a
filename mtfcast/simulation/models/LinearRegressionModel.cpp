#include "simulation/models/LinearRegressionModel.h"

#include <Eigen/Cholesky>
#include <Eigen/SVD>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace mtfcast {
namespace simulation {
namespace models {

namespace {

Eigen::MatrixXd ToEigen(const FeatureMatrix& X) {
    Eigen::MatrixXd A(X.num_rows, X.num_features);
    for (int r = 0; r < X.num_rows; ++r) {
        for (int c = 0; c < X.num_features; ++c) {
            A(r, c) = X.At(r, c);
        }
    }
    return A;
}

} // namespace

LinearRegressionModel::LinearRegressionModel(double alpha)
    : m_alpha(alpha) {
    if (!(alpha >= 0.0)) {
        throw std::invalid_argument("ridge alpha must be non-negative");
    }
}

LinearRegressionModel::~LinearRegressionModel() = default;

TrainingResult LinearRegressionModel::Fit(const FeatureMatrix& X_train,
                                          const std::vector<double>& y_train,
                                          const CancellationToken& token) {
    TrainingResult result;
    if (X_train.num_rows != static_cast<int>(y_train.size())) {
        result.error_message = "row count does not match target count";
        return result;
    }
    if (X_train.num_rows < 2 || X_train.num_features == 0) {
        result.error_message = "need at least two rows and one feature";
        return result;
    }

    // Computed into locals; the fitted state only changes when the whole fit succeeds.
    Eigen::MatrixXd A = ToEigen(X_train);
    Eigen::VectorXd b = Eigen::Map<const Eigen::VectorXd>(y_train.data(), static_cast<Eigen::Index>(y_train.size()));

    Eigen::VectorXd featureMean = A.colwise().mean().transpose();
    A.rowwise() -= featureMean.transpose();
    Eigen::VectorXd featureScale = (A.array().square().colwise().sum() / static_cast<double>(A.rows())).sqrt().transpose();
    for (Eigen::Index c = 0; c < featureScale.size(); ++c) {
        // Constant columns carry no signal; keep them at zero after centering.
        if (featureScale(c) < 1e-12) {
            featureScale(c) = 1.0;
        }
    }
    A.array().rowwise() /= featureScale.transpose().array();

    const double yMean = b.mean();
    b.array() -= yMean;

    if (token.IsCancelled()) {
        result.error_message = "cancelled";
        return result;
    }

    Eigen::MatrixXd AtA = A.transpose() * A;
    AtA.diagonal().array() += m_alpha;
    Eigen::VectorXd Atb = A.transpose() * b;

    Eigen::VectorXd coefficients;
    Eigen::LDLT<Eigen::MatrixXd> ldlt(AtA);
    if (ldlt.info() == Eigen::Success && ldlt.isPositive()) {
        coefficients = ldlt.solve(Atb);
    } else {
        coefficients = AtA.bdcSvd(Eigen::ComputeThinU | Eigen::ComputeThinV).solve(Atb);
    }

    if (!coefficients.allFinite()) {
        result.error_message = "solver produced non-finite coefficients";
        return result;
    }

    m_featureMean = std::move(featureMean);
    m_featureScale = std::move(featureScale);
    m_coefficients = std::move(coefficients);
    m_intercept = yMean;
    m_fitted = true;
    result.success = true;
    result.model_learned = m_coefficients.squaredNorm() > 0.0;
    return result;
}

PredictionResult LinearRegressionModel::Predict(const FeatureMatrix& X_test,
                                                const CancellationToken& token) {
    PredictionResult result;
    if (!m_fitted) {
        result.error_message = "model is not fitted";
        return result;
    }
    if (X_test.num_features != m_coefficients.size()) {
        result.error_message = "expected " + std::to_string(m_coefficients.size())
                             + " features, got " + std::to_string(X_test.num_features);
        return result;
    }
    if (token.IsCancelled()) {
        result.error_message = "cancelled";
        return result;
    }

    Eigen::MatrixXd A = ToEigen(X_test);
    A.rowwise() -= m_featureMean.transpose();
    A.array().rowwise() /= m_featureScale.transpose().array();
    Eigen::VectorXd yhat = (A * m_coefficients).array() + m_intercept;

    result.predictions.assign(yhat.data(), yhat.data() + yhat.size());
    result.success = true;
    return result;
}

void LinearRegressionModel::Reset() {
    m_fitted = false;
    m_featureMean.resize(0);
    m_featureScale.resize(0);
    m_coefficients.resize(0);
    m_intercept = 0.0;
}

} // namespace models
} // namespace simulation
} // namespace mtfcast
