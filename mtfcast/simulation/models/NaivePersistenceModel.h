#pragma once

#include "simulation/ITrainableModel.h"

#include <algorithm>

namespace mtfcast {
namespace simulation {
namespace models {

// Random-walk baseline: the forecast is the reference close the row was built at.
class NaivePersistenceModel : public ITrainableModel {
public:
    static constexpr const char* kCloseFeature = "ref_close";

    std::string GetModelType() const override { return "naive"; }
    std::string GetDescription() const override { return "Last reference close persistence"; }

    TrainingResult Fit(const FeatureMatrix& X_train,
                       const std::vector<double>& y_train,
                       const CancellationToken&) override {
        TrainingResult result;
        if (X_train.num_rows != static_cast<int>(y_train.size())) {
            result.error_message = "row count does not match target count";
            return result;
        }
        m_closeColumn = FindCloseColumn(X_train);
        if (m_closeColumn < 0) {
            result.error_message = std::string("feature '") + kCloseFeature + "' not present";
            return result;
        }
        result.success = true;
        return result;
    }

    PredictionResult Predict(const FeatureMatrix& X_test, const CancellationToken&) override {
        PredictionResult result;
        int column = FindCloseColumn(X_test);
        if (column < 0) {
            result.error_message = std::string("feature '") + kCloseFeature + "' not present";
            return result;
        }
        result.predictions.reserve(X_test.num_rows);
        for (int r = 0; r < X_test.num_rows; ++r) {
            result.predictions.push_back(X_test.At(r, column));
        }
        result.success = true;
        return result;
    }

    void Reset() override { m_closeColumn = -1; }

    Capabilities GetCapabilities() const override {
        return {.supports_online_learning = true};
    }

private:
    static int FindCloseColumn(const FeatureMatrix& X) {
        auto it = std::find(X.feature_names.begin(), X.feature_names.end(), kCloseFeature);
        return it == X.feature_names.end() ? -1 : static_cast<int>(it - X.feature_names.begin());
    }

    int m_closeColumn = -1;
};

} // namespace models
} // namespace simulation
} // namespace mtfcast
