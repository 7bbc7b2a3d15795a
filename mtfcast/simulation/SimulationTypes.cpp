#include "simulation/SimulationTypes.h"

namespace mtfcast {
namespace simulation {

const char* FoldPolicyName(FoldPolicy policy) {
    switch (policy) {
        case FoldPolicy::Rolling: return "rolling";
        case FoldPolicy::Expanding: return "expanding";
    }
    return "rolling";
}

const char* FoldModeName(FoldMode mode) {
    switch (mode) {
        case FoldMode::Independent: return "independent";
        case FoldMode::Incremental: return "incremental";
    }
    return "independent";
}

const char* FoldStatusName(FoldStatus status) {
    switch (status) {
        case FoldStatus::Ok: return "ok";
        case FoldStatus::Failed: return "failed";
        case FoldStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

} // namespace simulation
} // namespace mtfcast
