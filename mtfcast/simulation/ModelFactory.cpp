#include "simulation/ITrainableModel.h"
#include <mutex>

namespace mtfcast {
namespace simulation {

namespace {
std::mutex& RegistryMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

std::map<std::string, ModelFactory::ModelRegistration>& ModelFactory::GetRegistry() {
    static std::map<std::string, ModelRegistration> registry;
    return registry;
}

void ModelFactory::RegisterModel(
    const std::string& model_type,
    const ModelRegistration& registration) {
    std::lock_guard<std::mutex> lock(RegistryMutex());
    GetRegistry()[model_type] = registration;
}

std::unique_ptr<ITrainableModel> ModelFactory::CreateModel(
    const std::string& model_type,
    const ModelParameters& params) {
    std::function<std::unique_ptr<ITrainableModel>(const ModelParameters&)> creator;
    {
        std::lock_guard<std::mutex> lock(RegistryMutex());
        auto& registry = GetRegistry();
        auto it = registry.find(model_type);
        if (it == registry.end() || !it->second.create_model) {
            return nullptr;
        }
        creator = it->second.create_model;
    }
    return creator(params);
}

std::map<std::string, std::vector<std::string>> ModelFactory::GetModelsByCategory() {
    std::lock_guard<std::mutex> lock(RegistryMutex());
    std::map<std::string, std::vector<std::string>> result;
    for (const auto& [model_type, registration] : GetRegistry()) {
        result[registration.category].push_back(model_type);
    }
    return result;
}

std::vector<std::string> ModelFactory::GetAllModels() {
    std::lock_guard<std::mutex> lock(RegistryMutex());
    std::vector<std::string> result;
    for (const auto& [model_type, registration] : GetRegistry()) {
        result.push_back(model_type);
    }
    return result;
}

bool ModelFactory::IsModelAvailable(const std::string& model_type) {
    std::lock_guard<std::mutex> lock(RegistryMutex());
    auto& registry = GetRegistry();
    auto it = registry.find(model_type);
    return it != registry.end() && it->second.create_model;
}

} // namespace simulation
} // namespace mtfcast
