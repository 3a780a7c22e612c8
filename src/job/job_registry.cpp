/**
 * @file job_registry.cpp
 * @brief Type name to factory mapping used by the isolated host.
 */

#include "job/job_registry.hpp"

namespace jobtier {

Result<void> JobRegistry::add(std::string type_name, Factory factory) {
    if (type_name.empty()) {
        return Error{ErrorCode::Validation, "Job type name must not be empty"};
    }
    if (!factory) {
        return Error{ErrorCode::Validation, "Job type '" + type_name + "' has no factory"};
    }
    if (factories_.contains(type_name)) {
        return Error{ErrorCode::Validation, "Job type '" + type_name + "' already registered"};
    }
    factories_.emplace(std::move(type_name), std::move(factory));
    return Result<void>{};
}

Result<std::unique_ptr<Job>> JobRegistry::create(std::string_view type_name,
                                                 JobOptions options) const {
    auto it = factories_.find(type_name);
    if (it == factories_.end()) {
        return Error{ErrorCode::Validation,
                     "Unknown job type '" + std::string{type_name} + "'"};
    }
    auto job = it->second(std::move(options));
    if (!job) {
        return Error{ErrorCode::Generic,
                     "Factory for '" + std::string{type_name} + "' returned no job"};
    }
    return job;
}

bool JobRegistry::contains(std::string_view type_name) const {
    return factories_.find(type_name) != factories_.end();
}

std::vector<std::string> JobRegistry::type_names() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) names.push_back(name);
    return names;
}

}  // namespace jobtier
