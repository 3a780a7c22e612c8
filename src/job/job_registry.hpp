/**
 * @file job_registry.hpp
 * @brief Maps logical job type names to factories.
 *
 * The isolated host rebuilds a job from its bundle by looking its type up
 * here, never by interpreting the payload as code.
 */

#pragma once

#include "core/result.hpp"
#include "job/job.hpp"

#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace jobtier {

class JobRegistry {
public:
    using Factory = std::function<std::unique_ptr<Job>(JobOptions)>;

    Result<void> add(std::string type_name, Factory factory);

    template <std::derived_from<Job> T>
    Result<void> add(std::string type_name) {
        return add(std::move(type_name),
                   [](JobOptions options) { return std::make_unique<T>(std::move(options)); });
    }

    [[nodiscard]] Result<std::unique_ptr<Job>> create(std::string_view type_name,
                                                      JobOptions options) const;

    [[nodiscard]] bool contains(std::string_view type_name) const;
    [[nodiscard]] size_t size() const noexcept { return factories_.size(); }
    [[nodiscard]] std::vector<std::string> type_names() const;

private:
    std::map<std::string, Factory, std::less<>> factories_;
};

}  // namespace jobtier
