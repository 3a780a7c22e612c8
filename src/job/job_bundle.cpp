/**
 * @file job_bundle.cpp
 * @brief Bundle encoding, strict decoding and job reconstruction.
 */

#include "job/job_bundle.hpp"

#include "core/sanitize.hpp"

#include <array>
#include <limits>

namespace jobtier {

namespace {

constexpr std::array<std::string_view, 8> kBundleKeys = {
    "format", "version", "type", "id", "timeout_s", "max_memory_mb", "priority", "fields"};

Error bad_bundle(const std::string& detail) {
    return Error{ErrorCode::Validation, "Invalid job bundle: " + detail};
}

Result<uint32_t> read_unsigned(const nlohmann::json& obj, const char* key) {
    const auto& v = obj.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0
        || v.get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
        return bad_bundle(std::string{"'"} + key + "' must be a non-negative integer");
    }
    return static_cast<uint32_t>(v.get<int64_t>());
}

}  // anonymous namespace

Result<void> check_plain_data(const nlohmann::json& value) {
    using value_t = nlohmann::json::value_t;
    switch (value.type()) {
        case value_t::null:
        case value_t::boolean:
        case value_t::number_integer:
        case value_t::number_unsigned:
        case value_t::number_float:
        case value_t::string:
            return Result<void>{};
        case value_t::array:
        case value_t::object:
            // Iterating an object visits its values
            for (const auto& item : value) {
                if (auto r = check_plain_data(item); !r) return r;
            }
            return Result<void>{};
        case value_t::binary:
            return Error{ErrorCode::Validation, "Job fields must not contain binary values"};
        case value_t::discarded:
            return Error{ErrorCode::Validation, "Job fields contain a discarded value"};
    }
    return Error{ErrorCode::Validation, "Job fields contain an unsupported value"};
}

Result<JobBundle> make_bundle(const Job& job) {
    auto fields = job.save_fields();
    if (!fields.is_object()) {
        return Error{ErrorCode::Validation,
                     std::string{job.type_name()} + " fields must be a JSON object"};
    }
    if (auto r = check_plain_data(fields); !r) return r.error();

    JobBundle bundle;
    bundle.type = std::string{job.type_name()};
    bundle.id = job.id();
    bundle.timeout_s = job.timeout_seconds();
    bundle.max_memory_mb = job.max_memory_mb();
    bundle.priority = job.priority();
    bundle.fields = std::move(fields);
    return bundle;
}

Result<std::string> encode_bundle(const JobBundle& bundle) {
    nlohmann::json doc = {
        {"format", std::string{kBundleFormat}},
        {"version", kBundleVersion},
        {"type", bundle.type},
        {"id", bundle.id},
        {"timeout_s", bundle.timeout_s},
        {"max_memory_mb", bundle.max_memory_mb},
        {"priority", bundle.priority},
        {"fields", bundle.fields},
    };
    try {
        return doc.dump();
    } catch (const nlohmann::json::type_error&) {
        return Error{ErrorCode::Validation,
                     "Job " + sanitize_job_id(bundle.id)
                         + " has a text field that is not valid UTF-8"};
    }
}

Result<JobBundle> decode_bundle(std::string_view text) {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) return bad_bundle("not valid JSON");
    if (!doc.is_object()) return bad_bundle("top level must be an object");

    for (const auto& item : doc.items()) {
        const auto& key = item.key();
        bool known = false;
        for (auto k : kBundleKeys) known = known || key == k;
        if (!known) return bad_bundle("unexpected key '" + key + "'");
    }
    for (auto k : kBundleKeys) {
        if (!doc.contains(std::string{k})) return bad_bundle("missing key '" + std::string{k} + "'");
    }

    if (!doc["format"].is_string() || doc["format"].get<std::string>() != kBundleFormat) {
        return bad_bundle("unrecognised format");
    }
    if (!doc["version"].is_number_integer() || doc["version"].get<int>() != kBundleVersion) {
        return bad_bundle("unsupported version");
    }
    if (!doc["type"].is_string() || doc["type"].get<std::string>().empty()) {
        return bad_bundle("'type' must be a non-empty string");
    }
    if (!doc["id"].is_string() || doc["id"].get<std::string>().empty()) {
        return bad_bundle("'id' must be a non-empty string");
    }
    if (!doc["priority"].is_number_integer()) {
        return bad_bundle("'priority' must be an integer");
    }
    if (!doc["fields"].is_object()) {
        return bad_bundle("'fields' must be an object");
    }

    auto timeout = read_unsigned(doc, "timeout_s");
    if (!timeout) return timeout.error();
    auto memory = read_unsigned(doc, "max_memory_mb");
    if (!memory) return memory.error();

    auto priority = doc["priority"].get<int64_t>();
    if (priority < std::numeric_limits<int32_t>::min()
        || priority > std::numeric_limits<int32_t>::max()) {
        return bad_bundle("'priority' out of range");
    }

    JobBundle bundle;
    bundle.type = doc["type"].get<std::string>();
    bundle.id = doc["id"].get<std::string>();
    bundle.timeout_s = *timeout;
    bundle.max_memory_mb = *memory;
    bundle.priority = static_cast<int32_t>(priority);
    bundle.fields = std::move(doc["fields"]);
    return bundle;
}

Result<std::unique_ptr<Job>> reconstruct_job(const JobBundle& bundle,
                                             const JobRegistry& registry) {
    JobOptions options;
    options.id = bundle.id;
    options.timeout_s = bundle.timeout_s;
    options.max_memory_mb = bundle.max_memory_mb;
    options.priority = bundle.priority;
    options.isolated = true;

    auto created = registry.create(bundle.type, std::move(options));
    if (!created) return created.error();

    auto job = std::move(created).value();
    if (auto loaded = job->load_fields(bundle.fields); !loaded) {
        return loaded.error();
    }
    return job;
}

}  // namespace jobtier
