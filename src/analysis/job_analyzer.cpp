/**
 * @file job_analyzer.cpp
 * @brief JobAnalyzer implementation — pattern tables, statistics persistence.
 */

#include "analysis/job_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <regex>

namespace jobtier {

namespace {

constexpr std::streamsize kMaxScanBytes = 1024 * 1024;

struct BlockingPattern {
    std::string category;
    std::regex pattern;
    int weight;
};

const std::vector<BlockingPattern>& blocking_patterns() {
    static const std::vector<BlockingPattern> patterns = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        std::vector<BlockingPattern> p;
        p.push_back({"sleep",
                     std::regex(R"(\b(sleep|usleep|nanosleep|sleep_for|sleep_until)\s*\()", flags),
                     10});
        p.push_back({"image_processing",
                     std::regex(R"(\b(stbi_load|imread|imwrite|Magick|png_read_image|jpeg_read_scanlines)\b)",
                                flags),
                     6});
        p.push_back({"video_processing",
                     std::regex(R"(\b(ffmpeg|avcodec|avformat|libx264|transcode|video)\b)", flags),
                     8});
        p.push_back({"pdf_generation",
                     std::regex(R"(\b(HPDF_\w+|podofo|cairo_pdf_surface_create|wkhtmltopdf)\b)", flags),
                     8});
        p.push_back({"encryption",
                     std::regex(R"(\b(EVP_(Encrypt|Decrypt|Cipher)\w*|PKCS5_PBKDF2_HMAC\w*|bcrypt\w*|argon2\w*|crypto_pwhash\w*)\b)",
                                flags),
                     6});
        p.push_back({"http_sync",
                     std::regex(R"(\b(curl_easy_perform|httplib::Client|cpr::Get|cpr::Post|http::read)\b)",
                                flags),
                     5});
        p.push_back({"shell_exec",
                     std::regex(R"(\b(system|popen|execv|execvp|execve|execl|execlp|posix_spawnp?|fork)\s*\()",
                                flags),
                     5});
        p.push_back({"large_files",
                     std::regex(R"(\b(fread|fwrite|copy_file|rename|ifstream|ofstream)\b)", flags),
                     4});
        p.push_back({"db_heavy",
                     std::regex(R"(\b(sqlite3_exec|PQexec|mysql_query|bulk_insert|pqxx::work)\b)", flags),
                     3});
        p.push_back({"blocking_wait",
                     std::regex(R"((\bwaitpid|\bpthread_join|\bwait_for|\bwait_until|\.join)\s*\()", flags),
                     2});
        return p;
    }();
    return patterns;
}

std::vector<std::regex> compile_all(std::initializer_list<const char*> sources) {
    std::vector<std::regex> out;
    for (const char* s : sources) {
        out.emplace_back(s, std::regex::ECMAScript | std::regex::icase);
    }
    return out;
}

const std::vector<std::regex>& heavy_name_patterns() {
    static const auto patterns = compile_all({
        "Process.*Video", "Generate.*Report", "Export.*Large", "Compress.*Archive",
        "Backup.*Database", "Import.*Bulk", "Migrate.*Data",
    });
    return patterns;
}

const std::vector<std::regex>& light_name_patterns() {
    static const auto patterns = compile_all({
        "Send.*Email", "Send.*Notification", "Update.*Cache", "Log.*Event",
        "Dispatch.*Event", "Trigger.*Webhook",
    });
    return patterns;
}

std::string encode_stats(const JobStatistics& s) {
    nlohmann::json j = {
        {"executions", s.executions},
        {"total_duration", s.total_duration_s},
        {"failures", s.failures},
        {"last_updated", s.last_updated},
    };
    return j.dump();
}

std::optional<JobStatistics> decode_stats(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("executions") || !j["executions"].is_number_unsigned()) return std::nullopt;
    if (!j.contains("total_duration") || !j["total_duration"].is_number()) return std::nullopt;
    if (!j.contains("failures") || !j["failures"].is_number_unsigned()) return std::nullopt;

    JobStatistics s;
    s.executions = j["executions"].get<uint64_t>();
    s.total_duration_s = j["total_duration"].get<double>();
    s.failures = j["failures"].get<uint64_t>();
    if (j.contains("last_updated") && j["last_updated"].is_number_integer()) {
        s.last_updated = j["last_updated"].get<int64_t>();
    }
    return s;
}

}  // anonymous namespace

JobAnalyzer::JobAnalyzer(std::shared_ptr<IStatsStore> store, AnalyzerConfig config,
                         Logger& logger)
    : store_(std::move(store)), config_(config), logger_(logger) {
    if (!store_) store_ = std::make_shared<InMemoryStatsStore>();
}

// ─────────────────────────────────────────────
// Decision
// ─────────────────────────────────────────────

ExecutionTier JobAnalyzer::analyze(const Job& job) {
    return explain(job).tier;
}

AnalysisDecision JobAnalyzer::explain(const Job& job) {
    const std::string type{job.type_name()};
    AnalysisDecision decision;

    // 1. Explicit hint
    if (auto isolated = job.isolation()) {
        decision.tier = *isolated ? ExecutionTier::Isolated : ExecutionTier::Inline;
        decision.source = DecisionSource::Explicit;
    } else if (auto estimate = job.estimated_duration_seconds()) {
        decision.tier = classify_duration(*estimate);
        decision.source = DecisionSource::Explicit;
    }
    // 2. Historical data
    else if (auto historical = historical_tier(load_stats(type))) {
        decision.tier = *historical;
        decision.source = DecisionSource::Historical;
    }
    // 3. Static analysis
    else if (auto source = job.source_path(); source && (decision.scan = scan_source(*source))) {
        decision.tier = classify_score(decision.scan->score);
        decision.source = DecisionSource::StaticAnalysis;
        if (!decision.scan->categories.empty()) {
            std::string joined;
            for (const auto& c : decision.scan->categories) {
                if (!joined.empty()) joined += ",";
                joined += c;
            }
            logger_.debug("Detected blocking patterns in " + type + ": " + joined);
        }
    }
    // 4. Name heuristics
    else if (auto by_name = classify_by_name(type)) {
        decision.tier = *by_name;
        decision.source = DecisionSource::NameHeuristic;
    }
    // 5. Default
    else {
        decision.tier = ExecutionTier::Pooled;
        decision.source = DecisionSource::Default;
    }

    logger_.debug("Job " + type + " using " + std::string{to_string(decision.source)}
                  + " mode: " + std::string{to_string(decision.tier)});
    return decision;
}

ExecutionTier JobAnalyzer::classify_duration(double seconds) const noexcept {
    if (seconds <= config_.inline_threshold_s) return ExecutionTier::Inline;
    if (seconds <= config_.pooled_threshold_s) return ExecutionTier::Pooled;
    return ExecutionTier::Isolated;
}

ExecutionTier JobAnalyzer::classify_score(int score) noexcept {
    if (score <= 0) return ExecutionTier::Inline;
    if (score <= 5) return ExecutionTier::Pooled;
    return ExecutionTier::Isolated;
}

std::optional<ExecutionTier> JobAnalyzer::classify_by_name(std::string_view type_name) {
    const std::string name{type_name};
    for (const auto& re : heavy_name_patterns()) {
        if (std::regex_search(name, re)) return ExecutionTier::Isolated;
    }
    for (const auto& re : light_name_patterns()) {
        if (std::regex_search(name, re)) return ExecutionTier::Inline;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Static analysis
// ─────────────────────────────────────────────

SourceScan JobAnalyzer::scan_text(std::string_view source) {
    SourceScan scan;
    auto begin = source.begin();
    auto end = source.end();
    for (const auto& bp : blocking_patterns()) {
        if (std::regex_search(begin, end, bp.pattern)) {
            scan.score += bp.weight;
            scan.categories.push_back(bp.category);
        }
    }
    return scan;
}

std::optional<SourceScan> JobAnalyzer::scan_source(const std::filesystem::path& path) {
    const std::string key = path.string();
    {
        std::lock_guard lock(scan_mutex_);
        if (auto it = scan_cache_.find(key); it != scan_cache_.end()) return it->second;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;
    std::string text(static_cast<size_t>(kMaxScanBytes), '\0');
    ifs.read(text.data(), kMaxScanBytes);
    text.resize(static_cast<size_t>(ifs.gcount()));

    auto scan = scan_text(text);
    std::lock_guard lock(scan_mutex_);
    scan_cache_.emplace(key, scan);
    return scan;
}

// ─────────────────────────────────────────────
// Statistics
// ─────────────────────────────────────────────

std::string JobAnalyzer::stats_key(std::string_view job_type) {
    return std::string{kStatsKeyPrefix} + std::string{job_type};
}

std::optional<JobStatistics> JobAnalyzer::load_stats(std::string_view job_type) {
    auto raw = store_->get(stats_key(job_type));
    if (!raw) return std::nullopt;
    auto stats = decode_stats(*raw);
    if (!stats) {
        logger_.warn("Discarding unreadable statistics for job type " + std::string{job_type});
        return std::nullopt;
    }
    return stats;
}

std::optional<ExecutionTier> JobAnalyzer::historical_tier(
    const std::optional<JobStatistics>& stats) const {
    if (!stats || stats->executions < config_.min_samples || stats->executions == 0) {
        return std::nullopt;
    }
    return classify_duration(stats->average_duration_s());
}

void JobAnalyzer::record_execution(std::string_view job_type, double duration_s, bool success) {
    auto stats = load_stats(job_type).value_or(JobStatistics{});
    stats.executions++;
    stats.total_duration_s += duration_s < 0.0 ? 0.0 : duration_s;
    if (!success) stats.failures++;
    stats.last_updated = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    store_->put(stats_key(job_type), encode_stats(stats), std::chrono::seconds(config_.stats_ttl_s));
}

std::optional<JobStatsSnapshot> JobAnalyzer::get_stats(std::string_view job_type) {
    auto stats = load_stats(job_type);
    if (!stats || stats->executions == 0) return std::nullopt;

    JobStatsSnapshot snap;
    snap.job_type = std::string{job_type};
    snap.executions = stats->executions;
    snap.average_duration_s = stats->average_duration_s();
    snap.failure_rate = stats->failure_rate();
    snap.recommended_tier = historical_tier(stats).value_or(ExecutionTier::Pooled);
    return snap;
}

void JobAnalyzer::clear_stats(std::string_view job_type) {
    store_->forget(stats_key(job_type));
}

}  // namespace jobtier
