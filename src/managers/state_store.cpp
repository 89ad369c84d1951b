#include "state_store.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

StateStore::StateStore(fs::path root) : root_(std::move(root)) {}

fs::path StateStore::index_path() const {
    return root_ / INDEX_FILE;
}

fs::path StateStore::record_path(const std::string& id) const {
    return root_ / id / METADATA_FILE;
}

// ── Encoding ───────────────────────────────────────────────

static void emit_pairs(YAML::Emitter& out,
                       const std::vector<std::pair<std::string, std::string>>& pairs) {
    out << YAML::BeginMap;
    for (const auto& [k, v] : pairs) {
        out << YAML::Key << k << YAML::Value << v;
    }
    out << YAML::EndMap;
}

static void emit_parameters(YAML::Emitter& out, const JobParameters& p) {
    out << YAML::BeginMap;
    out << YAML::Key << "resource_group_base" << YAML::Value << p.resource_group_base;
    out << YAML::Key << "location" << YAML::Value << p.location;
    out << YAML::Key << "include_search" << YAML::Value << p.include_search;
    out << YAML::Key << "enable_model_deployment" << YAML::Value << p.enable_model_deployment;
    out << YAML::Key << "openai_model_name" << YAML::Value << p.openai_model_name;
    out << YAML::Key << "openai_model_version" << YAML::Value << p.openai_model_version;
    out << YAML::Key << "openai_deployment_sku" << YAML::Value << p.openai_deployment_sku;
    out << YAML::Key << "model_deployment_name" << YAML::Value << p.model_deployment_name;
    out << YAML::Key << "service_principal_name" << YAML::Value << p.service_principal_name;
    out << YAML::Key << "secret_expiration_date" << YAML::Value << p.secret_expiration_date;
    out << YAML::Key << "subscription_id" << YAML::Value << p.subscription_id;
    out << YAML::EndMap;
}

static JobParameters decode_parameters(const YAML::Node& n) {
    JobParameters p;
    if (!n || !n.IsMap()) return p;
    p.resource_group_base = n["resource_group_base"].as<std::string>("");
    p.location = n["location"].as<std::string>("");
    p.include_search = n["include_search"].as<bool>(false);
    p.enable_model_deployment = n["enable_model_deployment"].as<bool>(true);
    p.openai_model_name = n["openai_model_name"].as<std::string>("");
    p.openai_model_version = n["openai_model_version"].as<std::string>("");
    p.openai_deployment_sku = n["openai_deployment_sku"].as<std::string>("");
    p.model_deployment_name = n["model_deployment_name"].as<std::string>("");
    p.service_principal_name = n["service_principal_name"].as<std::string>("");
    p.secret_expiration_date = n["secret_expiration_date"].as<std::string>("");
    p.subscription_id = n["subscription_id"].as<std::string>("");
    return p;
}

static ResourceNames decode_names(const YAML::Node& n) {
    ResourceNames r;
    if (!n || !n.IsMap()) return r;
    r.storage_account = n["storage_account_name"].as<std::string>("");
    r.search_service = n["search_service_name"].as<std::string>("");
    r.ai_services = n["ai_services_name"].as<std::string>("");
    r.ai_foundry_hub = n["ai_foundry_hub_name"].as<std::string>("");
    r.app_insights = n["app_insights_name"].as<std::string>("");
    r.log_analytics_workspace = n["log_analytics_workspace_name"].as<std::string>("");
    r.foundry_project = n["project_name"].as<std::string>("");
    r.suffix = n["suffix"].as<std::string>("");
    return r;
}

static std::vector<std::pair<std::string, std::string>> decode_pairs(const YAML::Node& n) {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (!n || !n.IsMap()) return pairs;
    for (const auto& kv : n) {
        pairs.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>(""));
    }
    return pairs;
}

static JobStatus decode_status(const YAML::Node& n) {
    auto status = parse_job_status(n.as<std::string>(""));
    return status ? *status : JobStatus::Failed;
}

// ── Records ────────────────────────────────────────────────

Result<void> StateStore::save(const Job& job) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << job.id;
    out << YAML::Key << "status" << YAML::Value << to_string(job.status);
    out << YAML::Key << "created_at" << YAML::Value << job.created_at;
    out << YAML::Key << "updated_at" << YAML::Value << job.updated_at;

    out << YAML::Key << "parameters" << YAML::Value;
    emit_parameters(out, job.parameters);
    out << YAML::Key << "resource_names" << YAML::Value;
    emit_pairs(out, job.names.entries());

    out << YAML::Key << "outputs" << YAML::Value << YAML::BeginMap;
    for (const auto& [k, v] : job.outputs) {
        out << YAML::Key << k << YAML::Value << v;
    }
    out << YAML::EndMap;

    out << YAML::Key << "log" << YAML::Value << YAML::BeginSeq;
    for (const auto& line : job.log) {
        out << line;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    try {
        fs::create_directories(record_path(job.id).parent_path());
        platform::write_file_atomic(record_path(job.id), out.c_str());

        std::lock_guard<std::mutex> lock(index_mutex_);
        auto rows = read_index();
        JobSummary row = summarize(job);
        bool found = false;
        for (auto& existing : rows) {
            if (existing.id != job.id) continue;
            if (!existing.created_at.empty()) row.created_at = existing.created_at;
            existing = row;
            found = true;
            break;
        }
        if (!found) rows.push_back(row);
        write_index(rows);
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("Failed to persist job {}: {}", job.id, e.what()));
    }
    return Result<void>::Ok();
}

std::optional<Job> StateStore::load(const std::string& id) const {
    fs::path path = record_path(id);
    if (!fs::exists(path)) return std::nullopt;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) return std::nullopt;

        Job job;
        job.id = root["id"].as<std::string>(id);
        job.status = decode_status(root["status"]);
        job.created_at = root["created_at"].as<std::string>("");
        job.updated_at = root["updated_at"].as<std::string>("");
        job.parameters = decode_parameters(root["parameters"]);
        job.names = decode_names(root["resource_names"]);
        for (const auto& [k, v] : decode_pairs(root["outputs"])) {
            job.outputs[k] = v;
        }
        if (root["log"] && root["log"].IsSequence()) {
            for (const auto& n : root["log"]) {
                job.log.push_back(n.as<std::string>(""));
            }
        }
        return job;
    } catch (const std::exception& e) {
        azprov_log(fmt::format("state store: unreadable record {}: {}", path.string(), e.what()));
        return std::nullopt;
    }
}

// ── Index ──────────────────────────────────────────────────

JobSummary StateStore::summarize(const Job& job) const {
    JobSummary s;
    s.id = job.id;
    s.name = job.parameters.resource_group_base;
    s.status = job.status;
    s.created_at = job.created_at;
    s.updated_at = job.updated_at;
    s.has_state = fs::exists(root_ / job.id / TF_STATE_FILE);
    s.outputs_available = !job.outputs.empty();
    s.region = job.parameters.location;
    s.include_search = job.parameters.include_search;
    s.resource_names = job.names.entries();
    return s;
}

std::vector<JobSummary> StateStore::read_index() const {
    std::vector<JobSummary> rows;
    fs::path path = index_path();
    if (!fs::exists(path)) return rows;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        YAML::Node list = root["deployments"];
        if (!list || !list.IsSequence()) return rows;

        for (const auto& n : list) {
            JobSummary s;
            s.id = n["id"].as<std::string>("");
            if (s.id.empty()) continue;
            s.name = n["name"].as<std::string>("");
            s.status = decode_status(n["status"]);
            s.created_at = n["created_at"].as<std::string>("");
            s.updated_at = n["updated_at"].as<std::string>("");
            s.has_state = n["has_state"].as<bool>(false);
            s.outputs_available = n["outputs_available"].as<bool>(false);
            s.region = n["region"].as<std::string>("");
            s.include_search = n["include_search"].as<bool>(false);
            s.resource_names = decode_pairs(n["resource_names"]);
            rows.push_back(s);
        }
    } catch (const std::exception& e) {
        azprov_log(fmt::format("state store: unreadable index {}: {}", path.string(), e.what()));
        return {};
    }
    return rows;
}

void StateStore::write_index(const std::vector<JobSummary>& rows) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "deployments" << YAML::Value << YAML::BeginSeq;
    for (const auto& s : rows) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << s.id;
        out << YAML::Key << "name" << YAML::Value << s.name;
        out << YAML::Key << "status" << YAML::Value << to_string(s.status);
        out << YAML::Key << "created_at" << YAML::Value << s.created_at;
        out << YAML::Key << "updated_at" << YAML::Value << s.updated_at;
        out << YAML::Key << "has_state" << YAML::Value << s.has_state;
        out << YAML::Key << "outputs_available" << YAML::Value << s.outputs_available;
        out << YAML::Key << "region" << YAML::Value << s.region;
        out << YAML::Key << "include_search" << YAML::Value << s.include_search;
        out << YAML::Key << "resource_names" << YAML::Value;
        emit_pairs(out, s.resource_names);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    fs::create_directories(root_);
    platform::write_file_atomic(index_path(), out.c_str());
}

std::vector<JobSummary> StateStore::list_all() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return read_index();
}

std::vector<Job> StateStore::load_all() const {
    std::vector<Job> jobs;
    for (const auto& row : list_all()) {
        auto job = load(row.id);
        if (job) {
            jobs.push_back(std::move(*job));
        } else {
            azprov_log(fmt::format("state store: index lists {} but no record loads", row.id));
        }
    }
    return jobs;
}
