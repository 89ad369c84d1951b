#pragma once

#include <cstddef>

// ── Workspace file names ────────────────────────────────────
constexpr const char* TF_DEFINITION_EXT   = ".tf";
constexpr const char* TF_VARS_FILE        = "terraform.tfvars";
constexpr const char* TF_STATE_FILE       = "terraform.tfstate";
constexpr const char* TF_STATE_BACKUP     = "terraform.tfstate.backup";
constexpr const char* METADATA_FILE       = "metadata.yaml";
constexpr const char* INDEX_FILE          = "deployments.yaml";
constexpr const char* RUN_LOCK_FILE       = ".azprov.lock";

// ── Environment variables ───────────────────────────────────
constexpr const char* ENV_SUBSCRIPTION_ID  = "AZ_SUBSCRIPTION_ID";
constexpr const char* ENV_SKIP_LOGIN_CHECK = "AZ_SKIP_LOGIN_CHECK";
constexpr const char* ENV_CONFIG_PATH      = "AZPROV_CONFIG";

// ── Retry defaults ──────────────────────────────────────────
constexpr int APPLY_MAX_RETRIES          = 2;
constexpr int APPLY_RETRY_DELAY_SECS     = 60;
constexpr int DESTROY_MAX_RETRIES        = 2;
constexpr int DESTROY_RETRY_DELAY_SECS   = 30;

// ── Observation ─────────────────────────────────────────────
constexpr int LOG_FOLLOW_POLL_MS         = 1000;  // CLI log tail interval

// ── Parameter limits ────────────────────────────────────────
constexpr std::size_t MIN_RESOURCE_GROUP_BASE = 3;
constexpr std::size_t MAX_RESOURCE_GROUP_BASE = 15;
constexpr std::size_t NAME_SUFFIX_LENGTH      = 5;

// ── Model deployment defaults ───────────────────────────────
constexpr const char* DEFAULT_MODEL_NAME      = "gpt-4.1";
constexpr const char* DEFAULT_DEPLOYMENT_SKU  = "GlobalStandard";

// ── Export defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_OPENAI_API_VERSION   = "2024-12-01-preview";
constexpr const char* DEFAULT_EMBEDDING_DEPLOYMENT = "text-embedding-3-small";
constexpr const char* DEFAULT_SEARCH_INDEX_NAME    = "ai-search-index";
constexpr const char* DEFAULT_LOG_LEVEL            = "INFO";

// ── Endpoint derivation ─────────────────────────────────────
constexpr const char* COGNITIVE_DOMAIN  = ".cognitiveservices.azure.com";
constexpr const char* OPENAI_DOMAIN     = ".openai.azure.com";
constexpr const char* INFERENCE_DOMAIN  = ".services.ai.azure.com";
