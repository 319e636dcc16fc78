#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace refyne {

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

/// Bring-your-own LLM settings for a single request.
struct LlmConfig {
    std::string provider;
    std::string apiKey;
    std::string baseUrl;
    std::string model;
};

struct ExtractRequest {
    std::string              url;
    nlohmann::json           schema = nlohmann::json::object();
    std::string              fetchMode;   // "auto", "static" or "dynamic"; empty = server default
    std::optional<LlmConfig> llmConfig;
};

struct TokenUsage {
    int    inputTokens  = 0;
    int    outputTokens = 0;
    double costUsd      = 0.0;
    double llmCostUsd   = 0.0;
    bool   isByok       = false;
};

struct ExtractionMetadata {
    int         fetchDurationMs   = 0;
    int         extractDurationMs = 0;
    std::string model;
    std::string provider;
};

struct ExtractResponse {
    nlohmann::json                    data;
    std::string                       url;
    std::string                       fetchedAt;   // ISO-8601
    std::optional<TokenUsage>         usage;
    std::optional<ExtractionMetadata> metadata;
};

// ---------------------------------------------------------------------------
// Crawling and jobs
// ---------------------------------------------------------------------------

/// Zero / empty members are left out of the request.
struct CrawlOptions {
    std::string         followSelector;
    std::string         followPattern;
    int                 maxDepth    = 0;
    std::string         nextSelector;
    int                 maxPages    = 0;
    int                 maxUrls     = 0;
    std::string         delay;        // e.g. "500ms"
    int                 concurrency = 0;
    std::optional<bool> sameDomainOnly;
    std::optional<bool> extractFromSeeds;
};

struct CrawlRequest {
    std::string                 url;
    nlohmann::json              schema = nlohmann::json::object();
    std::optional<CrawlOptions> options;
    std::string                 webhookUrl;
    std::optional<LlmConfig>    llmConfig;
};

struct CrawlJobCreated {
    std::string jobId;
    std::string status;
    std::string statusUrl;
};

/// Job status values: "pending", "running", "completed", "failed".
struct Job {
    std::string id;
    std::string type;
    std::string status;
    std::string url;
    int         pageCount        = 0;
    int         tokenUsageInput  = 0;
    int         tokenUsageOutput = 0;
    double      costCredits      = 0.0;
    std::string errorMessage;
    std::string startedAt;
    std::string completedAt;
    std::string createdAt;
};

struct JobList {
    std::vector<Job> jobs;
};

struct JobResults {
    std::string    jobId;
    std::string    status;
    int            pageCount = 0;
    nlohmann::json results;   // array of per-page objects, or null
    nlohmann::json merged;    // merged object when requested, or null
};

struct AnalyzeRequest {
    std::string url;
    int         depth = 0;   // 0 = server default
};

struct AnalyzeResponse {
    std::string              url;
    nlohmann::json           suggestedSchema;
    std::vector<std::string> followPatterns;
};

// ---------------------------------------------------------------------------
// Schemas, sites, keys, usage
// ---------------------------------------------------------------------------

struct Schema {
    std::string id;
    std::string name;
    std::string description;
    std::string schemaYaml;
    std::string category;
    std::string createdAt;
    std::string updatedAt;
};

struct SchemaList {
    std::vector<Schema> schemas;
};

struct CreateSchemaRequest {
    std::string name;
    std::string schemaYaml;
    std::string description;
    std::string category;
};

struct Site {
    std::string                 id;
    std::string                 name;
    std::string                 url;
    std::string                 schemaId;
    std::optional<CrawlOptions> crawlOptions;
    std::string                 createdAt;
};

struct SiteList {
    std::vector<Site> sites;
};

struct CreateSiteRequest {
    std::string                 name;
    std::string                 url;
    std::string                 schemaId;
    std::optional<CrawlOptions> crawlOptions;
};

/// An API key without its secret.
struct ApiKey {
    std::string id;
    std::string name;
    std::string prefix;
    std::string createdAt;
    std::string lastUsedAt;
};

struct ApiKeyList {
    std::vector<ApiKey> keys;
};

/// Returned once, on creation; key holds the full secret.
struct ApiKeyCreated {
    std::string id;
    std::string name;
    std::string key;
};

struct UsageResponse {
    std::string tier;
    double      creditsUsed      = 0.0;
    double      creditsLimit     = 0.0;
    double      creditsRemaining = 0.0;
    std::string periodStart;
    std::string periodEnd;
};

// ---------------------------------------------------------------------------
// LLM provider configuration
// ---------------------------------------------------------------------------

struct LlmKey {
    std::string id;
    std::string provider;
    std::string defaultModel;
    std::string baseUrl;
    bool        isEnabled = false;
    std::string createdAt;
};

struct LlmKeyList {
    std::vector<LlmKey> keys;
};

struct UpsertLlmKeyRequest {
    std::string         provider;
    std::string         apiKey;
    std::string         defaultModel;
    std::string         baseUrl;
    std::optional<bool> isEnabled;
};

struct LlmChainEntry {
    std::string         id;
    int                 position = 0;
    std::string         provider;
    std::string         model;
    std::optional<bool> isEnabled;
};

struct LlmChain {
    std::vector<LlmChainEntry> chain;
};

struct Model {
    std::string id;
    std::string name;
};

struct ModelList {
    std::vector<Model> models;
};

struct ProvidersResponse {
    std::vector<std::string> providers;
};

} // namespace refyne
