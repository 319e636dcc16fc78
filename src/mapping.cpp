#include "mapping.hpp"

#include <stdexcept>

namespace refyne {

using json = nlohmann::json;

namespace {

// --- response readers: missing or null members fall back to defaults ---

std::string getString(const json& j, const char* key) {
    auto it = j.find(key);
    return (it == j.end() || it->is_null()) ? std::string{} : it->get<std::string>();
}

int getInt(const json& j, const char* key) {
    auto it = j.find(key);
    return (it == j.end() || it->is_null()) ? 0 : it->get<int>();
}

double getDouble(const json& j, const char* key) {
    auto it = j.find(key);
    return (it == j.end() || it->is_null()) ? 0.0 : it->get<double>();
}

bool getBool(const json& j, const char* key) {
    auto it = j.find(key);
    return (it == j.end() || it->is_null()) ? false : it->get<bool>();
}

std::optional<bool> getOptionalBool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<bool>();
}

json getJson(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? json() : *it;
}

template <typename T>
std::vector<T> getList(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::vector<T>>();
}

template <typename T>
std::optional<T> getOptional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

void requireObject(const json& j, const char* what) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("expected JSON object for ") + what);
    }
}

// --- request writers: empty / zero members are omitted ---

void putString(json& j, const char* key, const std::string& value) {
    if (!value.empty()) j[key] = value;
}

void putInt(json& j, const char* key, int value) {
    if (value != 0) j[key] = value;
}

void putBool(json& j, const char* key, const std::optional<bool>& value) {
    if (value) j[key] = *value;
}

} // namespace

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

void to_json(json& j, const LlmConfig& v) {
    j = json::object();
    putString(j, "provider", v.provider);
    putString(j, "apiKey", v.apiKey);
    putString(j, "baseUrl", v.baseUrl);
    putString(j, "model", v.model);
}

void to_json(json& j, const ExtractRequest& v) {
    j = {{"url", v.url}, {"schema", v.schema}};
    putString(j, "fetchMode", v.fetchMode);
    if (v.llmConfig) j["llmConfig"] = *v.llmConfig;
}

void to_json(json& j, const CrawlOptions& v) {
    j = json::object();
    putString(j, "followSelector", v.followSelector);
    putString(j, "followPattern", v.followPattern);
    putInt(j, "maxDepth", v.maxDepth);
    putString(j, "nextSelector", v.nextSelector);
    putInt(j, "maxPages", v.maxPages);
    putInt(j, "maxUrls", v.maxUrls);
    putString(j, "delay", v.delay);
    putInt(j, "concurrency", v.concurrency);
    putBool(j, "sameDomainOnly", v.sameDomainOnly);
    putBool(j, "extractFromSeeds", v.extractFromSeeds);
}

void to_json(json& j, const CrawlRequest& v) {
    j = {{"url", v.url}, {"schema", v.schema}};
    if (v.options) j["options"] = *v.options;
    putString(j, "webhookUrl", v.webhookUrl);
    if (v.llmConfig) j["llmConfig"] = *v.llmConfig;
}

void to_json(json& j, const AnalyzeRequest& v) {
    j = {{"url", v.url}};
    putInt(j, "depth", v.depth);
}

void to_json(json& j, const CreateSchemaRequest& v) {
    j = {{"name", v.name}, {"schemaYaml", v.schemaYaml}};
    putString(j, "description", v.description);
    putString(j, "category", v.category);
}

void to_json(json& j, const CreateSiteRequest& v) {
    j = {{"name", v.name}, {"url", v.url}};
    putString(j, "schemaId", v.schemaId);
    if (v.crawlOptions) j["crawlOptions"] = *v.crawlOptions;
}

void to_json(json& j, const UpsertLlmKeyRequest& v) {
    j = {{"provider", v.provider},
         {"apiKey", v.apiKey},
         {"defaultModel", v.defaultModel}};
    putString(j, "baseUrl", v.baseUrl);
    putBool(j, "isEnabled", v.isEnabled);
}

void to_json(json& j, const LlmChainEntry& v) {
    j = {{"provider", v.provider}, {"model", v.model}};
    putString(j, "id", v.id);
    putInt(j, "position", v.position);
    putBool(j, "isEnabled", v.isEnabled);
}

void to_json(json& j, const LlmChain& v) {
    j = {{"chain", v.chain}};
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

void from_json(const json& j, TokenUsage& v) {
    requireObject(j, "usage");
    v.inputTokens  = getInt(j, "inputTokens");
    v.outputTokens = getInt(j, "outputTokens");
    v.costUsd      = getDouble(j, "costUsd");
    v.llmCostUsd   = getDouble(j, "llmCostUsd");
    v.isByok       = getBool(j, "isByok");
}

void from_json(const json& j, ExtractionMetadata& v) {
    requireObject(j, "metadata");
    v.fetchDurationMs   = getInt(j, "fetchDurationMs");
    v.extractDurationMs = getInt(j, "extractDurationMs");
    v.model             = getString(j, "model");
    v.provider          = getString(j, "provider");
}

void from_json(const json& j, ExtractResponse& v) {
    requireObject(j, "extract response");
    v.data      = getJson(j, "data");
    v.url       = getString(j, "url");
    v.fetchedAt = getString(j, "fetchedAt");
    v.usage     = getOptional<TokenUsage>(j, "usage");
    v.metadata  = getOptional<ExtractionMetadata>(j, "metadata");
}

void from_json(const json& j, CrawlOptions& v) {
    requireObject(j, "crawl options");
    v.followSelector   = getString(j, "followSelector");
    v.followPattern    = getString(j, "followPattern");
    v.maxDepth         = getInt(j, "maxDepth");
    v.nextSelector     = getString(j, "nextSelector");
    v.maxPages         = getInt(j, "maxPages");
    v.maxUrls          = getInt(j, "maxUrls");
    v.delay            = getString(j, "delay");
    v.concurrency      = getInt(j, "concurrency");
    v.sameDomainOnly   = getOptionalBool(j, "sameDomainOnly");
    v.extractFromSeeds = getOptionalBool(j, "extractFromSeeds");
}

void from_json(const json& j, CrawlJobCreated& v) {
    requireObject(j, "crawl job");
    v.jobId     = getString(j, "jobId");
    v.status    = getString(j, "status");
    v.statusUrl = getString(j, "statusUrl");
}

void from_json(const json& j, Job& v) {
    requireObject(j, "job");
    v.id               = getString(j, "id");
    v.type             = getString(j, "type");
    v.status           = getString(j, "status");
    v.url              = getString(j, "url");
    v.pageCount        = getInt(j, "pageCount");
    v.tokenUsageInput  = getInt(j, "tokenUsageInput");
    v.tokenUsageOutput = getInt(j, "tokenUsageOutput");
    v.costCredits      = getDouble(j, "costCredits");
    v.errorMessage     = getString(j, "errorMessage");
    v.startedAt        = getString(j, "startedAt");
    v.completedAt      = getString(j, "completedAt");
    v.createdAt        = getString(j, "createdAt");
}

void from_json(const json& j, JobList& v) {
    requireObject(j, "job list");
    v.jobs = getList<Job>(j, "jobs");
}

void from_json(const json& j, JobResults& v) {
    requireObject(j, "job results");
    v.jobId     = getString(j, "jobId");
    v.status    = getString(j, "status");
    v.pageCount = getInt(j, "pageCount");
    v.results   = getJson(j, "results");
    v.merged    = getJson(j, "merged");
}

void from_json(const json& j, AnalyzeResponse& v) {
    requireObject(j, "analyze response");
    v.url             = getString(j, "url");
    v.suggestedSchema = getJson(j, "suggestedSchema");
    v.followPatterns  = getList<std::string>(j, "followPatterns");
}

void from_json(const json& j, Schema& v) {
    requireObject(j, "schema");
    v.id          = getString(j, "id");
    v.name        = getString(j, "name");
    v.description = getString(j, "description");
    v.schemaYaml  = getString(j, "schemaYaml");
    v.category    = getString(j, "category");
    v.createdAt   = getString(j, "createdAt");
    v.updatedAt   = getString(j, "updatedAt");
}

void from_json(const json& j, SchemaList& v) {
    requireObject(j, "schema list");
    v.schemas = getList<Schema>(j, "schemas");
}

void from_json(const json& j, Site& v) {
    requireObject(j, "site");
    v.id           = getString(j, "id");
    v.name         = getString(j, "name");
    v.url          = getString(j, "url");
    v.schemaId     = getString(j, "schemaId");
    v.crawlOptions = getOptional<CrawlOptions>(j, "crawlOptions");
    v.createdAt    = getString(j, "createdAt");
}

void from_json(const json& j, SiteList& v) {
    requireObject(j, "site list");
    v.sites = getList<Site>(j, "sites");
}

void from_json(const json& j, ApiKey& v) {
    requireObject(j, "API key");
    v.id         = getString(j, "id");
    v.name       = getString(j, "name");
    v.prefix     = getString(j, "prefix");
    v.createdAt  = getString(j, "createdAt");
    v.lastUsedAt = getString(j, "lastUsedAt");
}

void from_json(const json& j, ApiKeyList& v) {
    requireObject(j, "API key list");
    v.keys = getList<ApiKey>(j, "keys");
}

void from_json(const json& j, ApiKeyCreated& v) {
    requireObject(j, "created API key");
    v.id   = getString(j, "id");
    v.name = getString(j, "name");
    v.key  = getString(j, "key");
}

void from_json(const json& j, UsageResponse& v) {
    requireObject(j, "usage response");
    v.tier             = getString(j, "tier");
    v.creditsUsed      = getDouble(j, "creditsUsed");
    v.creditsLimit     = getDouble(j, "creditsLimit");
    v.creditsRemaining = getDouble(j, "creditsRemaining");
    v.periodStart      = getString(j, "periodStart");
    v.periodEnd        = getString(j, "periodEnd");
}

void from_json(const json& j, LlmKey& v) {
    requireObject(j, "LLM key");
    v.id           = getString(j, "id");
    v.provider     = getString(j, "provider");
    v.defaultModel = getString(j, "defaultModel");
    v.baseUrl      = getString(j, "baseUrl");
    v.isEnabled    = getBool(j, "isEnabled");
    v.createdAt    = getString(j, "createdAt");
}

void from_json(const json& j, LlmKeyList& v) {
    requireObject(j, "LLM key list");
    v.keys = getList<LlmKey>(j, "keys");
}

void from_json(const json& j, LlmChainEntry& v) {
    requireObject(j, "LLM chain entry");
    v.id        = getString(j, "id");
    v.position  = getInt(j, "position");
    v.provider  = getString(j, "provider");
    v.model     = getString(j, "model");
    v.isEnabled = getOptionalBool(j, "isEnabled");
}

void from_json(const json& j, LlmChain& v) {
    requireObject(j, "LLM chain");
    v.chain = getList<LlmChainEntry>(j, "chain");
}

void from_json(const json& j, Model& v) {
    requireObject(j, "model");
    v.id   = getString(j, "id");
    v.name = getString(j, "name");
}

void from_json(const json& j, ModelList& v) {
    requireObject(j, "model list");
    v.models = getList<Model>(j, "models");
}

void from_json(const json& j, ProvidersResponse& v) {
    requireObject(j, "providers response");
    v.providers = getList<std::string>(j, "providers");
}

} // namespace refyne
