#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>

namespace refyne {

// JSON mapping for the request / response shapes, found by nlohmann::json
// through argument-dependent lookup. Optional and empty request members are
// omitted; missing or null response members decode to their defaults.

void to_json(nlohmann::json& j, const LlmConfig& v);
void to_json(nlohmann::json& j, const ExtractRequest& v);
void to_json(nlohmann::json& j, const CrawlOptions& v);
void to_json(nlohmann::json& j, const CrawlRequest& v);
void to_json(nlohmann::json& j, const AnalyzeRequest& v);
void to_json(nlohmann::json& j, const CreateSchemaRequest& v);
void to_json(nlohmann::json& j, const CreateSiteRequest& v);
void to_json(nlohmann::json& j, const UpsertLlmKeyRequest& v);
void to_json(nlohmann::json& j, const LlmChainEntry& v);
void to_json(nlohmann::json& j, const LlmChain& v);

void from_json(const nlohmann::json& j, TokenUsage& v);
void from_json(const nlohmann::json& j, ExtractionMetadata& v);
void from_json(const nlohmann::json& j, ExtractResponse& v);
void from_json(const nlohmann::json& j, CrawlOptions& v);
void from_json(const nlohmann::json& j, CrawlJobCreated& v);
void from_json(const nlohmann::json& j, Job& v);
void from_json(const nlohmann::json& j, JobList& v);
void from_json(const nlohmann::json& j, JobResults& v);
void from_json(const nlohmann::json& j, AnalyzeResponse& v);
void from_json(const nlohmann::json& j, Schema& v);
void from_json(const nlohmann::json& j, SchemaList& v);
void from_json(const nlohmann::json& j, Site& v);
void from_json(const nlohmann::json& j, SiteList& v);
void from_json(const nlohmann::json& j, ApiKey& v);
void from_json(const nlohmann::json& j, ApiKeyList& v);
void from_json(const nlohmann::json& j, ApiKeyCreated& v);
void from_json(const nlohmann::json& j, UsageResponse& v);
void from_json(const nlohmann::json& j, LlmKey& v);
void from_json(const nlohmann::json& j, LlmKeyList& v);
void from_json(const nlohmann::json& j, LlmChainEntry& v);
void from_json(const nlohmann::json& j, LlmChain& v);
void from_json(const nlohmann::json& j, Model& v);
void from_json(const nlohmann::json& j, ModelList& v);
void from_json(const nlohmann::json& j, ProvidersResponse& v);

} // namespace refyne
