#include "services.hpp"
#include "client.hpp"

namespace refyne {

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

JobList JobsService::list(int limit, int offset, const CallContext& ctx) {
    std::string path = "/api/v1/jobs";
    std::string params;
    if (limit > 0) {
        params += "limit=" + std::to_string(limit);
    }
    if (offset > 0) {
        if (!params.empty()) params += "&";
        params += "offset=" + std::to_string(offset);
    }
    if (!params.empty()) {
        path += "?" + params;
    }
    return mClient.execute<JobList>("GET", path, nullptr, ctx);
}

Job JobsService::get(const std::string& id, const CallContext& ctx) {
    return mClient.execute<Job>("GET", "/api/v1/jobs/" + id, nullptr, ctx);
}

JobResults JobsService::getResults(const std::string& id, bool merge,
                                   const CallContext& ctx) {
    std::string path = "/api/v1/jobs/" + id + "/results";
    if (merge) path += "?merge=true";
    return mClient.execute<JobResults>("GET", path, nullptr, ctx);
}

// ---------------------------------------------------------------------------
// Schemas
// ---------------------------------------------------------------------------

SchemaList SchemasService::list(const CallContext& ctx) {
    return mClient.execute<SchemaList>("GET", "/api/v1/schemas", nullptr, ctx);
}

Schema SchemasService::get(const std::string& id, const CallContext& ctx) {
    return mClient.execute<Schema>("GET", "/api/v1/schemas/" + id, nullptr, ctx);
}

Schema SchemasService::create(const CreateSchemaRequest& request, const CallContext& ctx) {
    return mClient.execute<Schema>("POST", "/api/v1/schemas", request, ctx);
}

Schema SchemasService::update(const std::string& id, const CreateSchemaRequest& request,
                              const CallContext& ctx) {
    return mClient.execute<Schema>("PUT", "/api/v1/schemas/" + id, request, ctx);
}

void SchemasService::remove(const std::string& id, const CallContext& ctx) {
    mClient.executeRaw("DELETE", "/api/v1/schemas/" + id, nullptr, ctx);
}

// ---------------------------------------------------------------------------
// Sites
// ---------------------------------------------------------------------------

SiteList SitesService::list(const CallContext& ctx) {
    return mClient.execute<SiteList>("GET", "/api/v1/sites", nullptr, ctx);
}

Site SitesService::get(const std::string& id, const CallContext& ctx) {
    return mClient.execute<Site>("GET", "/api/v1/sites/" + id, nullptr, ctx);
}

Site SitesService::create(const CreateSiteRequest& request, const CallContext& ctx) {
    return mClient.execute<Site>("POST", "/api/v1/sites", request, ctx);
}

Site SitesService::update(const std::string& id, const CreateSiteRequest& request,
                          const CallContext& ctx) {
    return mClient.execute<Site>("PUT", "/api/v1/sites/" + id, request, ctx);
}

void SitesService::remove(const std::string& id, const CallContext& ctx) {
    mClient.executeRaw("DELETE", "/api/v1/sites/" + id, nullptr, ctx);
}

// ---------------------------------------------------------------------------
// API keys
// ---------------------------------------------------------------------------

ApiKeyList KeysService::list(const CallContext& ctx) {
    return mClient.execute<ApiKeyList>("GET", "/api/v1/keys", nullptr, ctx);
}

ApiKeyCreated KeysService::create(const std::string& name, const CallContext& ctx) {
    return mClient.execute<ApiKeyCreated>("POST", "/api/v1/keys", {{"name", name}}, ctx);
}

void KeysService::revoke(const std::string& id, const CallContext& ctx) {
    mClient.executeRaw("DELETE", "/api/v1/keys/" + id, nullptr, ctx);
}

// ---------------------------------------------------------------------------
// LLM configuration
// ---------------------------------------------------------------------------

ProvidersResponse LlmService::listProviders(const CallContext& ctx) {
    return mClient.execute<ProvidersResponse>("GET", "/api/v1/llm/providers", nullptr, ctx);
}

ModelList LlmService::listModels(const std::string& provider, const CallContext& ctx) {
    return mClient.execute<ModelList>("GET", "/api/v1/llm/models/" + provider, nullptr, ctx);
}

LlmKeyList LlmService::listKeys(const CallContext& ctx) {
    return mClient.execute<LlmKeyList>("GET", "/api/v1/llm/keys", nullptr, ctx);
}

LlmKey LlmService::upsertKey(const UpsertLlmKeyRequest& request, const CallContext& ctx) {
    return mClient.execute<LlmKey>("PUT", "/api/v1/llm/keys", request, ctx);
}

void LlmService::deleteKey(const std::string& id, const CallContext& ctx) {
    mClient.executeRaw("DELETE", "/api/v1/llm/keys/" + id, nullptr, ctx);
}

LlmChain LlmService::getChain(const CallContext& ctx) {
    return mClient.execute<LlmChain>("GET", "/api/v1/llm/chain", nullptr, ctx);
}

void LlmService::setChain(const std::vector<LlmChainEntry>& entries, const CallContext& ctx) {
    mClient.executeRaw("PUT", "/api/v1/llm/chain", LlmChain{entries}, ctx);
}

} // namespace refyne
