#pragma once

#include "call_context.hpp"
#include "models.hpp"

#include <string>
#include <vector>

namespace refyne {

class Client;

/// Crawl jobs: listing, status and results.
class JobsService {
public:
    explicit JobsService(Client& client) : mClient(client) {}

    /// @param limit, offset  Paging; 0 leaves the parameter out.
    JobList    list(int limit = 0, int offset = 0, const CallContext& ctx = {});
    Job        get(const std::string& id, const CallContext& ctx = {});
    JobResults getResults(const std::string& id, bool merge = false,
                          const CallContext& ctx = {});

private:
    Client& mClient;
};

class SchemasService {
public:
    explicit SchemasService(Client& client) : mClient(client) {}

    SchemaList list(const CallContext& ctx = {});
    Schema     get(const std::string& id, const CallContext& ctx = {});
    Schema     create(const CreateSchemaRequest& request, const CallContext& ctx = {});
    Schema     update(const std::string& id, const CreateSchemaRequest& request,
                      const CallContext& ctx = {});
    void       remove(const std::string& id, const CallContext& ctx = {});

private:
    Client& mClient;
};

/// Saved sites.
class SitesService {
public:
    explicit SitesService(Client& client) : mClient(client) {}

    SiteList list(const CallContext& ctx = {});
    Site     get(const std::string& id, const CallContext& ctx = {});
    Site     create(const CreateSiteRequest& request, const CallContext& ctx = {});
    Site     update(const std::string& id, const CreateSiteRequest& request,
                    const CallContext& ctx = {});
    void     remove(const std::string& id, const CallContext& ctx = {});

private:
    Client& mClient;
};

/// API keys of the calling account.
class KeysService {
public:
    explicit KeysService(Client& client) : mClient(client) {}

    ApiKeyList    list(const CallContext& ctx = {});
    ApiKeyCreated create(const std::string& name, const CallContext& ctx = {});
    void          revoke(const std::string& id, const CallContext& ctx = {});

private:
    Client& mClient;
};

/// LLM providers, bring-your-own keys and the fallback chain.
class LlmService {
public:
    explicit LlmService(Client& client) : mClient(client) {}

    ProvidersResponse listProviders(const CallContext& ctx = {});
    ModelList         listModels(const std::string& provider, const CallContext& ctx = {});
    LlmKeyList        listKeys(const CallContext& ctx = {});
    LlmKey            upsertKey(const UpsertLlmKeyRequest& request, const CallContext& ctx = {});
    void              deleteKey(const std::string& id, const CallContext& ctx = {});
    LlmChain          getChain(const CallContext& ctx = {});
    void              setChain(const std::vector<LlmChainEntry>& entries,
                               const CallContext& ctx = {});

private:
    Client& mClient;
};

} // namespace refyne
