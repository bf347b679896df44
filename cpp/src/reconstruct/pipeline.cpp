#include "factlog/reconstruct/pipeline.hpp"

#include <algorithm>

#include "factlog/config.hpp"
#include "factlog/error.hpp"
#include "factlog/logging.hpp"
#include "factlog/reconstruct/accumulator.hpp"
#include "factlog/reconstruct/grouper.hpp"
#include "factlog/reconstruct/resolver.hpp"
#include "factlog/thread_pool.hpp"

namespace factlog {

ReconstructOptions ReconstructOptions::from_config(const Config& config) {
    ReconstructOptions options;

    std::string policy = config.get<std::string>("reconstruct.retraction_policy", "freeze");
    auto parsed = parse_retraction_policy(policy);
    if (!parsed) {
        FACTLOG_THROW_HINT(ConfigError, "Unknown retraction policy '" + policy + "'",
                           "Set FACTLOG_RETRACTION_POLICY to freeze or remove");
    }
    options.retraction_policy = *parsed;

    int threads = config.get<int>("perf.max_threads", 0);
    options.max_threads = threads > 0 ? static_cast<size_t>(threads) : 0;
    return options;
}

std::vector<Delta> resolve_deltas(std::vector<FactRecord> facts) {
    std::vector<TxGroup> groups = group_by_transaction(std::move(facts));

    std::vector<Delta> deltas;
    deltas.reserve(groups.size());
    for (const auto& group : groups) {
        deltas.push_back(resolve_delta(group));
    }
    return deltas;
}

std::vector<Snapshot> reconstruct(std::vector<FactRecord> facts, const ReconstructOptions& options) {
    return accumulate(resolve_deltas(std::move(facts)), options.retraction_policy);
}

// =============================================================================
// Reconstructor
// =============================================================================

std::vector<FactRecord> Reconstructor::fetch(const EntityId& entity) const {
    FACTLOG_CHECK_ARGUMENT(!entity.empty(), "Entity id must not be empty");

    std::vector<FactRecord> facts;
    try {
        facts = store_.query_history(entity);
    } catch (const FactlogException& e) {
        LOG_ERROR("History query for ", entity, " failed: ", e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("History query for ", entity, " failed: ", e.what());
        FACTLOG_THROW(StoreUnavailableError, e.what());
    }

    LOG_DEBUG("Fetched ", facts.size(), " facts for ", entity);
    return facts;
}

std::vector<Snapshot> Reconstructor::reconstruct(const EntityId& entity) const {
    std::vector<Snapshot> snapshots = factlog::reconstruct(fetch(entity), options_);
    if (snapshots.empty()) {
        LOG_DEBUG("No facts for ", entity);
    } else {
        LOG_DEBUG("Reconstructed ", snapshots.size(), " snapshots for ", entity);
    }
    return snapshots;
}

std::vector<Delta> Reconstructor::changes(const EntityId& entity) const {
    return resolve_deltas(fetch(entity));
}

std::optional<Snapshot> Reconstructor::current(const EntityId& entity) const {
    std::vector<Snapshot> snapshots = reconstruct(entity);
    if (snapshots.empty()) return std::nullopt;
    return std::move(snapshots.back());
}

std::optional<Snapshot> Reconstructor::as_of(const EntityId& entity, TxId tx) const {
    std::vector<FactRecord> facts = fetch(entity);
    facts.erase(std::remove_if(facts.begin(), facts.end(),
                               [tx](const FactRecord& f) { return f.tx > tx; }),
                facts.end());

    std::vector<Snapshot> snapshots = factlog::reconstruct(std::move(facts), options_);
    if (snapshots.empty()) return std::nullopt;
    return std::move(snapshots.back());
}

std::map<EntityId, std::vector<Snapshot>>
Reconstructor::reconstruct_many(const std::vector<EntityId>& entities) const {
    std::map<EntityId, std::vector<Snapshot>> result;
    if (entities.empty()) return result;

    size_t workers = options_.max_threads > 0 ? options_.max_threads
                                              : std::thread::hardware_concurrency();
    workers = std::max(size_t(1), std::min(workers, entities.size()));

    std::vector<std::vector<Snapshot>> histories(entities.size());
    {
        ThreadPool pool(workers);
        pool.parallel_for(0, entities.size(), [&](size_t i) {
            histories[i] = reconstruct(entities[i]);
        });
    }

    for (size_t i = 0; i < entities.size(); ++i) {
        result[entities[i]] = std::move(histories[i]);
    }
    LOG_DEBUG("Reconstructed ", result.size(), " entities on ", workers, " workers");
    return result;
}

} // namespace factlog
