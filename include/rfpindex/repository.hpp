/**
 * @file repository.hpp
 * @brief Read access to the relational store that owns the business entities.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "domain.hpp"

namespace rfpindex {

/**
 * Lookup and paginated listing for one entity type.
 */
template <typename T>
class EntityRepository {
public:
    virtual ~EntityRepository() = default;

    virtual std::optional<T> find_by_id(int64_t id) const = 0;

    /**
     * Entities ordered by id, starting at offset.
     */
    virtual std::vector<T> list(size_t limit, size_t offset) const = 0;

    virtual size_t count() const = 0;
};

/**
 * Map-backed repository used by tests and the CLI.
 */
template <typename T>
class InMemoryRepository : public EntityRepository<T> {
public:
    void put(T entity) {
        std::unique_lock lock(mutex_);
        int64_t id = entity.id;
        entities_.insert_or_assign(id, std::move(entity));
    }

    bool remove(int64_t id) {
        std::unique_lock lock(mutex_);
        return entities_.erase(id) > 0;
    }

    std::optional<T> find_by_id(int64_t id) const override {
        std::shared_lock lock(mutex_);
        auto it = entities_.find(id);
        if (it == entities_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<T> list(size_t limit, size_t offset) const override {
        std::shared_lock lock(mutex_);
        std::vector<T> out;
        if (offset >= entities_.size()) {
            return out;
        }
        auto it = entities_.begin();
        std::advance(it, offset);
        for (; it != entities_.end() && out.size() < limit; ++it) {
            out.push_back(it->second);
        }
        return out;
    }

    size_t count() const override {
        std::shared_lock lock(mutex_);
        return entities_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<int64_t, T> entities_;
};

struct DomainRepositories {
    std::shared_ptr<EntityRepository<Opportunity>> opportunities;
    std::shared_ptr<EntityRepository<Proposal>> proposals;
    std::shared_ptr<EntityRepository<WonBid>> won_bids;
    std::shared_ptr<EntityRepository<ProjectDocument>> project_documents;
};

} // namespace rfpindex
