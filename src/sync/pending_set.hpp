#pragma once

#include "core/types.hpp"
#include <QMutex>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace ladle::sync {

/**
 * PendingSet - Ids awaiting a retried sync, with per-id failure counters.
 *
 * An id is dropped once it has failed max_attempts times; only a new
 * mark() (a fresh local write) brings it back.
 *
 * Every mark() hands out a new generation, so a push that started before a
 * newer write can tell that its success no longer covers the id.
 */
class PendingSet {
public:
    explicit PendingSet(int max_attempts = 10) : max_attempts_(max_attempts) {}
    
    /** Add id with a fresh counter. */
    void mark(const Uuid& id);
    
    /**
     * Count one failed attempt. Returns true while the id stays pending,
     * false once it was dropped (or was not pending).
     */
    bool record_failure(const Uuid& id);
    
    void clear(const Uuid& id);
    void clear_all();
    
    /** Generation of id's current mark, 0 when id is not pending. */
    [[nodiscard]] uint64_t generation(const Uuid& id) const;
    
    /**
     * Clear id unless it was marked again after `generation` was taken.
     * Returns false when a newer mark keeps it pending.
     */
    bool clear_if_unchanged(const Uuid& id, uint64_t generation);
    
    [[nodiscard]] bool contains(const Uuid& id) const;
    [[nodiscard]] int failures(const Uuid& id) const;
    [[nodiscard]] std::vector<Uuid> snapshot() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }
    
    [[nodiscard]] int max_attempts() const;

private:
    struct Entry {
        int failures{0};
        uint64_t generation{0};
    };
    
    mutable QMutex mutex_;
    std::unordered_map<Uuid, Entry> entries_;
    uint64_t next_generation_{1};
    int max_attempts_;
};

} // namespace ladle::sync
