#include "sync/pending_set.hpp"

#include <QMutexLocker>
#include <algorithm>

namespace ladle::sync {

void PendingSet::mark(const Uuid& id) {
    QMutexLocker lock(&mutex_);
    entries_[id] = Entry{0, next_generation_++};
}

bool PendingSet::record_failure(const Uuid& id) {
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    if (++it->second.failures >= max_attempts_) {
        entries_.erase(it);
        return false;
    }
    return true;
}

void PendingSet::clear(const Uuid& id) {
    QMutexLocker lock(&mutex_);
    entries_.erase(id);
}

void PendingSet::clear_all() {
    QMutexLocker lock(&mutex_);
    entries_.clear();
}

uint64_t PendingSet::generation(const Uuid& id) const {
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? 0 : it->second.generation;
}

bool PendingSet::clear_if_unchanged(const Uuid& id, uint64_t generation) {
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return true;
    }
    if (it->second.generation != generation) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool PendingSet::contains(const Uuid& id) const {
    QMutexLocker lock(&mutex_);
    return entries_.count(id) > 0;
}

int PendingSet::failures(const Uuid& id) const {
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? 0 : it->second.failures;
}

std::vector<Uuid> PendingSet::snapshot() const {
    QMutexLocker lock(&mutex_);
    std::vector<Uuid> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t PendingSet::size() const {
    QMutexLocker lock(&mutex_);
    return entries_.size();
}

int PendingSet::max_attempts() const {
    QMutexLocker lock(&mutex_);
    return max_attempts_;
}

} // namespace ladle::sync
