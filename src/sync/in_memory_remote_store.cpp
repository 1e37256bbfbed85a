#include "sync/in_memory_remote_store.hpp"

#include <QMutexLocker>
#include <algorithm>
#include <iterator>

namespace ladle::sync {

const char* to_string(InMemoryRemoteStore::Operation operation) noexcept {
    using Op = InMemoryRemoteStore::Operation;
    switch (operation) {
        case Op::SaveRecord: return "save_record";
        case Op::FetchRecord: return "fetch_record";
        case Op::QueryRecords: return "query_records";
        case Op::DeleteRecord: return "delete_record";
        case Op::UploadAsset: return "upload_asset";
        case Op::DownloadAsset: return "download_asset";
        case Op::DeleteAsset: return "delete_asset";
    }
    return "unknown";
}

std::optional<Error> InMemoryRemoteStore::begin_call(const Call& call) {
    CallHook hook;
    {
        QMutexLocker lock(&mutex_);
        calls_.push_back(call);
        hook = hook_;
    }
    
    if (hook) {
        hook(call);
    }
    
    QMutexLocker lock(&mutex_);
    if (!available_) {
        return Error{ErrorKind::NetworkUnavailable, "Remote store unavailable"};
    }
    auto it = failures_.find(call.operation);
    if (it == failures_.end()) {
        return std::nullopt;
    }
    auto error = it->second.error;
    if (it->second.remaining > 0 && --it->second.remaining == 0) {
        failures_.erase(it);
    }
    return error;
}

bool InMemoryRemoteStore::is_available() {
    QMutexLocker lock(&mutex_);
    return available_;
}

Res<RemoteRecord> InMemoryRemoteStore::save_record(Partition partition, const RemoteRecord& record) {
    if (auto error = begin_call({Operation::SaveRecord, partition, record.record_id, record.fields})) {
        return Res<RemoteRecord>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    clock_ = std::max(clock_ + 1, Timestamp::now().millis());
    RemoteRecord stored = record;
    stored.modified_at = Timestamp(clock_);
    records_[RecordKey{partition, record.record_type, record.record_id}] = stored;
    return Res<RemoteRecord>::ok(std::move(stored));
}

Res<std::optional<RemoteRecord>> InMemoryRemoteStore::fetch_record(
    Partition partition, const std::string& record_type, const std::string& record_id
) {
    if (auto error = begin_call({Operation::FetchRecord, partition, record_id, {}})) {
        return Res<std::optional<RemoteRecord>>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    auto it = records_.find(RecordKey{partition, record_type, record_id});
    if (it == records_.end()) {
        return Res<std::optional<RemoteRecord>>::ok(std::nullopt);
    }
    return Res<std::optional<RemoteRecord>>::ok(it->second);
}

Res<std::vector<RemoteRecord>> InMemoryRemoteStore::query_records(
    Partition partition, const std::string& record_type, const std::optional<FieldMatch>& match
) {
    if (auto error = begin_call({Operation::QueryRecords, partition, record_type, {}})) {
        return Res<std::vector<RemoteRecord>>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    std::vector<RemoteRecord> out;
    for (const auto& [key, record] : records_) {
        if (std::get<0>(key) != partition || std::get<1>(key) != record_type) continue;
        if (match) {
            const auto value = record.fields.value(QString::fromStdString(match->field)).toString();
            if (value.toStdString() != match->value) continue;
        }
        out.push_back(record);
    }
    return Res<std::vector<RemoteRecord>>::ok(std::move(out));
}

Res<void> InMemoryRemoteStore::delete_record(
    Partition partition, const std::string& record_type, const std::string& record_id
) {
    if (auto error = begin_call({Operation::DeleteRecord, partition, record_id, {}})) {
        return Res<void>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    if (records_.erase(RecordKey{partition, record_type, record_id}) == 0) {
        return Res<void>::err(Error{ErrorKind::NotFound, "No record " + record_id});
    }
    return Res<void>::ok();
}

Res<std::string> InMemoryRemoteStore::upload_asset(
    Partition partition, const std::string& asset_id, const QByteArray& data
) {
    if (auto error = begin_call({Operation::UploadAsset, partition, asset_id, {}})) {
        return Res<std::string>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    assets_[AssetKey{partition, asset_id}] = data;
    return Res<std::string>::ok(asset_id);
}

Res<std::optional<QByteArray>> InMemoryRemoteStore::download_asset(
    Partition partition, const std::string& asset_id
) {
    if (auto error = begin_call({Operation::DownloadAsset, partition, asset_id, {}})) {
        return Res<std::optional<QByteArray>>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    auto it = assets_.find(AssetKey{partition, asset_id});
    if (it == assets_.end()) {
        return Res<std::optional<QByteArray>>::ok(std::nullopt);
    }
    return Res<std::optional<QByteArray>>::ok(it->second);
}

Res<void> InMemoryRemoteStore::delete_asset(Partition partition, const std::string& asset_id) {
    if (auto error = begin_call({Operation::DeleteAsset, partition, asset_id, {}})) {
        return Res<void>::err(*error);
    }
    
    QMutexLocker lock(&mutex_);
    if (assets_.erase(AssetKey{partition, asset_id}) == 0) {
        return Res<void>::err(Error{ErrorKind::NotFound, "No asset " + asset_id});
    }
    return Res<void>::ok();
}

void InMemoryRemoteStore::set_available(bool available) {
    QMutexLocker lock(&mutex_);
    available_ = available;
}

void InMemoryRemoteStore::fail_next(Operation operation, Error error, int times) {
    QMutexLocker lock(&mutex_);
    failures_[operation] = InjectedFailure{std::move(error), std::max(times, 1)};
}

void InMemoryRemoteStore::fail_always(Operation operation, Error error) {
    QMutexLocker lock(&mutex_);
    failures_[operation] = InjectedFailure{std::move(error), -1};
}

void InMemoryRemoteStore::clear_failures() {
    QMutexLocker lock(&mutex_);
    failures_.clear();
}

void InMemoryRemoteStore::set_call_hook(CallHook hook) {
    QMutexLocker lock(&mutex_);
    hook_ = std::move(hook);
}

std::vector<InMemoryRemoteStore::Call> InMemoryRemoteStore::calls() const {
    QMutexLocker lock(&mutex_);
    return calls_;
}

std::vector<InMemoryRemoteStore::Call> InMemoryRemoteStore::calls(Operation operation) const {
    QMutexLocker lock(&mutex_);
    std::vector<Call> out;
    std::copy_if(calls_.begin(), calls_.end(), std::back_inserter(out),
                 [operation](const Call& call) { return call.operation == operation; });
    return out;
}

int InMemoryRemoteStore::call_count(Operation operation) const {
    QMutexLocker lock(&mutex_);
    return static_cast<int>(std::count_if(calls_.begin(), calls_.end(),
        [operation](const Call& call) { return call.operation == operation; }));
}

void InMemoryRemoteStore::clear_calls() {
    QMutexLocker lock(&mutex_);
    calls_.clear();
}

std::optional<RemoteRecord> InMemoryRemoteStore::record(
    Partition partition, const std::string& record_type, const std::string& record_id
) const {
    QMutexLocker lock(&mutex_);
    auto it = records_.find(RecordKey{partition, record_type, record_id});
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::optional<QByteArray> InMemoryRemoteStore::asset(Partition partition, const std::string& asset_id) const {
    QMutexLocker lock(&mutex_);
    auto it = assets_.find(AssetKey{partition, asset_id});
    if (it == assets_.end()) return std::nullopt;
    return it->second;
}

size_t InMemoryRemoteStore::record_count(Partition partition) const {
    QMutexLocker lock(&mutex_);
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [partition](const auto& entry) { return std::get<0>(entry.first) == partition; }));
}

size_t InMemoryRemoteStore::asset_count(Partition partition) const {
    QMutexLocker lock(&mutex_);
    return static_cast<size_t>(std::count_if(assets_.begin(), assets_.end(),
        [partition](const auto& entry) { return entry.first.first == partition; }));
}

void InMemoryRemoteStore::put_record(Partition partition, RemoteRecord record) {
    QMutexLocker lock(&mutex_);
    clock_ = std::max(clock_, record.modified_at.millis());
    RecordKey key{partition, record.record_type, record.record_id};
    records_[key] = std::move(record);
}

void InMemoryRemoteStore::put_asset(Partition partition, const std::string& asset_id, QByteArray data) {
    QMutexLocker lock(&mutex_);
    assets_[AssetKey{partition, asset_id}] = std::move(data);
}

} // namespace ladle::sync
