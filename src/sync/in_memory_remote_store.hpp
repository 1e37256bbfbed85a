#pragma once

#include "sync/remote_store.hpp"
#include <QMutex>
#include <functional>
#include <map>
#include <tuple>

namespace ladle::sync {

/**
 * InMemoryRemoteStore - Thread-safe RemoteStore kept entirely in memory.
 *
 * Used by tests and by the round-trip check tool. Every call is logged,
 * failures can be injected per operation, and the whole store can be
 * taken offline.
 */
class InMemoryRemoteStore : public RemoteStore {
public:
    enum class Operation {
        SaveRecord,
        FetchRecord,
        QueryRecords,
        DeleteRecord,
        UploadAsset,
        DownloadAsset,
        DeleteAsset
    };
    
    struct Call {
        Operation operation;
        Partition partition;
        std::string id;
        QJsonObject fields;
    };
    
    /** Invoked at the start of every call, outside the store lock. */
    using CallHook = std::function<void(const Call&)>;
    
    InMemoryRemoteStore() = default;
    
    bool is_available() override;
    Res<RemoteRecord> save_record(Partition partition, const RemoteRecord& record) override;
    Res<std::optional<RemoteRecord>> fetch_record(
        Partition partition, const std::string& record_type, const std::string& record_id) override;
    Res<std::vector<RemoteRecord>> query_records(
        Partition partition, const std::string& record_type,
        const std::optional<FieldMatch>& match = std::nullopt) override;
    Res<void> delete_record(
        Partition partition, const std::string& record_type, const std::string& record_id) override;
    Res<std::string> upload_asset(
        Partition partition, const std::string& asset_id, const QByteArray& data) override;
    Res<std::optional<QByteArray>> download_asset(Partition partition, const std::string& asset_id) override;
    Res<void> delete_asset(Partition partition, const std::string& asset_id) override;
    
    // Failure injection
    void set_available(bool available);
    
    /** Fail the next `times` calls of `operation` with `error`. */
    void fail_next(Operation operation, Error error, int times = 1);
    
    /** Fail every call of `operation` until clear_failures(). */
    void fail_always(Operation operation, Error error);
    
    void clear_failures();
    
    void set_call_hook(CallHook hook);
    
    // Inspection
    [[nodiscard]] std::vector<Call> calls() const;
    [[nodiscard]] std::vector<Call> calls(Operation operation) const;
    [[nodiscard]] int call_count(Operation operation) const;
    void clear_calls();
    
    [[nodiscard]] std::optional<RemoteRecord> record(
        Partition partition, const std::string& record_type, const std::string& record_id) const;
    [[nodiscard]] std::optional<QByteArray> asset(Partition partition, const std::string& asset_id) const;
    [[nodiscard]] size_t record_count(Partition partition) const;
    [[nodiscard]] size_t asset_count(Partition partition) const;
    
    /** Seed a record without logging a call. modified_at is kept as given. */
    void put_record(Partition partition, RemoteRecord record);
    void put_asset(Partition partition, const std::string& asset_id, QByteArray data);

private:
    using RecordKey = std::tuple<Partition, std::string, std::string>;
    using AssetKey = std::pair<Partition, std::string>;
    
    struct InjectedFailure {
        Error error;
        int remaining{0};  // -1 = unlimited
    };
    
    /** Log the call and return the error it must fail with, if any. */
    [[nodiscard]] std::optional<Error> begin_call(const Call& call);
    
    mutable QMutex mutex_;
    std::map<RecordKey, RemoteRecord> records_;
    std::map<AssetKey, QByteArray> assets_;
    std::map<Operation, InjectedFailure> failures_;
    std::vector<Call> calls_;
    CallHook hook_;
    bool available_ = true;
    int64_t clock_ = 0;
};

[[nodiscard]] const char* to_string(InMemoryRemoteStore::Operation operation) noexcept;

} // namespace ladle::sync
