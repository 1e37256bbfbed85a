#pragma once

#include "sync/retry_backoff.hpp"
#include "sync/remote_store.hpp"
#include <QFutureWatcher>
#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <memory>
#include <vector>

namespace ladle::sync {

/**
 * SweepResult - Tally of one retry pass over a participant's pending ids.
 */
struct SweepResult {
    int attempted{0};
    int succeeded{0};
    int failed{0};
    int dropped{0};
    bool cancelled{false};
    
    /** Any success, or nothing to do. */
    [[nodiscard]] bool successful() const noexcept { return attempted == 0 || succeeded > 0; }
    
    SweepResult& operator+=(const SweepResult& other) noexcept {
        attempted += other.attempted;
        succeeded += other.succeeded;
        failed += other.failed;
        dropped += other.dropped;
        cancelled = cancelled || other.cancelled;
        return *this;
    }
};

/**
 * RetryParticipant - Something holding pending ids the scheduler can retry.
 */
class RetryParticipant {
public:
    virtual ~RetryParticipant() = default;
    
    [[nodiscard]] virtual QString participant_name() const = 0;
    [[nodiscard]] virtual size_t pending_count() const = 0;
    
    /**
     * Retry every pending id once. Checks `cancelled` before each id and
     * stops early when it is set.
     */
    virtual SweepResult retry_pending(const std::atomic_bool& cancelled) = 0;
};

/**
 * RetryScheduler - Periodically drains the participants' pending sets.
 *
 * Each sweep runs on the thread pool; the next one is scheduled after it
 * finishes using RetryBackoff. stop() is cooperative: an item already
 * being retried completes, and no further sweep starts.
 */
class RetryScheduler : public QObject {
    Q_OBJECT

public:
    RetryScheduler(RemoteStore& remote, RetryBackoff backoff, QObject* parent = nullptr);
    ~RetryScheduler() override;
    
    /** Participants must outlive the scheduler. */
    void add_participant(RetryParticipant* participant);
    
    void start();
    void stop();
    [[nodiscard]] bool is_running() const { return running_; }
    
    /**
     * Run one sweep on the calling thread and apply its outcome to the
     * backoff. Returns the combined result.
     */
    SweepResult run_sweep();
    
    [[nodiscard]] std::chrono::seconds next_delay() const { return backoff_.current_delay(); }
    [[nodiscard]] const RetryBackoff& backoff() const { return backoff_; }

signals:
    void sweepFinished(bool successful, qint64 next_delay_seconds);

private slots:
    void onTimeout();
    void onSweepDone();

private:
    SweepResult sweep_participants();
    void apply_outcome(const SweepResult& result);
    void schedule_next();
    
    RemoteStore& remote_;
    RetryBackoff backoff_;
    std::vector<RetryParticipant*> participants_;
    std::unique_ptr<QTimer> timer_;
    std::unique_ptr<QFutureWatcher<SweepResult>> watcher_;
    std::atomic_bool cancelled_{false};
    bool running_ = false;
};

} // namespace ladle::sync
