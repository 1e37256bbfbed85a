#include "sync/retry_scheduler.hpp"
#include "sync/log.hpp"

#include <QtConcurrent/QtConcurrent>

namespace ladle::sync {

RetryScheduler::RetryScheduler(RemoteStore& remote, RetryBackoff backoff, QObject* parent)
    : QObject(parent)
    , remote_(remote)
    , backoff_(backoff)
    , timer_(std::make_unique<QTimer>(this))
    , watcher_(std::make_unique<QFutureWatcher<SweepResult>>(this))
{
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &RetryScheduler::onTimeout);
    connect(watcher_.get(), &QFutureWatcher<SweepResult>::finished, this, &RetryScheduler::onSweepDone);
}

RetryScheduler::~RetryScheduler() {
    stop();
    watcher_->waitForFinished();
}

void RetryScheduler::add_participant(RetryParticipant* participant) {
    participants_.push_back(participant);
}

void RetryScheduler::start() {
    if (running_) return;
    running_ = true;
    cancelled_ = false;
    qCInfo(ladleSyncLog) << "Retry scheduler started, first sweep in"
                         << static_cast<qint64>(backoff_.current_delay().count()) << "s";
    schedule_next();
}

void RetryScheduler::stop() {
    if (!running_) return;
    running_ = false;
    cancelled_ = true;
    timer_->stop();
    qCInfo(ladleSyncLog) << "Retry scheduler stopped";
}

void RetryScheduler::schedule_next() {
    if (!running_) return;
    const auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(backoff_.current_delay());
    timer_->start(delay);
}

SweepResult RetryScheduler::sweep_participants() {
    size_t pending = 0;
    for (auto* participant : participants_) {
        pending += participant->pending_count();
    }
    if (pending == 0) {
        return SweepResult{};
    }
    
    if (!remote_.is_available()) {
        qCInfo(ladleSyncLog) << "Remote store unavailable," << pending << "items wait for the next sweep";
        return SweepResult{.attempted = static_cast<int>(pending), .failed = static_cast<int>(pending)};
    }
    
    SweepResult total;
    for (auto* participant : participants_) {
        if (cancelled_) {
            total.cancelled = true;
            break;
        }
        const auto result = participant->retry_pending(cancelled_);
        qCDebug(ladleSyncLog) << participant->participant_name() << "retried" << result.attempted
                              << "succeeded" << result.succeeded << "dropped" << result.dropped;
        total += result;
    }
    return total;
}

void RetryScheduler::apply_outcome(const SweepResult& result) {
    if (result.successful()) {
        backoff_.record_success();
    } else {
        backoff_.record_failure();
        qCInfo(ladleSyncLog) << "Sweep failed, next retry in"
                             << static_cast<qint64>(backoff_.current_delay().count()) << "s";
    }
    emit sweepFinished(result.successful(), static_cast<qint64>(backoff_.current_delay().count()));
}

SweepResult RetryScheduler::run_sweep() {
    const auto result = sweep_participants();
    apply_outcome(result);
    return result;
}

void RetryScheduler::onTimeout() {
    if (!running_ || watcher_->isRunning()) return;
    watcher_->setFuture(QtConcurrent::run([this] { return sweep_participants(); }));
}

void RetryScheduler::onSweepDone() {
    const auto result = watcher_->result();
    if (result.cancelled || !running_) {
        return;
    }
    apply_outcome(result);
    schedule_next();
}

} // namespace ladle::sync
