#pragma once

#include "core/sync_types.hpp"
#include "core/types.hpp"
#include "core/visibility.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>

namespace ladle::sync {

/**
 * EventBus - Typed publish/subscribe channel for domain events.
 *
 * Injected into repositories; never a global. Local-phase events are
 * emitted on the caller's thread in local write order. Background events
 * (sync operation transitions, asset uploads, errors) are emitted from
 * worker threads, so receivers that live on a thread with an event loop
 * get them queued.
 */
class EventBus : public QObject {
    Q_OBJECT

public:
    explicit EventBus(QObject* parent = nullptr);

signals:
    void entityCreated(ladle::EntityKind kind, const ladle::Uuid& id);
    void entityUpdated(ladle::EntityKind kind, const ladle::Uuid& id);
    void entityDeleted(ladle::EntityKind kind, const ladle::Uuid& id);
    
    /** Remote bookkeeping (record ids, asset times) changed; payload did not. */
    void metadataChanged(ladle::EntityKind kind, const ladle::Uuid& id);
    
    void visibilityChanged(ladle::EntityKind kind, const ladle::Uuid& id,
                           ladle::Visibility from, ladle::Visibility to);
    
    void syncOperationChanged(ladle::EntityKind kind, const ladle::Uuid& id,
                              ladle::OpKind op, ladle::OpStatus status);
    
    void assetUploadPending(ladle::EntityKind kind, const ladle::Uuid& id);
    void assetUploadCompleted(ladle::EntityKind kind, const ladle::Uuid& id);
    
    void syncError(ladle::EntityKind kind, const ladle::Uuid& id, const QString& message);
};

/** Register the signal argument types with the meta-type system. Idempotent. */
void register_sync_meta_types();

} // namespace ladle::sync

Q_DECLARE_METATYPE(ladle::Uuid)
Q_DECLARE_METATYPE(ladle::EntityKind)
Q_DECLARE_METATYPE(ladle::OpKind)
Q_DECLARE_METATYPE(ladle::OpStatus)
Q_DECLARE_METATYPE(ladle::Visibility)
