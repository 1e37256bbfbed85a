#include "sync/event_bus.hpp"

namespace ladle::sync {

void register_sync_meta_types() {
    static const bool registered = [] {
        qRegisterMetaType<ladle::Uuid>("ladle::Uuid");
        qRegisterMetaType<ladle::EntityKind>("ladle::EntityKind");
        qRegisterMetaType<ladle::OpKind>("ladle::OpKind");
        qRegisterMetaType<ladle::OpStatus>("ladle::OpStatus");
        qRegisterMetaType<ladle::Visibility>("ladle::Visibility");
        return true;
    }();
    Q_UNUSED(registered)
}

EventBus::EventBus(QObject* parent)
    : QObject(parent)
{
    register_sync_meta_types();
}

} // namespace ladle::sync
