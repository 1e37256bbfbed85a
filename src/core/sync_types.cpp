#include "core/sync_types.hpp"

namespace ladle {

std::string to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::Recipe: return "recipe";
        case EntityKind::Collection: return "collection";
        case EntityKind::Connection: return "connection";
        case EntityKind::User: return "user";
    }
    return "recipe";
}

std::string to_string(OpKind kind) {
    switch (kind) {
        case OpKind::Create: return "create";
        case OpKind::Update: return "update";
        case OpKind::Delete: return "delete";
    }
    return "update";
}

std::string to_string(OpStatus status) {
    switch (status) {
        case OpStatus::Queued: return "queued";
        case OpStatus::InProgress: return "in_progress";
        case OpStatus::Completed: return "completed";
        case OpStatus::Failed: return "failed";
    }
    return "queued";
}

std::optional<EntityKind> entity_kind_from_string(std::string_view s) {
    if (s == "recipe") return EntityKind::Recipe;
    if (s == "collection") return EntityKind::Collection;
    if (s == "connection") return EntityKind::Connection;
    if (s == "user") return EntityKind::User;
    return std::nullopt;
}

std::optional<OpKind> op_kind_from_string(std::string_view s) {
    if (s == "create") return OpKind::Create;
    if (s == "update") return OpKind::Update;
    if (s == "delete") return OpKind::Delete;
    return std::nullopt;
}

std::optional<OpStatus> op_status_from_string(std::string_view s) {
    if (s == "queued") return OpStatus::Queued;
    if (s == "in_progress") return OpStatus::InProgress;
    if (s == "completed") return OpStatus::Completed;
    if (s == "failed") return OpStatus::Failed;
    return std::nullopt;
}

std::string remote_record_type(EntityKind kind) {
    switch (kind) {
        case EntityKind::Recipe: return "Recipe";
        case EntityKind::Collection: return "Collection";
        case EntityKind::Connection: return "Connection";
        case EntityKind::User: return "User";
    }
    return "Recipe";
}

} // namespace ladle
