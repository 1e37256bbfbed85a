#include "sync/record_codec.hpp"

#include <QJsonArray>

namespace ladle::sync {

namespace {

QString key(const char* name) {
    return QString::fromLatin1(name);
}

QJsonValue text_value(const std::optional<std::string>& value) {
    if (!value) return QJsonValue(QJsonValue::Null);
    return QString::fromStdString(*value);
}

QJsonArray text_array(const std::vector<std::string>& values) {
    QJsonArray out;
    for (const auto& v : values) {
        out.append(QString::fromStdString(v));
    }
    return out;
}

QJsonValue millis_value(Timestamp ts) {
    return QJsonValue(static_cast<qint64>(ts.millis()));
}

RemoteRecord make_record(EntityKind kind, const Uuid& id, QJsonObject fields) {
    fields.insert(key("id"), QString::fromStdString(id.to_string()));
    return RemoteRecord{
        .record_type = remote_record_type(kind),
        .record_id = id.to_string(),
        .fields = std::move(fields)
    };
}

/**
 * Reads typed fields out of a record, remembering the first problem.
 */
class FieldReader {
public:
    FieldReader(const RemoteRecord& record, EntityKind kind)
        : record_(record)
    {
        if (record.record_type != remote_record_type(kind)) {
            error_ = Error{ErrorKind::InvalidData,
                           "Expected " + remote_record_type(kind) + " record, got " + record.record_type};
        }
    }
    
    std::string text(const char* name) {
        const auto value = record_.fields.value(key(name));
        if (!value.isString()) {
            fail(name, "is missing or not a string");
            return {};
        }
        return value.toString().toStdString();
    }
    
    std::optional<std::string> optional_text(const char* name) {
        const auto value = record_.fields.value(key(name));
        if (value.isUndefined() || value.isNull()) return std::nullopt;
        if (!value.isString()) {
            fail(name, "is not a string");
            return std::nullopt;
        }
        return value.toString().toStdString();
    }
    
    std::optional<int> optional_int(const char* name) {
        const auto value = record_.fields.value(key(name));
        if (value.isUndefined() || value.isNull()) return std::nullopt;
        if (!value.isDouble()) {
            fail(name, "is not a number");
            return std::nullopt;
        }
        return value.toInt();
    }
    
    Uuid uuid(const char* name) {
        auto parsed = Uuid::parse(text(name));
        if (!parsed) {
            fail(name, "is not a valid id");
            return Uuid{};
        }
        return *parsed;
    }
    
    Timestamp timestamp(const char* name) {
        const auto value = record_.fields.value(key(name));
        if (!value.isDouble()) {
            fail(name, "is missing or not a timestamp");
            return Timestamp{};
        }
        return Timestamp(value.toInteger());
    }
    
    std::vector<std::string> texts(const char* name) {
        std::vector<std::string> out;
        const auto value = record_.fields.value(key(name));
        if (value.isUndefined() || value.isNull()) return out;
        if (!value.isArray()) {
            fail(name, "is not an array");
            return out;
        }
        for (const auto& item : value.toArray()) {
            if (!item.isString()) {
                fail(name, "contains a non-string element");
                return {};
            }
            out.push_back(item.toString().toStdString());
        }
        return out;
    }
    
    std::vector<Uuid> uuids(const char* name) {
        std::vector<Uuid> out;
        for (const auto& s : texts(name)) {
            auto parsed = Uuid::parse(s);
            if (!parsed) {
                fail(name, "contains an invalid id");
                return {};
            }
            out.push_back(*parsed);
        }
        return out;
    }
    
    /** Succeeds with value unless a field failed or the id does not match the record id. */
    template<typename T>
    Res<T> finish(T value) {
        if (!error_ && value.id.to_string() != record_.record_id) {
            error_ = Error{ErrorKind::InvalidData,
                           "Record id " + record_.record_id + " does not match payload id"};
        }
        if (error_) return Res<T>::err(*error_);
        return Res<T>::ok(std::move(value));
    }

private:
    void fail(const char* name, const char* what) {
        if (error_) return;
        error_ = Error{ErrorKind::InvalidData,
                       record_.record_type + " " + record_.record_id + ": field '" + name + "' " + what};
    }
    
    const RemoteRecord& record_;
    std::optional<Error> error_;
};

} // namespace

RemoteRecord to_record(const Recipe& recipe) {
    QJsonObject fields;
    fields.insert(key("title"), QString::fromStdString(recipe.title));
    fields.insert(key("ingredients"), text_array(recipe.ingredients));
    fields.insert(key("steps"), text_array(recipe.steps));
    fields.insert(key("tags"), text_array(recipe.tags));
    fields.insert(key("yields"), QString::fromStdString(recipe.yields));
    fields.insert(key("total_minutes"),
                  recipe.total_minutes ? QJsonValue(*recipe.total_minutes) : QJsonValue(QJsonValue::Null));
    fields.insert(key("notes"), QString::fromStdString(recipe.notes));
    fields.insert(key("source_url"), QString::fromStdString(recipe.source_url));
    fields.insert(key("image_filename"), text_value(recipe.image_filename));
    fields.insert(key("visibility"), QString::fromStdString(to_string(recipe.visibility)));
    fields.insert(key("owner_id"), QString::fromStdString(recipe.owner_id.to_string()));
    fields.insert(key("created_at"), millis_value(recipe.created_at));
    fields.insert(key("updated_at"), millis_value(recipe.updated_at));
    return make_record(EntityKind::Recipe, recipe.id, std::move(fields));
}

RemoteRecord to_record(const Collection& collection) {
    QJsonArray recipe_ids;
    for (const auto& id : collection.recipe_ids) {
        recipe_ids.append(QString::fromStdString(id.to_string()));
    }
    
    QJsonObject fields;
    fields.insert(key("name"), QString::fromStdString(collection.name));
    fields.insert(key("description"), QString::fromStdString(collection.description));
    fields.insert(key("user_id"), QString::fromStdString(collection.user_id.to_string()));
    fields.insert(key("recipe_ids"), recipe_ids);
    fields.insert(key("visibility"), QString::fromStdString(to_string(collection.visibility)));
    fields.insert(key("emoji"), text_value(collection.emoji));
    fields.insert(key("color"), text_value(collection.color));
    fields.insert(key("cover_image_filename"), text_value(collection.cover_image_filename));
    fields.insert(key("created_at"), millis_value(collection.created_at));
    fields.insert(key("updated_at"), millis_value(collection.updated_at));
    return make_record(EntityKind::Collection, collection.id, std::move(fields));
}

RemoteRecord to_record(const Connection& connection) {
    QJsonObject fields;
    fields.insert(key("from_user_id"), QString::fromStdString(connection.from_user_id.to_string()));
    fields.insert(key("to_user_id"), QString::fromStdString(connection.to_user_id.to_string()));
    fields.insert(key("status"), QString::fromStdString(to_string(connection.status)));
    fields.insert(key("from_username"), text_value(connection.from_username));
    fields.insert(key("from_display_name"), text_value(connection.from_display_name));
    fields.insert(key("to_username"), text_value(connection.to_username));
    fields.insert(key("to_display_name"), text_value(connection.to_display_name));
    fields.insert(key("created_at"), millis_value(connection.created_at));
    fields.insert(key("updated_at"), millis_value(connection.updated_at));
    return make_record(EntityKind::Connection, connection.id, std::move(fields));
}

RemoteRecord to_record(const User& user) {
    QJsonObject fields;
    fields.insert(key("username"), QString::fromStdString(user.username));
    fields.insert(key("display_name"), QString::fromStdString(user.display_name));
    fields.insert(key("email"), text_value(user.email));
    fields.insert(key("profile_emoji"), text_value(user.profile_emoji));
    fields.insert(key("profile_color"), text_value(user.profile_color));
    fields.insert(key("profile_image_filename"), text_value(user.profile_image_filename));
    fields.insert(key("created_at"), millis_value(user.created_at));
    fields.insert(key("updated_at"), millis_value(user.updated_at));
    return make_record(EntityKind::User, user.id, std::move(fields));
}

Res<Recipe> recipe_from_record(const RemoteRecord& record) {
    FieldReader r(record, EntityKind::Recipe);
    Recipe recipe{
        .id = r.uuid("id"),
        .title = r.text("title"),
        .ingredients = r.texts("ingredients"),
        .steps = r.texts("steps"),
        .tags = r.texts("tags"),
        .yields = r.optional_text("yields").value_or(""),
        .total_minutes = r.optional_int("total_minutes"),
        .notes = r.optional_text("notes").value_or(""),
        .source_url = r.optional_text("source_url").value_or(""),
        .image_filename = r.optional_text("image_filename"),
        .visibility = visibility_from_string(r.optional_text("visibility").value_or("private")),
        .owner_id = r.uuid("owner_id"),
        .created_at = r.timestamp("created_at"),
        .updated_at = r.timestamp("updated_at")
    };
    return r.finish(std::move(recipe));
}

Res<Collection> collection_from_record(const RemoteRecord& record) {
    FieldReader r(record, EntityKind::Collection);
    Collection collection{
        .id = r.uuid("id"),
        .name = r.text("name"),
        .description = r.optional_text("description").value_or(""),
        .user_id = r.uuid("user_id"),
        .recipe_ids = r.uuids("recipe_ids"),
        .visibility = visibility_from_string(r.optional_text("visibility").value_or("private")),
        .emoji = r.optional_text("emoji"),
        .color = r.optional_text("color"),
        .cover_image_filename = r.optional_text("cover_image_filename"),
        .created_at = r.timestamp("created_at"),
        .updated_at = r.timestamp("updated_at")
    };
    return r.finish(std::move(collection));
}

Res<Connection> connection_from_record(const RemoteRecord& record) {
    FieldReader r(record, EntityKind::Connection);
    Connection connection{
        .id = r.uuid("id"),
        .from_user_id = r.uuid("from_user_id"),
        .to_user_id = r.uuid("to_user_id"),
        .status = connection_status_from_string(r.optional_text("status").value_or("pending")),
        .from_username = r.optional_text("from_username"),
        .from_display_name = r.optional_text("from_display_name"),
        .to_username = r.optional_text("to_username"),
        .to_display_name = r.optional_text("to_display_name"),
        .created_at = r.timestamp("created_at"),
        .updated_at = r.timestamp("updated_at")
    };
    return r.finish(std::move(connection));
}

Res<User> user_from_record(const RemoteRecord& record) {
    FieldReader r(record, EntityKind::User);
    User user{
        .id = r.uuid("id"),
        .username = r.text("username"),
        .display_name = r.optional_text("display_name").value_or(""),
        .email = r.optional_text("email"),
        .profile_emoji = r.optional_text("profile_emoji"),
        .profile_color = r.optional_text("profile_color"),
        .profile_image_filename = r.optional_text("profile_image_filename"),
        .created_at = r.timestamp("created_at"),
        .updated_at = r.timestamp("updated_at")
    };
    return r.finish(std::move(user));
}

std::optional<Timestamp> record_updated_at(const RemoteRecord& record) {
    const auto value = record.fields.value(key("updated_at"));
    if (!value.isDouble()) return std::nullopt;
    return Timestamp(value.toInteger());
}

} // namespace ladle::sync
