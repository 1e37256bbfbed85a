#include "storage/json_columns.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>

namespace ladle::storage {

namespace {

Result<QJsonArray, Error> parse_array(std::string_view json) {
    if (json.empty()) {
        return Result<QJsonArray, Error>::ok(QJsonArray{});
    }
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(
        QByteArray(json.data(), static_cast<qsizetype>(json.size())), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isArray()) {
        return Result<QJsonArray, Error>::err(Error{
            ErrorKind::InvalidData,
            "Malformed list column: " + parse_error.errorString().toStdString()});
    }
    return Result<QJsonArray, Error>::ok(doc.array());
}

std::string to_compact_json(const QJsonArray& array) {
    return QJsonDocument(array).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace

std::string encode_string_list(const std::vector<std::string>& values) {
    QJsonArray array;
    for (const auto& v : values) {
        array.append(QString::fromStdString(v));
    }
    return to_compact_json(array);
}

Result<std::vector<std::string>, Error> decode_string_list(std::string_view json) {
    auto parsed = parse_array(json);
    if (parsed.is_err()) {
        return Result<std::vector<std::string>, Error>::err(parsed.unwrap_err());
    }
    
    std::vector<std::string> values;
    for (const auto& item : parsed.unwrap()) {
        if (!item.isString()) {
            return Result<std::vector<std::string>, Error>::err(
                Error{ErrorKind::InvalidData, "List column contains a non-string item"});
        }
        values.push_back(item.toString().toStdString());
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(values));
}

std::string encode_uuid_list(const std::vector<Uuid>& values) {
    QJsonArray array;
    for (const auto& id : values) {
        array.append(QString::fromStdString(id.to_string()));
    }
    return to_compact_json(array);
}

Result<std::vector<Uuid>, Error> decode_uuid_list(std::string_view json) {
    auto strings = decode_string_list(json);
    if (strings.is_err()) {
        return Result<std::vector<Uuid>, Error>::err(strings.unwrap_err());
    }
    
    std::vector<Uuid> ids;
    for (const auto& s : strings.unwrap()) {
        auto id = Uuid::parse(s);
        if (!id) {
            return Result<std::vector<Uuid>, Error>::err(
                Error{ErrorKind::InvalidData, "List column contains an invalid id: " + s});
        }
        ids.push_back(*id);
    }
    return Result<std::vector<Uuid>, Error>::ok(std::move(ids));
}

} // namespace ladle::storage
