#include "panxfer/api/models.hpp"

#include <initializer_list>

namespace panxfer::api {
namespace {

// The service mixes PascalCase and camelCase between endpoints
const nlohmann::json* find_any(const nlohmann::json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        const auto it = object.find(key);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<std::string> string_field(const nlohmann::json& object,
                                        std::initializer_list<const char*> keys) {
    const auto* value = find_any(object, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_number_integer()) {
        return std::to_string(value->get<std::int64_t>());
    }
    return std::nullopt;
}

std::optional<std::int64_t> int_field(const nlohmann::json& object,
                                      std::initializer_list<const char*> keys) {
    const auto* value = find_any(object, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->get<std::int64_t>();
    }
    if (value->is_string()) {
        try {
            return std::stoll(value->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool non_empty(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

} // namespace

Result<FileEntry> parse_file_entry(const nlohmann::json& object) {
    const auto id = int_field(object, {"FileId", "fileId"});
    const auto name = string_field(object, {"FileName", "fileName"});
    if (!id || !name) {
        return Err<FileEntry>(protocol_error("file entry without FileId or FileName"));
    }

    FileEntry entry;
    entry.id = *id;
    entry.name = *name;
    entry.size = int_field(object, {"Size", "size"}).value_or(0);
    entry.kind = int_field(object, {"Type", "type"}).value_or(0) == 1 ? FileKind::Folder : FileKind::File;
    entry.content_fingerprint = string_field(object, {"Etag", "etag"});
    entry.storage_key_flag = string_field(object, {"S3KeyFlag", "s3KeyFlag"});
    return Ok(std::move(entry));
}

Result<UploadNegotiation> parse_negotiation(const nlohmann::json& data) {
    if (!data.is_object()) {
        return Err<UploadNegotiation>(protocol_error("upload request returned no data"));
    }

    const auto file_id = int_field(data, {"FileId", "fileId"}).value_or(0);

    const auto* reuse = find_any(data, {"Reuse", "reuse"});
    if (reuse != nullptr && reuse->is_boolean() && reuse->get<bool>()) {
        return Ok(UploadNegotiation{Reused{file_id}});
    }

    const auto upload_id = string_field(data, {"UploadId", "uploadId"});
    const auto key = string_field(data, {"Key", "key"});
    const auto bucket = string_field(data, {"Bucket", "bucket"});
    const auto storage_node = string_field(data, {"StorageNode", "storageNode"});
    if (!non_empty(upload_id) || !non_empty(key) || !non_empty(bucket) || !non_empty(storage_node)) {
        return Err<UploadNegotiation>(protocol_error("missing chunk session fields"));
    }

    ChunkSession session;
    session.upload_id = *upload_id;
    session.object_key = *key;
    session.bucket = *bucket;
    session.storage_node = *storage_node;
    session.final_file_id = file_id;
    return Ok(UploadNegotiation{std::move(session)});
}

} // namespace panxfer::api
