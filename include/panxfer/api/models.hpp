#pragma once

#include "panxfer/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace panxfer::api {

enum class FileKind {
    File = 0,
    Folder = 1
};

/**
 * @brief Remote identity of a listed file or folder
 */
struct FileEntry {
    std::int64_t id = 0;
    std::string name;
    std::int64_t size = 0;
    FileKind kind = FileKind::File;
    std::optional<std::string> content_fingerprint;  ///< Etag (hex MD5)
    std::optional<std::string> storage_key_flag;     ///< Required by download_info
};

/**
 * @brief Server-side instruction for name conflicts on upload
 */
enum class DuplicatePolicy {
    Ask = 0,
    Overwrite = 1,
    Rename = 2
};

/// Server already holds matching content; nothing to transfer
struct Reused {
    std::int64_t final_file_id = 0;
};

/// Multipart upload context scoping a sequence of part uploads
struct ChunkSession {
    std::string upload_id;
    std::string object_key;
    std::string bucket;
    std::string storage_node;
    std::int64_t final_file_id = 0;
};

using UploadNegotiation = std::variant<Reused, ChunkSession>;

struct PartDescriptor {
    std::uint32_t part_number = 1;
    std::string destination_url;
};

struct DownloadTicket {
    std::string intermediate_url;
};

struct ResolvedDownloadUrl {
    std::string url;
    std::optional<std::uint64_t> declared_size;
};

/**
 * @brief The {code, message, data} wrapper every service reply uses
 */
struct ApiEnvelope {
    long http_status = 0;
    int code = 0;
    std::string message;
    nlohmann::json data;  ///< null when absent

    bool has_data() const { return !data.is_null(); }
};

struct ShareLink {
    std::string url;
    std::string password;
};

// ─── JSON mapping ──────────────────────────────────────────

Result<FileEntry> parse_file_entry(const nlohmann::json& object);

/**
 * @brief Turn upload_request data into a negotiation outcome
 *
 * Reuse wins over session fields; without reuse all four session fields
 * must be present or the reply is a Protocol error.
 */
Result<UploadNegotiation> parse_negotiation(const nlohmann::json& data);

} // namespace panxfer::api
