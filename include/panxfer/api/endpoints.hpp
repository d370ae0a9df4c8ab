#pragma once

namespace panxfer::api::endpoints {

// Paths are relative to ClientConfig::api_base
inline constexpr const char* kSignIn = "/b/api/user/sign_in";
inline constexpr const char* kFileList = "/b/api/file/list/new";
inline constexpr const char* kUploadRequest = "/b/api/file/upload_request";
inline constexpr const char* kListUploadParts = "/b/api/file/s3_list_upload_parts";
inline constexpr const char* kPrepareUploadParts = "/b/api/file/s3_repare_upload_parts_batch";
inline constexpr const char* kCompleteMultipart = "/b/api/file/s3_complete_multipart_upload";
inline constexpr const char* kUploadComplete = "/b/api/file/upload_complete";
inline constexpr const char* kDownloadInfo = "/a/api/file/download_info";
inline constexpr const char* kBatchDownloadInfo = "/a/api/file/batch_download_info";
inline constexpr const char* kCreateFolder = "/a/api/file/upload_request";
inline constexpr const char* kTrash = "/a/api/file/trash";
inline constexpr const char* kShareCreate = "/a/api/share/create";

inline constexpr const char* kShareUrlPrefix = "/s/";

/// Service code meaning "a file with this name already exists"
inline constexpr int kNameConflictCode = 5060;
/// sign_in reports success with 200 instead of 0
inline constexpr int kSignInSuccessCode = 200;

} // namespace panxfer::api::endpoints
