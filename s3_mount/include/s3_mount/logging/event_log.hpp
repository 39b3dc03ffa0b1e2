#ifndef S3_MOUNT_LOGGING_EVENT_LOG_HPP
#define S3_MOUNT_LOGGING_EVENT_LOG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace s3_mount::fs
{
    class error;
} // s3_mount::fs

namespace s3_mount::logging
{

    inline constexpr const char* EVENT_SCHEMA_VERSION = "1";

    // Builds the "fs-error" event for an error returned by a filesystem operation.
    // Metadata fields are only present when the error carries them.
    nlohmann::json make_fs_error_event(const fs::error& _error,
                                       const std::string& _operation,
                                       std::uint64_t _request_id);

    // Builds the "fs-unsupported" event for an operation the filesystem does not implement.
    nlohmann::json make_unsupported_event(const std::string& _operation, std::uint64_t _request_id);

    // Emits the event at the level carried by the error.
    void log_fs_error_event(const fs::error& _error, const std::string& _operation, std::uint64_t _request_id);

    void log_unsupported_event(const std::string& _operation, std::uint64_t _request_id);

} // s3_mount::logging

#endif // S3_MOUNT_LOGGING_EVENT_LOG_HPP
