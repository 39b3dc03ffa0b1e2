#ifndef S3_MOUNT_FS_ERROR_METADATA_HPP
#define S3_MOUNT_FS_ERROR_METADATA_HPP

#include "s3_mount/s3_transport/object_client.hpp"

#include <optional>
#include <string>

namespace s3_mount::fs
{

    // Error code reported for errors that do not carry one.
    inline constexpr const char* ERROR_CODE_INTERNAL = "internal_error";

    // Error code reported for operations the filesystem does not implement.
    inline constexpr const char* ERROR_CODE_UNSUPPORTED = "unsupported_operation";

    // Diagnostic context attached to an error.  All fields are optional and filled in by
    // whichever layer knows them.
    struct error_metadata
    {
        std::optional<std::string>       error_code;
        std::optional<std::string>       s3_object_key;
        std::optional<std::string>       s3_bucket_name;
        s3_transport::client_error_meta  client_error_meta;

        // Fills fields that are absent here from _other.  Fields already present are kept.
        error_metadata& merge(const error_metadata& _other);

        bool empty() const noexcept;
    };

} // s3_mount::fs

#endif // S3_MOUNT_FS_ERROR_METADATA_HPP
