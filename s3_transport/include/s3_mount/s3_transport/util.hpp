#ifndef S3_MOUNT_S3_TRANSPORT_UTIL_HPP
#define S3_MOUNT_S3_TRANSPORT_UTIL_HPP

#include "s3_mount/s3_transport/object_client.hpp"
#include "s3_mount/s3_transport/types.hpp"

#include <irods/irods_error.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace s3_mount::s3_transport
{

    // Outcome of a single libs3 request as reported to its completion callback.
    struct request_status
    {
        libs3_types::status status{S3StatusInternalError};
        client_error_meta   meta;
    };

    void store_and_log_status(libs3_types::status status,
                              const libs3_types::error_details *error,
                              const std::string& function,
                              const libs3_types::bucket_context& saved_bucket_context,
                              request_status& result);

    // HTTP status code that produced a libs3 status, if the status came from a response.
    std::optional<int> http_status_from_s3_status(libs3_types::status _status);

    // The S3 error code for a service error (e.g. "AccessDenied"), if the status is one.
    std::optional<std::string> error_code_from_s3_status(libs3_types::status _status);

    bool s3_status_is_retryable(libs3_types::status _status);

    // Sleep between _s / 2 and _s seconds.
    // The random addition ensures that threads don't all cluster up and retry
    // at the same time (dogpile effect)
    void s3_sleep(int _s);

    std::uint64_t get_thread_identifier();

    // libs3 must be initialized once per process before use.  The first caller initializes
    // and the matching last call to deinitialize_libs3() tears down.
    irods::error initialize_libs3(const std::string& _hostname);
    void deinitialize_libs3();

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_UTIL_HPP
