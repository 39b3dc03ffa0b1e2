#ifndef S3_MOUNT_S3_TRANSPORT_TYPES_HPP
#define S3_MOUNT_S3_TRANSPORT_TYPES_HPP

#include <libs3.h>

#include <cstdint>
#include <limits>

namespace s3_mount::s3_transport
{

    struct libs3_types
    {
        using status = S3Status;
        const static status status_ok = status::S3StatusOK;
        const static status status_request_timeout = status::S3StatusErrorRequestTimeout;
        using bucket_context = S3BucketContext;
        using char_type   = char;
        using buffer_type = char_type*;
        using error_details = S3ErrorDetails;
        using response_properties = S3ResponseProperties;
    };

    struct constants
    {
        static constexpr std::int64_t  MAXIMUM_NUMBER_OF_PARTS{10000};
        static constexpr std::uint64_t MINIMUM_PART_SIZE{5 * 1024 * 1024};
        static constexpr std::uint64_t DEFAULT_PART_SIZE{8 * 1024 * 1024};

        // libs3 takes the part length as an int
        static constexpr std::uint64_t MAXIMUM_PART_SIZE{std::numeric_limits<int>::max()};
    };

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_TYPES_HPP
