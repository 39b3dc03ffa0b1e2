#ifndef S3_MOUNT_S3_TRANSPORT_CONFIG_HPP
#define S3_MOUNT_S3_TRANSPORT_CONFIG_HPP

#include "s3_mount/s3_transport/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace s3_mount::s3_transport
{

    struct config
    {

        config()
            : hostname{"s3.amazonaws.com"}
            , region_name{"us-east-1"}
            , access_key{""}
            , secret_access_key{""}
            , s3_protocol_str{"https"}
            , s3_sts_date_str{"amz"}
            , s3_uri_request_style{"path"}
            , part_size{constants::DEFAULT_PART_SIZE}
            , retry_count_limit{3}
            , retry_wait_seconds{3}
            , max_retry_wait_seconds{30}
            , server_encrypt_flag{false}
            , non_data_transfer_timeout_seconds{300}
            , part_transfer_timeout_seconds{120}
        {}

        // Reads a configuration object.  Missing keys keep their defaults.
        //
        // Throws std::invalid_argument if a value is out of range or an enumerated
        // string is not recognized.
        static config from_json(const nlohmann::json& _json);

        std::string   hostname;
        std::string   region_name;
        std::string   access_key;
        std::string   secret_access_key;
        std::string   s3_protocol_str;       // "http" or "https"
        std::string   s3_sts_date_str;       // "amz", "date" or "both"
        std::string   s3_uri_request_style;  // "path", or "virtual" / "host" / "virtualhost"
        std::uint64_t part_size;
        unsigned int  retry_count_limit;
        int           retry_wait_seconds;
        int           max_retry_wait_seconds;
        bool          server_encrypt_flag;
        unsigned int  non_data_transfer_timeout_seconds;
        unsigned int  part_transfer_timeout_seconds;
    };

    S3Protocol to_protocol(const config& _config);
    S3STSDate to_sts_date(const config& _config);
    S3UriStyle to_uri_style(const config& _config);

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_CONFIG_HPP
