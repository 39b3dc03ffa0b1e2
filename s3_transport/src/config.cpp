#include "s3_mount/s3_transport/config.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace s3_mount::s3_transport
{

    namespace
    {
        bool is_virtual_host_style(const std::string& _style)
        {
            return boost::iequals(_style, "virtual") ||
                   boost::iequals(_style, "host") ||
                   boost::iequals(_style, "virtualhost");
        }
    } // namespace

    config config::from_json(const nlohmann::json& _json)
    {
        config cfg;

        if (!_json.is_object()) {
            throw std::invalid_argument{"s3 configuration must be a JSON object"};
        }

        cfg.hostname             = _json.value("hostname", cfg.hostname);
        cfg.region_name          = _json.value("region_name", cfg.region_name);
        cfg.access_key           = _json.value("access_key", cfg.access_key);
        cfg.secret_access_key    = _json.value("secret_access_key", cfg.secret_access_key);
        cfg.s3_protocol_str      = _json.value("protocol", cfg.s3_protocol_str);
        cfg.s3_sts_date_str      = _json.value("sts_date", cfg.s3_sts_date_str);
        cfg.s3_uri_request_style = _json.value("uri_request_style", cfg.s3_uri_request_style);
        cfg.part_size            = _json.value("part_size", cfg.part_size);
        cfg.retry_count_limit    = _json.value("retry_count_limit", cfg.retry_count_limit);
        cfg.retry_wait_seconds   = _json.value("retry_wait_seconds", cfg.retry_wait_seconds);
        cfg.max_retry_wait_seconds = _json.value("max_retry_wait_seconds", cfg.max_retry_wait_seconds);
        cfg.server_encrypt_flag  = _json.value("server_side_encryption", cfg.server_encrypt_flag);
        cfg.non_data_transfer_timeout_seconds =
            _json.value("non_data_transfer_timeout_seconds", cfg.non_data_transfer_timeout_seconds);
        cfg.part_transfer_timeout_seconds =
            _json.value("part_transfer_timeout_seconds", cfg.part_transfer_timeout_seconds);

        if (cfg.part_size < constants::MINIMUM_PART_SIZE || cfg.part_size > constants::MAXIMUM_PART_SIZE) {
            throw std::invalid_argument{fmt::format("part_size must be between {} and {} bytes [part_size={}]",
                    constants::MINIMUM_PART_SIZE, constants::MAXIMUM_PART_SIZE, cfg.part_size)};
        }

        if (cfg.retry_wait_seconds < 0 || cfg.max_retry_wait_seconds < cfg.retry_wait_seconds) {
            throw std::invalid_argument{fmt::format("invalid retry wait [retry_wait_seconds={}][max_retry_wait_seconds={}]",
                    cfg.retry_wait_seconds, cfg.max_retry_wait_seconds)};
        }

        // validate the enumerated strings up front rather than on first use
        to_protocol(cfg);
        to_sts_date(cfg);
        to_uri_style(cfg);

        return cfg;
    } // config::from_json

    S3Protocol to_protocol(const config& _config)
    {
        if (boost::iequals(_config.s3_protocol_str, "http")) {
            return S3ProtocolHTTP;
        }

        if (boost::iequals(_config.s3_protocol_str, "https")) {
            return S3ProtocolHTTPS;
        }

        throw std::invalid_argument{fmt::format("unknown protocol [{}]", _config.s3_protocol_str)};
    }

    S3STSDate to_sts_date(const config& _config)
    {
        if (boost::iequals(_config.s3_sts_date_str, "amz")) {
            return S3STSAmzOnly;
        }

        if (boost::iequals(_config.s3_sts_date_str, "both")) {
            return S3STSAmzAndDate;
        }

        if (boost::iequals(_config.s3_sts_date_str, "date")) {
            return S3STSDateOnly;
        }

        throw std::invalid_argument{fmt::format("unknown sts date style [{}]", _config.s3_sts_date_str)};
    }

    S3UriStyle to_uri_style(const config& _config)
    {
        if (is_virtual_host_style(_config.s3_uri_request_style)) {
            return S3UriStyleVirtualHost;
        }

        if (boost::iequals(_config.s3_uri_request_style, "path")) {
            return S3UriStylePath;
        }

        throw std::invalid_argument{fmt::format("unknown uri request style [{}]", _config.s3_uri_request_style)};
    }

} // s3_mount::s3_transport
