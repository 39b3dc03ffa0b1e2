#include "s3_mount/logging/event_log.hpp"
#include "s3_mount/logging_category.hpp"
#include "s3_mount/fs/error.hpp"

#include <irods/irods_logger.hpp>

#include <optional>

namespace s3_mount::logging
{

    namespace
    {
        namespace log = irods::experimental::log;
        using logger  = log::logger<fs_event_logging_category>;

        template <typename T>
        void set_if_present(nlohmann::json& _event, const char* _name, const std::optional<T>& _value)
        {
            if (_value) {
                _event[_name] = *_value;
            }
        }

        void emit(log::level _level, const nlohmann::json& _event)
        {
            const auto message = _event.dump();

            switch (_level) {
                case log::level::trace:    logger::trace("{}", message);    break;
                case log::level::debug:    logger::debug("{}", message);    break;
                case log::level::info:     logger::info("{}", message);     break;
                case log::level::warn:     logger::warn("{}", message);     break;
                case log::level::error:    logger::error("{}", message);    break;
                case log::level::critical: logger::critical("{}", message); break;
            }
        }
    } // namespace

    nlohmann::json make_fs_error_event(const fs::error& _error,
                                       const std::string& _operation,
                                       std::uint64_t _request_id)
    {
        const auto& meta = _error.meta();

        nlohmann::json event{
            {"event", "fs-error"},
            {"version", EVENT_SCHEMA_VERSION},
            {"operation", _operation},
            {"request_id", _request_id},
            {"error_code", meta.error_code.value_or(fs::ERROR_CODE_INTERNAL)},
            {"errno", _error.to_errno()},
            {"internal_message", _error.what()}
        };

        set_if_present(event, "s3_object_key", meta.s3_object_key);
        set_if_present(event, "s3_bucket_name", meta.s3_bucket_name);
        set_if_present(event, "s3_error_http_status", meta.client_error_meta.http_code);
        set_if_present(event, "s3_error_code", meta.client_error_meta.error_code);
        set_if_present(event, "s3_error_message", meta.client_error_meta.error_message);

        return event;
    }

    nlohmann::json make_unsupported_event(const std::string& _operation, std::uint64_t _request_id)
    {
        return {
            {"event", "fs-unsupported"},
            {"version", EVENT_SCHEMA_VERSION},
            {"operation", _operation},
            {"request_id", _request_id},
            {"error_code", fs::ERROR_CODE_UNSUPPORTED}
        };
    }

    void log_fs_error_event(const fs::error& _error, const std::string& _operation, std::uint64_t _request_id)
    {
        emit(_error.level(), make_fs_error_event(_error, _operation, _request_id));
    }

    void log_unsupported_event(const std::string& _operation, std::uint64_t _request_id)
    {
        emit(log::level::info, make_unsupported_event(_operation, _request_id));
    }

} // s3_mount::logging
