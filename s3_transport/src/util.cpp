#include "s3_mount/s3_transport/util.hpp"
#include "s3_mount/s3_transport/logging_category.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <chrono>
#include <cstring>
#include <functional>
#include <mutex>
#include <random>
#include <thread>

namespace s3_mount::s3_transport
{

    namespace
    {
        namespace log = irods::experimental::log;
        using logger  = log::logger<s3_transport_logging_category>;

        int        libs3_initialized_counter = 0;
        std::mutex libs3_initialized_counter_mutex;
    } // namespace

    void store_and_log_status(libs3_types::status status,
                              const libs3_types::error_details *error,
                              const std::string& function,
                              const libs3_types::bucket_context& saved_bucket_context,
                              request_status& result)
    {
        const auto thread_id = get_thread_identifier();

        result.status = status;
        result.meta = client_error_meta{http_status_from_s3_status(status), error_code_from_s3_status(status), std::nullopt};

        if (error && error->message) {
            result.meta.error_message = error->message;
        }

        const bool is_failure = status != libs3_types::status_ok && status != S3StatusHttpErrorNotFound;

        const auto log_message = [is_failure](const std::string& _msg) {
            if (is_failure) {
                logger::error("{}", _msg);
            }
            else {
                logger::debug("{}", _msg);
            }
        };

        log_message(fmt::format("{}:{} [{}] [[{}]]  libs3_types::status: [{}] - {}",
                __FILE__, __LINE__, __func__, thread_id, S3_get_status_name(status), status));

        if (saved_bucket_context.hostName) {
            log_message(fmt::format("{}:{} [{}] [[{}]]  S3Host: {}",
                    __FILE__, __LINE__, __func__, thread_id, saved_bucket_context.hostName));
        }

        log_message(fmt::format("{}:{} [{}] [[{}]]  Function: {}",
                __FILE__, __LINE__, __func__, thread_id, function));

        if (error) {

            if (error->message) {
                log_message(fmt::format("{}:{} [{}] [[{}]]  Message: {}",
                        __FILE__, __LINE__, __func__, thread_id, error->message));
            }
            if (error->resource) {
                log_message(fmt::format("{}:{} [{}] [[{}]]  Resource: {}",
                        __FILE__, __LINE__, __func__, thread_id, error->resource));
            }
            if (error->furtherDetails) {
                log_message(fmt::format("{}:{} [{}] [[{}]]  Further Details: {}",
                        __FILE__, __LINE__, __func__, thread_id, error->furtherDetails));
            }
            for (int i = 0; i < error->extraDetailsCount; i++) {
                log_message(fmt::format("{}:{} [{}] [[{}]]    {}: {}",
                        __FILE__, __LINE__, __func__, thread_id, error->extraDetails[i].name,
                        error->extraDetails[i].value));
            }
        }
    } // end store_and_log_status

    std::optional<int> http_status_from_s3_status(libs3_types::status _status)
    {
        switch (_status) {
            case S3StatusHttpErrorMovedTemporarily:
                return 307;

            case S3StatusErrorEntityTooLarge:
            case S3StatusErrorInvalidBucketName:
            case S3StatusErrorRequestTimeout:
            case S3StatusHttpErrorBadRequest:
                return 400;

            case S3StatusErrorAccessDenied:
            case S3StatusErrorInvalidAccessKeyId:
            case S3StatusErrorSignatureDoesNotMatch:
            case S3StatusHttpErrorForbidden:
                return 403;

            case S3StatusErrorNoSuchBucket:
            case S3StatusErrorNoSuchKey:
            case S3StatusErrorNoSuchUpload:
            case S3StatusHttpErrorNotFound:
                return 404;

            case S3StatusErrorMethodNotAllowed:
                return 405;

            case S3StatusErrorBucketAlreadyExists:
            case S3StatusHttpErrorConflict:
                return 409;

            case S3StatusErrorPreconditionFailed:
                return 412;

            case S3StatusErrorInternalError:
                return 500;

            case S3StatusErrorNotImplemented:
                return 501;

            case S3StatusErrorServiceUnavailable:
            case S3StatusErrorSlowDown:
                return 503;

            default:
                return std::nullopt;
        }
    } // end http_status_from_s3_status

    std::optional<std::string> error_code_from_s3_status(libs3_types::status _status)
    {
        // libs3 names service errors "Error<Code>", e.g. "ErrorAccessDenied".
        static constexpr const char* prefix = "Error";
        static const auto prefix_length = std::strlen(prefix);

        if (_status == S3StatusErrorUnknown) {
            return std::nullopt;
        }

        const std::string name = S3_get_status_name(_status);
        if (name.size() <= prefix_length || name.compare(0, prefix_length, prefix) != 0) {
            return std::nullopt;
        }

        return name.substr(prefix_length);
    } // end error_code_from_s3_status

    bool s3_status_is_retryable(libs3_types::status _status)
    {
        return ::S3_status_is_retryable(_status) || S3StatusErrorUnknown == _status;
    }

    void s3_sleep(int _s)
    {
        std::random_device r;
        std::default_random_engine e1(r());
        std::uniform_int_distribution<int> uniform_dist(0, RAND_MAX);
        int random = uniform_dist(e1);
        int sleep_time = static_cast<int>(((static_cast<double>(random) / RAND_MAX) + 1) * .5 * _s); // sleep between _s/2 and _s
        std::this_thread::sleep_for(std::chrono::seconds(sleep_time));
    }

    std::uint64_t get_thread_identifier()
    {
        return std::hash<std::thread::id>{}(std::this_thread::get_id());
    }

    irods::error initialize_libs3(const std::string& _hostname)
    {
        std::lock_guard<std::mutex> lock(libs3_initialized_counter_mutex);

        if (libs3_initialized_counter == 0) {

            int flags = S3_INIT_ALL;
            const auto status = S3_initialize("s3_mount", flags, _hostname.c_str());
            if (status != libs3_types::status_ok) {
                const auto msg = fmt::format("S3_initialize returned error [status={}]", S3_get_status_name(status));
                logger::error("{}:{} ({}) {}", __FILE__, __LINE__, __func__, msg);
                return ERROR(S3_INIT_ERROR, msg);
            }
        }

        ++libs3_initialized_counter;
        return SUCCESS();
    } // end initialize_libs3

    void deinitialize_libs3()
    {
        std::lock_guard<std::mutex> lock(libs3_initialized_counter_mutex);

        if (libs3_initialized_counter > 0 && --libs3_initialized_counter == 0) {
            S3_deinitialize();
        }
    }

} // s3_mount::s3_transport
