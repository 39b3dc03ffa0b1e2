#include "s3_mount/s3_transport/s3_object_client.hpp"
#include "s3_mount/s3_transport/callbacks.hpp"
#include "s3_mount/s3_transport/logging_category.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace s3_mount::s3_transport
{

    namespace
    {
        namespace log = irods::experimental::log;
        using logger  = log::logger<s3_transport_logging_category>;
    } // namespace

    s3_put_object_request::s3_put_object_request(const config& _config,
                                                 const std::string& _bucket,
                                                 const std::string& _key,
                                                 const put_object_params& _params)
        : config_{_config}
        , bucket_name_{_bucket}
        , object_key_{_key}
        , content_type_{_params.content_type}
        , bucket_context_{}
        , upload_id_{}
        , part_buffer_{}
        , etags_{}
        , bytes_accepted_{0}
        , finished_{false}
    {
        bucket_context_.hostName        = config_.hostname.c_str();
        bucket_context_.bucketName      = bucket_name_.c_str();
        bucket_context_.protocol        = to_protocol(config_);
        bucket_context_.uriStyle        = to_uri_style(config_);
        bucket_context_.accessKeyId     = config_.access_key.c_str();
        bucket_context_.secretAccessKey = config_.secret_access_key.c_str();
        bucket_context_.securityToken   = nullptr;
        bucket_context_.stsDate         = to_sts_date(config_);
        bucket_context_.authRegion      = config_.region_name.c_str();

        part_buffer_.reserve(config_.part_size);

        if (const auto ret = initialize_libs3(config_.hostname); !ret.ok()) {
            throw object_client_error{"InitializationFailed", ret.result()};
        }

        S3PutProperties put_props{};
        put_props.contentType = content_type_ ? content_type_->c_str() : nullptr;
        put_props.md5 = nullptr;
        put_props.expires = -1;
        put_props.useServerSideEncryption = _params.server_side_encryption || config_.server_encrypt_flag;

        S3MultipartInitialHandler mpu_initial_handler
            = { { s3_multipart_upload::initialization_callback::on_response_properties,
                  s3_multipart_upload::initialization_callback::on_response_complete },
                s3_multipart_upload::initialization_callback::on_response };

        s3_multipart_upload::initialization_callback::data initiate{bucket_context_};

        logger::debug("{}:{} ({}) [[{}]] Multipart:  Initiating key \"{}\" in bucket \"{}\"",
                __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, bucket_name_);

        const auto status = with_retries("S3_initiate_multipart", [&] {
            initiate.upload_id.clear();
            S3_initiate_multipart(&bucket_context_, object_key_.c_str(),
                    &put_props, &mpu_initial_handler, nullptr,
                    config_.non_data_transfer_timeout_seconds * 1000,   // timeout (ms)
                    &initiate);
            return initiate.result;
        });

        if (status.status != libs3_types::status_ok) {
            deinitialize_libs3();
            throw make_error("S3_initiate_multipart", status);
        }

        if (initiate.upload_id.empty()) {
            deinitialize_libs3();
            throw object_client_error{"InternalError",
                fmt::format("S3_initiate_multipart returned an empty upload id [object_key={}]", object_key_)};
        }

        upload_id_ = std::move(initiate.upload_id);
    } // s3_put_object_request::s3_put_object_request

    s3_put_object_request::~s3_put_object_request()
    {
        if (!finished_) {
            try {
                abort();
            }
            catch (const std::exception& e) {
                logger::error("{}:{} ({}) [[{}]] Failed to abort the multipart upload of \"{}\" [{}]",
                        __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, e.what());
            }
        }

        deinitialize_libs3();
    } // s3_put_object_request::~s3_put_object_request

    void s3_put_object_request::write(const char* _buffer, std::size_t _size)
    {
        if (finished_) {
            throw object_client_error{"RequestFinished",
                fmt::format("write on a finished upload [object_key={}]", object_key_)};
        }

        std::size_t consumed = 0;
        while (consumed < _size) {

            const auto room  = static_cast<std::size_t>(config_.part_size) - part_buffer_.size();
            const auto count = std::min(room, _size - consumed);

            part_buffer_.insert(part_buffer_.end(), _buffer + consumed, _buffer + consumed + count);
            consumed += count;

            if (part_buffer_.size() == config_.part_size) {
                upload_part(part_buffer_.data(), part_buffer_.size());
                part_buffer_.clear();
            }
        }

        bytes_accepted_ += _size;
    } // s3_put_object_request::write

    put_object_result s3_put_object_request::complete()
    {
        if (finished_) {
            throw object_client_error{"RequestFinished",
                fmt::format("complete on a finished upload [object_key={}]", object_key_)};
        }

        // The last part may be smaller than the part size.  An empty object still needs one part.
        if (!part_buffer_.empty() || etags_.empty()) {
            upload_part(part_buffer_.data(), part_buffer_.size());
            part_buffer_.clear();
        }

        logger::debug("{}:{} ({}) [[{}]] Multipart:  Completing key \"{}\" Upload ID \"{}\"",
                __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, upload_id_);

        auto xml = fmt::format("<CompleteMultipartUpload>\n");
        for (std::size_t i = 0; i < etags_.size(); ++i) {
            xml += fmt::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>\n", i + 1, etags_[i]);
        }
        xml += fmt::format("</CompleteMultipartUpload>\n");

        logger::debug("{}:{} ({}) [[{}]] [key={}] Request: {}",
                __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, xml);

        S3MultipartCommitHandler commit_handler
            = { { s3_multipart_upload::commit_callback::on_response_properties,
                  s3_multipart_upload::commit_callback::on_response_completion },
                s3_multipart_upload::commit_callback::on_response,
                s3_multipart_upload::commit_callback::on_response_xml };

        s3_multipart_upload::commit_callback::data commit{bucket_context_, xml};

        const auto status = with_retries("S3_complete_multipart_upload", [&] {
            // On partial error, need to restart XML send from the beginning
            commit.remaining = static_cast<std::int64_t>(xml.size());
            commit.offset = 0;
            S3_complete_multipart_upload(&bucket_context_,
                    object_key_.c_str(),
                    &commit_handler,
                    upload_id_.c_str(),
                    static_cast<int>(commit.remaining),
                    nullptr,
                    config_.non_data_transfer_timeout_seconds * 1000,   // timeout (ms)
                    &commit);
            return commit.result;
        });

        // Treating a timeout as a success because under load we sometimes get a timeout
        // but the multipart completes later.
        if (status.status != libs3_types::status_ok && status.status != libs3_types::status_request_timeout) {
            throw make_error("S3_complete_multipart_upload", status);
        }

        finished_ = true;

        logger::debug("{}:{} ({}) [[{}]] Multipart:  Completed key \"{}\" [parts={}][size={}]",
                __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, etags_.size(), bytes_accepted_);

        return put_object_result{commit.etag, bytes_accepted_};
    } // s3_put_object_request::complete

    template <typename Function>
    request_status s3_put_object_request::with_retries(const char* _operation, Function _attempt)
    {
        int retry_wait_seconds = config_.retry_wait_seconds;
        unsigned int retry_cnt = 0;

        request_status result = _attempt();

        while (result.status != libs3_types::status_ok &&
               s3_status_is_retryable(result.status) &&
               retry_cnt < config_.retry_count_limit) {

            ++retry_cnt;

            logger::error("{}:{} ({}) [[{}]] {} returned error [status={}][object_key={}][attempt={}][retry_count_limit={}].  "
                    "Sleeping between {} and {} seconds",
                    __FILE__, __LINE__, __func__, get_thread_identifier(), _operation,
                    S3_get_status_name(result.status), object_key_, retry_cnt, config_.retry_count_limit,
                    retry_wait_seconds >> 1, retry_wait_seconds);

            s3_sleep(retry_wait_seconds);
            retry_wait_seconds *= 2;
            if (retry_wait_seconds > config_.max_retry_wait_seconds) {
                retry_wait_seconds = config_.max_retry_wait_seconds;
            }

            result = _attempt();
        }

        return result;
    } // s3_put_object_request::with_retries

    void s3_put_object_request::upload_part(const char* _buffer, std::size_t _size)
    {
        if (etags_.size() >= static_cast<std::size_t>(constants::MAXIMUM_NUMBER_OF_PARTS)) {
            throw object_client_error{"TooManyParts",
                fmt::format("upload exceeded {} parts [object_key={}]", constants::MAXIMUM_NUMBER_OF_PARTS, object_key_)};
        }

        const int part_number = static_cast<int>(etags_.size()) + 1;

        S3PutObjectHandler put_object_handler = {
            {
                s3_multipart_upload::part_callback::on_response_properties,
                s3_multipart_upload::part_callback::on_response_completion
            },
            s3_multipart_upload::part_callback::on_data
        };

        S3PutProperties put_props{};
        put_props.md5 = nullptr;
        put_props.expires = -1;

        // server encrypt flag not valid for part upload
        put_props.useServerSideEncryption = false;

        s3_multipart_upload::part_callback::data part{bucket_context_, _buffer, static_cast<std::int64_t>(_size)};

        logger::debug("{}:{} ({}) [[{}]] Multipart:  Start part {}, key \"{}\", uploadid \"{}\", len {}",
                __FILE__, __LINE__, __func__, get_thread_identifier(), part_number, object_key_, upload_id_, _size);

        const auto status = with_retries("S3_upload_part", [&] {
            // zero out bytes_written in case of failure and re-run
            part.bytes_written = 0;
            part.etag.clear();
            S3_upload_part(&bucket_context_, object_key_.c_str(), &put_props,
                    &put_object_handler, part_number, upload_id_.c_str(),
                    static_cast<int>(_size), nullptr,
                    config_.part_transfer_timeout_seconds * 1000,   // timeout (ms)
                    &part);
            return part.result;
        });

        if (status.status != libs3_types::status_ok) {
            throw make_error("S3_upload_part", status);
        }

        etags_.push_back(std::move(part.etag));
    } // s3_put_object_request::upload_part

    void s3_put_object_request::abort()
    {
        finished_ = true;

        logger::debug("{}:{} ({}) [[{}]] Multipart:  Aborting key \"{}\" Upload ID \"{}\"",
                __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, upload_id_);

        S3AbortMultipartUploadHandler abort_handler
            = { { s3_multipart_upload::cancel_callback::on_response_properties,
                  s3_multipart_upload::cancel_callback::on_response_completion } };

        s3_multipart_upload::cancel_callback::g_response_completion_result = request_status{};
        s3_multipart_upload::cancel_callback::g_response_completion_saved_bucket_context = &bucket_context_;

        S3_abort_multipart_upload(&bucket_context_, object_key_.c_str(),
                upload_id_.c_str(), config_.non_data_transfer_timeout_seconds * 1000, &abort_handler);

        const auto status = s3_multipart_upload::cancel_callback::g_response_completion_result.status;
        if (status != libs3_types::status_ok) {
            logger::error("{}:{} ({}) [[{}]] Error cancelling the multipart upload of S3 object: \"{}\" - \"{}\"",
                    __FILE__, __LINE__, __func__, get_thread_identifier(), object_key_, S3_get_status_name(status));
        }
    } // s3_put_object_request::abort

    object_client_error s3_put_object_request::make_error(const char* _operation, const request_status& _status) const
    {
        const std::string status_name = S3_get_status_name(_status.status);
        return object_client_error{status_name,
            fmt::format("{} failed [bucket={}][object_key={}][status={}]", _operation, bucket_name_, object_key_, status_name),
            _status.meta};
    } // s3_put_object_request::make_error

    s3_object_client::s3_object_client(const config& _config)
        : config_{_config}
    {
        if (config_.part_size < constants::MINIMUM_PART_SIZE || config_.part_size > constants::MAXIMUM_PART_SIZE) {
            throw std::invalid_argument{fmt::format("part_size must be between {} and {} bytes [part_size={}]",
                    constants::MINIMUM_PART_SIZE, constants::MAXIMUM_PART_SIZE, config_.part_size)};
        }

        if (const auto ret = initialize_libs3(config_.hostname); !ret.ok()) {
            throw object_client_error{"InitializationFailed", ret.result()};
        }
    }

    s3_object_client::~s3_object_client()
    {
        deinitialize_libs3();
    }

    std::unique_ptr<put_object_request> s3_object_client::put_object(const std::string& _bucket,
                                                                     const std::string& _key,
                                                                     const put_object_params& _params)
    {
        return std::make_unique<s3_put_object_request>(config_, _bucket, _key, _params);
    }

} // s3_mount::s3_transport
