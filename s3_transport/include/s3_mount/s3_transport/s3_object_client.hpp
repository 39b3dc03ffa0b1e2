#ifndef S3_MOUNT_S3_TRANSPORT_S3_OBJECT_CLIENT_HPP
#define S3_MOUNT_S3_TRANSPORT_S3_OBJECT_CLIENT_HPP

#include "s3_mount/s3_transport/config.hpp"
#include "s3_mount/s3_transport/object_client.hpp"
#include "s3_mount/s3_transport/types.hpp"
#include "s3_mount/s3_transport/util.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3_mount::s3_transport
{

    // Streams an object to S3 as a multipart upload.  Parts are sent synchronously from
    // write() once a full part has been buffered, and the remainder is sent as the last part
    // by complete().
    //
    // A request that is destroyed before complete() succeeds aborts the multipart upload so
    // that no partial object becomes visible.
    class s3_put_object_request : public put_object_request
    {
    public:

        // Initiates the multipart upload.  Throws object_client_error on failure.
        s3_put_object_request(const config& _config,
                              const std::string& _bucket,
                              const std::string& _key,
                              const put_object_params& _params);

        s3_put_object_request(const s3_put_object_request&) = delete;
        auto operator=(const s3_put_object_request&) -> s3_put_object_request& = delete;

        ~s3_put_object_request() override;

        void write(const char* _buffer, std::size_t _size) override;

        put_object_result complete() override;

    private:

        // Runs _attempt until it succeeds, fails with a non-retryable status or the retry
        // limit is reached.  Returns the status of the last attempt.
        template <typename Function>
        request_status with_retries(const char* _operation, Function _attempt);

        void upload_part(const char* _buffer, std::size_t _size);
        void abort();

        object_client_error make_error(const char* _operation, const request_status& _status) const;

        config                       config_;
        std::string                  bucket_name_;
        std::string                  object_key_;
        std::optional<std::string>   content_type_;
        libs3_types::bucket_context  bucket_context_;

        std::string                  upload_id_;
        std::vector<char>            part_buffer_;
        std::vector<std::string>     etags_;
        std::uint64_t                bytes_accepted_;

        // set once the upload has been completed or aborted
        bool                         finished_;

    }; // class s3_put_object_request

    class s3_object_client : public object_client
    {
    public:

        // Initializes libs3 for this process if needed.  Throws object_client_error if
        // initialization fails.
        explicit s3_object_client(const config& _config);

        s3_object_client(const s3_object_client&) = delete;
        auto operator=(const s3_object_client&) -> s3_object_client& = delete;

        ~s3_object_client() override;

        std::unique_ptr<put_object_request> put_object(const std::string& _bucket,
                                                       const std::string& _key,
                                                       const put_object_params& _params) override;

        std::uint64_t part_size() const noexcept override
        {
            return config_.part_size;
        }

    private:

        config config_;

    }; // class s3_object_client

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_S3_OBJECT_CLIENT_HPP
