#ifndef S3_MOUNT_UPLOAD_UPLOAD_ERROR_HPP
#define S3_MOUNT_UPLOAD_UPLOAD_ERROR_HPP

#include "s3_mount/fs/errno_classifier.hpp"
#include "s3_mount/fs/error_metadata.hpp"
#include "s3_mount/s3_transport/object_client.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace s3_mount::upload
{

    enum class upload_error_kind
    {
        PUT_REQUEST_FAILED,
        OUT_OF_ORDER_WRITE,
        PUT_REQUEST_ALREADY_COMPLETED,
        PUT_REQUEST_PREVIOUSLY_FAILED,
        OBJECT_TOO_BIG
    };

    // Failure of an upload_request operation.
    class upload_error : public std::runtime_error, public fs::errno_classifier
    {
    public:

        static upload_error put_request_failed(const s3_transport::object_client_error& _cause,
                                               fs::error_metadata _metadata = {});

        // Covers any other exception raised by the client while a request was in flight.
        static upload_error put_request_failed(std::exception_ptr _cause,
                                               fs::error_metadata _metadata = {});

        static upload_error out_of_order_write(std::int64_t _write_offset,
                                               std::uint64_t _expected_offset,
                                               fs::error_metadata _metadata = {});

        static upload_error already_completed(fs::error_metadata _metadata = {});

        static upload_error previously_failed(fs::error_metadata _metadata = {});

        static upload_error object_too_big(std::uint64_t _maximum_size,
                                           fs::error_metadata _metadata = {});

        int to_errno() const noexcept override;

        upload_error_kind kind() const noexcept
        {
            return kind_;
        }

        // The client error that caused a PUT_REQUEST_FAILED error, null otherwise.
        std::exception_ptr source() const noexcept
        {
            return source_;
        }

        const fs::error_metadata& meta() const noexcept
        {
            return metadata_;
        }

        // Set for OUT_OF_ORDER_WRITE.
        std::optional<std::int64_t> write_offset() const noexcept
        {
            return write_offset_;
        }

        // Set for OUT_OF_ORDER_WRITE.
        std::optional<std::uint64_t> expected_offset() const noexcept
        {
            return expected_offset_;
        }

        // Set for OBJECT_TOO_BIG.
        std::optional<std::uint64_t> maximum_size() const noexcept
        {
            return maximum_size_;
        }

    private:

        upload_error(upload_error_kind _kind, const std::string& _message, fs::error_metadata _metadata);

        upload_error_kind             kind_;
        std::exception_ptr            source_;
        fs::error_metadata            metadata_;
        std::optional<std::int64_t>   write_offset_;
        std::optional<std::uint64_t>  expected_offset_;
        std::optional<std::uint64_t>  maximum_size_;

    }; // class upload_error

} // s3_mount::upload

#endif // S3_MOUNT_UPLOAD_UPLOAD_ERROR_HPP
