#include "s3_mount/upload/upload_error.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <utility>

namespace s3_mount::upload
{

    upload_error::upload_error(upload_error_kind _kind, const std::string& _message, fs::error_metadata _metadata)
        : std::runtime_error{_message}
        , kind_{_kind}
        , source_{}
        , metadata_{std::move(_metadata)}
        , write_offset_{}
        , expected_offset_{}
        , maximum_size_{}
    {
    }

    upload_error upload_error::put_request_failed(const s3_transport::object_client_error& _cause,
                                                  fs::error_metadata _metadata)
    {
        // the client's own report takes precedence over whatever the caller knew
        fs::error_metadata client_metadata;
        client_metadata.client_error_meta = _cause.meta();
        client_metadata.error_code = _cause.meta().error_code;

        fs::error_metadata metadata = std::move(client_metadata);
        metadata.merge(_metadata);

        upload_error error{upload_error_kind::PUT_REQUEST_FAILED, "put request failed", std::move(metadata)};
        error.source_ = std::make_exception_ptr(_cause);
        return error;
    }

    upload_error upload_error::put_request_failed(std::exception_ptr _cause,
                                                  fs::error_metadata _metadata)
    {
        upload_error error{upload_error_kind::PUT_REQUEST_FAILED, "put request failed", std::move(_metadata)};
        error.source_ = std::move(_cause);
        return error;
    }

    upload_error upload_error::out_of_order_write(std::int64_t _write_offset,
                                                  std::uint64_t _expected_offset,
                                                  fs::error_metadata _metadata)
    {
        upload_error error{upload_error_kind::OUT_OF_ORDER_WRITE,
            fmt::format("out of order write; expected offset {} but got {}", _expected_offset, _write_offset),
            std::move(_metadata)};
        error.write_offset_ = _write_offset;
        error.expected_offset_ = _expected_offset;
        return error;
    }

    upload_error upload_error::already_completed(fs::error_metadata _metadata)
    {
        return {upload_error_kind::PUT_REQUEST_ALREADY_COMPLETED, "put request had already completed", std::move(_metadata)};
    }

    upload_error upload_error::previously_failed(fs::error_metadata _metadata)
    {
        return {upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED, "put request had previously failed", std::move(_metadata)};
    }

    upload_error upload_error::object_too_big(std::uint64_t _maximum_size, fs::error_metadata _metadata)
    {
        upload_error error{upload_error_kind::OBJECT_TOO_BIG,
            fmt::format("object exceeded maximum upload size of {} bytes", _maximum_size), std::move(_metadata)};
        error.maximum_size_ = _maximum_size;
        return error;
    }

    int upload_error::to_errno() const noexcept
    {
        switch (kind_) {
            case upload_error_kind::PUT_REQUEST_FAILED:
                return EIO;

            case upload_error_kind::OUT_OF_ORDER_WRITE:
                return EINVAL;

            // Reusing a finished request is treated like writing to a sealed file.
            case upload_error_kind::PUT_REQUEST_ALREADY_COMPLETED:
            case upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED:
                return EPERM;

            case upload_error_kind::OBJECT_TOO_BIG:
                return EFBIG;
        }

        return EIO;
    }

} // s3_mount::upload
