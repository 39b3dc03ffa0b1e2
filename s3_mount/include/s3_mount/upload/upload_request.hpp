#ifndef S3_MOUNT_UPLOAD_UPLOAD_REQUEST_HPP
#define S3_MOUNT_UPLOAD_UPLOAD_REQUEST_HPP

#include "s3_mount/logging_category.hpp"
#include "s3_mount/fs/error_metadata.hpp"
#include "s3_mount/s3_transport/object_client.hpp"
#include "s3_mount/upload/upload_error.hpp"

#include <irods/irods_logger.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace s3_mount::upload
{

    class uploader;

    // A single object being created from a sequence of writes.
    //
    // Writes must be contiguous and start at offset 0.  The request owns the caller's
    // handle while the upload is in progress and releases it exactly once, when the
    // request completes, fails or is destroyed.  Completed and failed are terminal.
    //
    // Handle only needs to be move constructible.
    //
    // The request is not synchronized.  The caller must not call write() and complete()
    // concurrently on the same request.
    template <typename Handle>
    class upload_request
    {
    public:

        upload_request(const upload_request&) = delete;
        upload_request& operator=(const upload_request&) = delete;

        // The moved-from request is left failed.
        upload_request(upload_request&& _other)
            : bucket_{_other.bucket_}
            , key_{_other.key_}
            , maximum_size_{_other.maximum_size_}
            , next_offset_{_other.next_offset_}
            , state_{std::exchange(_other.state_, failed{})}
        {
        }

        // Any upload in progress on this request is abandoned.  The moved-from request is
        // left failed.
        upload_request& operator=(upload_request&& _other)
        {
            if (this != &_other) {
                bucket_       = _other.bucket_;
                key_          = _other.key_;
                maximum_size_ = _other.maximum_size_;
                next_offset_  = _other.next_offset_;

                // emplace so that Handle need not be move assignable
                std::visit([this](auto&& _state) {
                    state_.template emplace<std::decay_t<decltype(_state)>>(std::move(_state));
                }, std::exchange(_other.state_, failed{}));
            }

            return *this;
        }

        ~upload_request() = default;

        // Appends _size bytes at _offset and returns the number of bytes written.
        //
        // Throws upload_error.  An out of order or oversized write leaves the request
        // untouched.  A failure reported by the object client moves the request to failed.
        std::size_t write(std::int64_t _offset, const char* _buffer, std::size_t _size)
        {
            if (_offset < 0 || static_cast<std::uint64_t>(_offset) != next_offset_) {
                throw upload_error::out_of_order_write(_offset, next_offset_, metadata());
            }

            if (std::holds_alternative<completed>(state_)) {
                logger::error("{}:{} ({}) object already uploaded [key={}]", __FILE__, __LINE__, __func__, key_);
                throw upload_error::already_completed(metadata());
            }

            if (std::holds_alternative<failed>(state_)) {
                logger::error("{}:{} ({}) error on previous write [key={}]", __FILE__, __LINE__, __func__, key_);
                throw upload_error::previously_failed(metadata());
            }

            if (_size > maximum_size_ - next_offset_) {
                logger::error("{}:{} ({}) object exceeded maximum upload size [key={}] [offset={}] [size={}] [maximum={}]",
                        __FILE__, __LINE__, __func__, key_, next_offset_, _size, maximum_size_);
                throw upload_error::object_too_big(maximum_size_, metadata());
            }

            auto& current = std::get<in_progress>(state_);

            try {
                current.request->write(_buffer, _size);
            }
            catch (const s3_transport::object_client_error& e) {
                logger::error("{}:{} ({}) write failed [key={}] [offset={}] [error={}]",
                        __FILE__, __LINE__, __func__, key_, next_offset_, e.what());
                state_ = failed{};
                throw upload_error::put_request_failed(e, metadata());
            }
            catch (const std::exception& e) {
                logger::error("{}:{} ({}) write failed [key={}] [offset={}] [error={}]",
                        __FILE__, __LINE__, __func__, key_, next_offset_, e.what());
                state_ = failed{};
                throw upload_error::put_request_failed(std::current_exception(), metadata());
            }

            next_offset_ += _size;

            return _size;
        } // write

        // Finalizes the object.  The handle is released before the object client is
        // asked to finish the upload, whatever the outcome.
        s3_transport::put_object_result complete()
        {
            if (std::holds_alternative<completed>(state_)) {
                logger::error("{}:{} ({}) object already uploaded [key={}]", __FILE__, __LINE__, __func__, key_);
                throw upload_error::already_completed(metadata());
            }

            if (std::holds_alternative<failed>(state_)) {
                logger::error("{}:{} ({}) error on previous write [key={}]", __FILE__, __LINE__, __func__, key_);
                throw upload_error::previously_failed(metadata());
            }

            auto& current = std::get<in_progress>(state_);
            auto request = std::move(current.request);
            current.handle.reset();

            // Marked completed before the client call so nothing can reuse the request
            // while the call is outstanding.
            state_ = completed{};

            try {
                auto result = request->complete();

                logger::debug("{}:{} ({}) put succeeded [key={}] [size={}] [etag={}]",
                        __FILE__, __LINE__, __func__, key_, next_offset_, result.etag);

                return result;
            }
            catch (const s3_transport::object_client_error& e) {
                state_ = failed{};
                logger::error("{}:{} ({}) put failed, object was not uploaded [key={}] [size={}] [error={}]",
                        __FILE__, __LINE__, __func__, key_, next_offset_, e.what());
                throw upload_error::put_request_failed(e, metadata());
            }
            catch (const std::exception& e) {
                state_ = failed{};
                logger::error("{}:{} ({}) put failed, object was not uploaded [key={}] [size={}] [error={}]",
                        __FILE__, __LINE__, __func__, key_, next_offset_, e.what());
                throw upload_error::put_request_failed(std::current_exception(), metadata());
            }
        } // complete

        // Number of bytes accepted so far.
        std::uint64_t size() const noexcept
        {
            return next_offset_;
        }

        bool is_in_progress() const noexcept
        {
            return std::holds_alternative<in_progress>(state_);
        }

        const std::string& key() const noexcept
        {
            return key_;
        }

        const std::string& bucket() const noexcept
        {
            return bucket_;
        }

    private:

        friend class uploader;

        using logger = irods::experimental::log::logger<s3_mount_logging_category>;

        struct in_progress
        {
            std::unique_ptr<s3_transport::put_object_request> request;
            std::optional<Handle>                             handle;
        };

        struct completed {};
        struct failed {};

        using state_type = std::variant<in_progress, completed, failed>;

        upload_request(std::string _bucket,
                       std::string _key,
                       std::uint64_t _maximum_size,
                       std::unique_ptr<s3_transport::put_object_request> _request,
                       Handle _handle)
            : bucket_{std::move(_bucket)}
            , key_{std::move(_key)}
            , maximum_size_{_maximum_size}
            , next_offset_{0}
            , state_{in_progress{std::move(_request), std::optional<Handle>{std::move(_handle)}}}
        {
        }

        fs::error_metadata metadata() const
        {
            fs::error_metadata metadata;
            metadata.s3_bucket_name = bucket_;
            metadata.s3_object_key  = key_;
            return metadata;
        }

        std::string   bucket_;
        std::string   key_;
        std::uint64_t maximum_size_;
        std::uint64_t next_offset_;
        state_type    state_;

    }; // class upload_request

} // s3_mount::upload

#endif // S3_MOUNT_UPLOAD_UPLOAD_REQUEST_HPP
