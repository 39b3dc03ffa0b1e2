#ifndef S3_MOUNT_S3_TRANSPORT_OBJECT_CLIENT_HPP
#define S3_MOUNT_S3_TRANSPORT_OBJECT_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace s3_mount::s3_transport
{

    // Details reported by the object store for a failed request.  Every field is optional
    // since a request may fail before any response is received.
    struct client_error_meta
    {
        std::optional<int>         http_code;
        std::optional<std::string> error_code;
        std::optional<std::string> error_message;
    };

    struct put_object_params
    {
        std::optional<std::string> content_type;
        bool                       server_side_encryption{false};
    };

    struct put_object_result
    {
        std::string   etag;
        std::uint64_t size{0};
    };

    class object_client_error : public std::runtime_error
    {
    public:

        object_client_error(const std::string& _status,
                            const std::string& _what,
                            client_error_meta _meta = {})
            : std::runtime_error{_what}
            , status_{_status}
            , meta_{std::move(_meta)}
        {
        }

        // Name of the status reported by the client library (e.g. "ErrorAccessDenied").
        const std::string& status() const noexcept
        {
            return status_;
        }

        const client_error_meta& meta() const noexcept
        {
            return meta_;
        }

    private:

        std::string       status_;
        client_error_meta meta_;

    }; // class object_client_error

    // A streaming create-object operation.  Bytes must be appended in order and the object
    // only becomes visible once complete() succeeds.  Destroying a request that has not
    // completed abandons it.
    //
    // Failures are reported by throwing object_client_error.
    class put_object_request
    {
    public:

        virtual ~put_object_request() = default;

        // Appends the whole buffer to the object.
        virtual void write(const char* _buffer, std::size_t _size) = 0;

        virtual put_object_result complete() = 0;

    }; // class put_object_request

    // Client for an object store.  Implementations hold no per-key state and may be shared
    // across any number of concurrent requests.
    class object_client
    {
    public:

        virtual ~object_client() = default;

        virtual std::unique_ptr<put_object_request> put_object(const std::string& _bucket,
                                                               const std::string& _key,
                                                               const put_object_params& _params) = 0;

        // Size of each part sent to the object store.  An object holds at most
        // constants::MAXIMUM_NUMBER_OF_PARTS parts.
        virtual std::uint64_t part_size() const noexcept = 0;

    }; // class object_client

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_OBJECT_CLIENT_HPP
