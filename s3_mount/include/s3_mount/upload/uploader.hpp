#ifndef S3_MOUNT_UPLOAD_UPLOADER_HPP
#define S3_MOUNT_UPLOAD_UPLOADER_HPP

#include "s3_mount/logging_category.hpp"
#include "s3_mount/s3_transport/object_client.hpp"
#include "s3_mount/upload/upload_request.hpp"

#include <irods/irods_logger.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace s3_mount::upload
{

    // Opens upload requests against a shared object client.  Holds no per-key state, so a
    // single instance serves any number of concurrent uploads.
    class uploader
    {
    public:

        explicit uploader(std::shared_ptr<s3_transport::object_client> _client,
                          s3_transport::put_object_params _params = {});

        // Starts creating _key in _bucket.  _handle is owned by the returned request until
        // it leaves the in progress state.
        //
        // Errors from the object client are thrown as object_client_error, unchanged.
        template <typename Handle>
        upload_request<Handle> put(const std::string& _bucket, const std::string& _key, Handle _handle) const
        {
            auto request = client_->put_object(_bucket, _key, params_);

            logger::debug("{}:{} ({}) put request opened [bucket={}] [key={}]",
                    __FILE__, __LINE__, __func__, _bucket, _key);

            return upload_request<Handle>{_bucket, _key, maximum_object_size(), std::move(request), std::move(_handle)};
        }

        // Largest object the client can store, part_size() * MAXIMUM_NUMBER_OF_PARTS.
        std::uint64_t maximum_object_size() const noexcept;

    private:

        using logger = irods::experimental::log::logger<s3_mount_logging_category>;

        std::shared_ptr<s3_transport::object_client> client_;
        s3_transport::put_object_params              params_;

    }; // class uploader

} // s3_mount::upload

#endif // S3_MOUNT_UPLOAD_UPLOADER_HPP
