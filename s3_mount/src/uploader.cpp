#include "s3_mount/upload/uploader.hpp"
#include "s3_mount/s3_transport/types.hpp"

#include <stdexcept>

namespace s3_mount::upload
{

    uploader::uploader(std::shared_ptr<s3_transport::object_client> _client,
                       s3_transport::put_object_params _params)
        : client_{std::move(_client)}
        , params_{std::move(_params)}
    {
        if (!client_) {
            throw std::invalid_argument{"uploader requires an object client"};
        }
    }

    std::uint64_t uploader::maximum_object_size() const noexcept
    {
        return client_->part_size() * static_cast<std::uint64_t>(s3_transport::constants::MAXIMUM_NUMBER_OF_PARTS);
    }

} // s3_mount::upload
