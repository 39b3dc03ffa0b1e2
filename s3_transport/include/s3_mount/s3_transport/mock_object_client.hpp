#ifndef S3_MOUNT_S3_TRANSPORT_MOCK_OBJECT_CLIENT_HPP
#define S3_MOUNT_S3_TRANSPORT_MOCK_OBJECT_CLIENT_HPP

#include "s3_mount/s3_transport/object_client.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace s3_mount::s3_transport
{

    // In-memory object client for tests.  Objects become visible when their put request
    // completes.  Failures can be injected per key for each operation.
    class mock_object_client : public object_client
    {
    public:

        enum class operation
        {
            PUT_OBJECT,
            WRITE,
            COMPLETE
        };

        explicit mock_object_client(std::string _bucket, std::uint64_t _part_size = 32);

        std::unique_ptr<put_object_request> put_object(const std::string& _bucket,
                                                       const std::string& _key,
                                                       const put_object_params& _params) override;

        std::uint64_t part_size() const noexcept override
        {
            return part_size_;
        }

        bool contains_key(const std::string& _key) const;
        bool is_upload_in_progress(const std::string& _key) const;

        // Contents of a completed object.  Returns an empty optional if the object does not exist.
        std::optional<std::vector<char>> object(const std::string& _key) const;

        // Makes the next matching call for _key throw _error.  The injection is consumed by
        // the call it fails.
        void inject_failure(operation _operation, const std::string& _key, object_client_error _error);

        // Number of calls that reached the client for an operation, including failed ones.
        std::uint64_t call_count(operation _operation) const;

    private:

        friend class mock_put_object_request;

        void check_injected_failure(operation _operation, const std::string& _key);
        void count_call(operation _operation);
        void finish_upload(const std::string& _key, std::optional<std::vector<char>> _contents);

        std::string                                                      bucket_;
        std::uint64_t                                                    part_size_;

        mutable std::mutex                                               mutex_;
        std::map<std::string, std::vector<char>>                         objects_;
        std::multiset<std::string>                                       in_progress_;
        std::map<std::pair<operation, std::string>, object_client_error> failures_;
        std::map<operation, std::uint64_t>                               call_counts_;

    }; // class mock_object_client

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_MOCK_OBJECT_CLIENT_HPP
