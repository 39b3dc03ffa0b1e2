#include "s3_mount/s3_transport/mock_object_client.hpp"
#include "s3_mount/s3_transport/logging_category.hpp"

#include <fmt/format.h>

#include <utility>

namespace s3_mount::s3_transport
{

    namespace
    {
        namespace log = irods::experimental::log;
        using logger  = log::logger<s3_transport_logging_category>;
    } // namespace

    class mock_put_object_request : public put_object_request
    {
    public:

        mock_put_object_request(mock_object_client& _client, std::string _key)
            : client_{_client}
            , key_{std::move(_key)}
            , buffer_{}
            , finished_{false}
        {
        }

        ~mock_put_object_request() override
        {
            if (!finished_) {
                logger::debug("{}:{} ({}) abandoning upload of \"{}\"", __FILE__, __LINE__, __func__, key_);
                client_.finish_upload(key_, std::nullopt);
            }
        }

        void write(const char* _buffer, std::size_t _size) override
        {
            client_.count_call(mock_object_client::operation::WRITE);
            client_.check_injected_failure(mock_object_client::operation::WRITE, key_);
            buffer_.insert(buffer_.end(), _buffer, _buffer + _size);
        }

        put_object_result complete() override
        {
            client_.count_call(mock_object_client::operation::COMPLETE);
            client_.check_injected_failure(mock_object_client::operation::COMPLETE, key_);

            const std::uint64_t size = buffer_.size();
            finished_ = true;
            client_.finish_upload(key_, std::move(buffer_));

            return put_object_result{fmt::format("\"mock-etag-{}\"", size), size};
        }

    private:

        mock_object_client& client_;
        std::string         key_;
        std::vector<char>   buffer_;
        bool                finished_;

    }; // class mock_put_object_request

    mock_object_client::mock_object_client(std::string _bucket, std::uint64_t _part_size)
        : bucket_{std::move(_bucket)}
        , part_size_{_part_size}
    {
    }

    std::unique_ptr<put_object_request> mock_object_client::put_object(const std::string& _bucket,
                                                                       const std::string& _key,
                                                                       const put_object_params& _params)
    {
        count_call(operation::PUT_OBJECT);

        if (_bucket != bucket_) {
            throw object_client_error{"ErrorNoSuchBucket",
                fmt::format("put_object failed [bucket={}][object_key={}][status=ErrorNoSuchBucket]", _bucket, _key),
                client_error_meta{404, "NoSuchBucket", "The specified bucket does not exist"}};
        }

        check_injected_failure(operation::PUT_OBJECT, _key);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_progress_.insert(_key);
        }

        return std::make_unique<mock_put_object_request>(*this, _key);
    }

    bool mock_object_client::contains_key(const std::string& _key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(_key) > 0;
    }

    bool mock_object_client::is_upload_in_progress(const std::string& _key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_progress_.count(_key) > 0;
    }

    std::optional<std::vector<char>> mock_object_client::object(const std::string& _key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto iter = objects_.find(_key); iter != objects_.end()) {
            return iter->second;
        }
        return std::nullopt;
    }

    void mock_object_client::inject_failure(operation _operation, const std::string& _key, object_client_error _error)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.insert_or_assign(std::make_pair(_operation, _key), std::move(_error));
    }

    std::uint64_t mock_object_client::call_count(operation _operation) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto iter = call_counts_.find(_operation); iter != call_counts_.end()) {
            return iter->second;
        }
        return 0;
    }

    void mock_object_client::check_injected_failure(operation _operation, const std::string& _key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto iter = failures_.find(std::make_pair(_operation, _key));
        if (iter == failures_.end()) {
            return;
        }

        auto error = iter->second;
        failures_.erase(iter);
        throw error;
    }

    void mock_object_client::count_call(operation _operation)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++call_counts_[_operation];
    }

    void mock_object_client::finish_upload(const std::string& _key, std::optional<std::vector<char>> _contents)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (const auto iter = in_progress_.find(_key); iter != in_progress_.end()) {
            in_progress_.erase(iter);
        }

        if (_contents) {
            objects_.insert_or_assign(_key, std::move(*_contents));
        }
    }

} // s3_mount::s3_transport
