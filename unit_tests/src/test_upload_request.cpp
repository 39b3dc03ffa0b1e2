#include <catch2/catch.hpp>

#include "s3_mount/fs/error.hpp"
#include "s3_mount/s3_transport/mock_object_client.hpp"
#include "s3_mount/upload/upload_error.hpp"
#include "s3_mount/upload/uploader.hpp"

#include <cerrno>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using mock_object_client  = s3_mount::s3_transport::mock_object_client;
using object_client_error = s3_mount::s3_transport::object_client_error;
using upload_error        = s3_mount::upload::upload_error;
using upload_error_kind   = s3_mount::upload::upload_error_kind;
using uploader            = s3_mount::upload::uploader;

namespace
{
    const std::string bucket_name = "test-bucket";

    // Counts how many times the handle owned by a request is released.
    struct tracked_handle
    {
        explicit tracked_handle(std::shared_ptr<int> _releases)
            : releases{std::move(_releases)}
        {
        }

        tracked_handle(tracked_handle&&) noexcept = default;

        ~tracked_handle()
        {
            if (releases) {
                ++*releases;
            }
        }

        std::shared_ptr<int> releases;
    };

    template <typename Function>
    upload_error capture_upload_error(Function&& _function)
    {
        try {
            _function();
        }
        catch (const upload_error& e) {
            return e;
        }

        FAIL("expected an upload_error");
        throw std::logic_error{"unreachable"};
    }

    std::vector<char> to_bytes(const std::string& _s)
    {
        return {_s.begin(), _s.end()};
    }

    // Client whose requests fail with exceptions that are not object_client_error.
    class faulty_object_client : public s3_mount::s3_transport::object_client
    {
    public:
        class request : public s3_mount::s3_transport::put_object_request
        {
        public:
            void write(const char*, std::size_t) override
            {
                throw std::length_error{"part buffer exhausted"};
            }

            s3_mount::s3_transport::put_object_result complete() override
            {
                throw std::length_error{"part buffer exhausted"};
            }
        };

        std::unique_ptr<s3_mount::s3_transport::put_object_request> put_object(
            const std::string&, const std::string&, const s3_mount::s3_transport::put_object_params&) override
        {
            return std::make_unique<request>();
        }

        std::uint64_t part_size() const noexcept override
        {
            return 32;
        }
    };
} // namespace

TEST_CASE("upload_request scenario", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "hello", tracked_handle{releases});

    REQUIRE(request.is_in_progress());
    REQUIRE(request.key() == "hello");
    REQUIRE(request.bucket() == bucket_name);
    REQUIRE(client->is_upload_in_progress("hello"));

    REQUIRE(request.write(0, "foo", 3) == 3);

    const auto error = capture_upload_error([&] { request.write(0, "foo", 3); });
    REQUIRE(error.kind() == upload_error_kind::OUT_OF_ORDER_WRITE);
    REQUIRE(error.expected_offset() == 3);
    REQUIRE(error.write_offset() == 0);

    REQUIRE(request.write(3, "foo", 3) == 3);

    const auto result = request.complete();
    REQUIRE(result.size == 6);
    REQUIRE(request.size() == 6);
    REQUIRE_FALSE(request.is_in_progress());

    REQUIRE(*releases == 1);
    REQUIRE(client->contains_key("hello"));
    REQUIRE_FALSE(client->is_upload_in_progress("hello"));
    REQUIRE(client->object("hello") == to_bytes("foofoo"));
}

TEST_CASE("upload_request sequential writes", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "dir/sequential", tracked_handle{releases});

    const std::vector<std::string> chunks{"a", "bcd", "", "efghijklmnopqrstuvwxyz", "0123456789012345678901234567890123456789"};

    std::string expected;
    for (const auto& chunk : chunks) {
        REQUIRE(request.write(static_cast<std::int64_t>(expected.size()), chunk.data(), chunk.size()) == chunk.size());
        expected += chunk;
        REQUIRE(request.size() == expected.size());
    }

    REQUIRE(client->call_count(mock_object_client::operation::WRITE) == chunks.size());

    request.complete();

    REQUIRE(client->object("dir/sequential") == to_bytes(expected));
}

TEST_CASE("upload_request out of order writes", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "out_of_order", tracked_handle{releases});

    REQUIRE(request.write(0, "abcd", 4) == 4);
    const auto writes = client->call_count(mock_object_client::operation::WRITE);

    SECTION("write ahead of the expected offset")
    {
        const auto error = capture_upload_error([&] { request.write(8, "efgh", 4); });
        REQUIRE(error.kind() == upload_error_kind::OUT_OF_ORDER_WRITE);
        REQUIRE(error.write_offset() == 8);
        REQUIRE(error.expected_offset() == 4);
        REQUIRE(std::string{error.what()} == "out of order write; expected offset 4 but got 8");
        REQUIRE(error.to_errno() == EINVAL);
    }

    SECTION("write behind the expected offset")
    {
        const auto error = capture_upload_error([&] { request.write(2, "cd", 2); });
        REQUIRE(error.kind() == upload_error_kind::OUT_OF_ORDER_WRITE);
        REQUIRE(error.write_offset() == 2);
    }

    SECTION("write at a negative offset")
    {
        const auto error = capture_upload_error([&] { request.write(-1, "x", 1); });
        REQUIRE(error.kind() == upload_error_kind::OUT_OF_ORDER_WRITE);
        REQUIRE(error.write_offset() == -1);
    }

    // nothing reached the client and the request is still usable at the expected offset
    REQUIRE(client->call_count(mock_object_client::operation::WRITE) == writes);
    REQUIRE(request.is_in_progress());
    REQUIRE(request.size() == 4);
    REQUIRE(*releases == 0);

    REQUIRE(request.write(4, "efgh", 4) == 4);
    REQUIRE(request.size() == 8);
}

TEST_CASE("upload_request errors carry bucket and key", "[upload_request][metadata]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto request = uploads.put(bucket_name, "dir/meta", 0);

    const auto error = capture_upload_error([&] { request.write(1, "x", 1); });
    REQUIRE(error.meta().s3_bucket_name == bucket_name);
    REQUIRE(error.meta().s3_object_key == "dir/meta");
    REQUIRE_FALSE(error.meta().client_error_meta.http_code);
}

TEST_CASE("upload_request after completion", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "completed", tracked_handle{releases});

    REQUIRE(request.write(0, "data", 4) == 4);
    request.complete();

    const auto writes = client->call_count(mock_object_client::operation::WRITE);
    const auto completes = client->call_count(mock_object_client::operation::COMPLETE);

    SECTION("write")
    {
        const auto error = capture_upload_error([&] { request.write(4, "more", 4); });
        REQUIRE(error.kind() == upload_error_kind::PUT_REQUEST_ALREADY_COMPLETED);
        REQUIRE(std::string{error.what()} == "put request had already completed");
        REQUIRE(error.to_errno() == EPERM);
    }

    SECTION("complete")
    {
        const auto error = capture_upload_error([&] { request.complete(); });
        REQUIRE(error.kind() == upload_error_kind::PUT_REQUEST_ALREADY_COMPLETED);

        // still completed
        const auto again = capture_upload_error([&] { request.complete(); });
        REQUIRE(again.kind() == upload_error_kind::PUT_REQUEST_ALREADY_COMPLETED);
    }

    REQUIRE(client->call_count(mock_object_client::operation::WRITE) == writes);
    REQUIRE(client->call_count(mock_object_client::operation::COMPLETE) == completes);
    REQUIRE(request.size() == 4);
    REQUIRE(*releases == 1);
    REQUIRE(client->object("completed") == to_bytes("data"));
}

TEST_CASE("upload_request write failure", "[upload_request][failure]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "write_failure", tracked_handle{releases});

    REQUIRE(request.write(0, "abc", 3) == 3);

    client->inject_failure(mock_object_client::operation::WRITE, "write_failure",
        object_client_error{"ErrorAccessDenied", "S3_upload_part failed",
            {403, "AccessDenied", "Access Denied"}});

    const auto error = capture_upload_error([&] { request.write(3, "def", 3); });
    REQUIRE(error.kind() == upload_error_kind::PUT_REQUEST_FAILED);
    REQUIRE(std::string{error.what()} == "put request failed");
    REQUIRE(error.to_errno() == EIO);
    REQUIRE_THROWS_AS(std::rethrow_exception(error.source()), object_client_error);

    const auto& meta = error.meta();
    REQUIRE(meta.s3_bucket_name == bucket_name);
    REQUIRE(meta.s3_object_key == "write_failure");
    REQUIRE(meta.error_code == "AccessDenied");
    REQUIRE(meta.client_error_meta.http_code == 403);
    REQUIRE(meta.client_error_meta.error_code == "AccessDenied");
    REQUIRE(meta.client_error_meta.error_message == "Access Denied");

    // the failed request released its handle and abandoned the upload
    REQUIRE_FALSE(request.is_in_progress());
    REQUIRE(request.size() == 3);
    REQUIRE(*releases == 1);
    REQUIRE_FALSE(client->is_upload_in_progress("write_failure"));
    REQUIRE_FALSE(client->contains_key("write_failure"));

    const auto writes = client->call_count(mock_object_client::operation::WRITE);
    const auto completes = client->call_count(mock_object_client::operation::COMPLETE);

    const auto write_error = capture_upload_error([&] { request.write(3, "def", 3); });
    REQUIRE(write_error.kind() == upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);
    REQUIRE(std::string{write_error.what()} == "put request had previously failed");
    REQUIRE(write_error.to_errno() == EPERM);

    const auto complete_error = capture_upload_error([&] { request.complete(); });
    REQUIRE(complete_error.kind() == upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);

    // still failed
    const auto repeated_error = capture_upload_error([&] { request.complete(); });
    REQUIRE(repeated_error.kind() == upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);

    REQUIRE(client->call_count(mock_object_client::operation::WRITE) == writes);
    REQUIRE(client->call_count(mock_object_client::operation::COMPLETE) == completes);
    REQUIRE(*releases == 1);
}

TEST_CASE("upload_request complete failure", "[upload_request][failure]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "complete_failure", tracked_handle{releases});

    REQUIRE(request.write(0, "abc", 3) == 3);

    client->inject_failure(mock_object_client::operation::COMPLETE, "complete_failure",
        object_client_error{"ErrorInternalError", "S3_complete_multipart_upload failed",
            {500, "InternalError", "We encountered an internal error. Please try again."}});

    const auto error = capture_upload_error([&] { request.complete(); });
    REQUIRE(error.kind() == upload_error_kind::PUT_REQUEST_FAILED);
    REQUIRE(error.meta().client_error_meta.http_code == 500);
    REQUIRE(error.meta().s3_object_key == "complete_failure");

    // the handle is released even though completion failed
    REQUIRE(*releases == 1);
    REQUIRE_FALSE(request.is_in_progress());
    REQUIRE_FALSE(client->contains_key("complete_failure"));
    REQUIRE_FALSE(client->is_upload_in_progress("complete_failure"));

    const auto writes = client->call_count(mock_object_client::operation::WRITE);
    const auto completes = client->call_count(mock_object_client::operation::COMPLETE);

    REQUIRE(capture_upload_error([&] { request.write(3, "def", 3); }).kind() ==
            upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);
    REQUIRE(capture_upload_error([&] { request.complete(); }).kind() ==
            upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);

    REQUIRE(client->call_count(mock_object_client::operation::WRITE) == writes);
    REQUIRE(client->call_count(mock_object_client::operation::COMPLETE) == completes);
    REQUIRE(*releases == 1);
}

TEST_CASE("upload_request failure not reported by the object client", "[upload_request][failure]")
{
    uploader uploads{std::make_shared<faulty_object_client>()};

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "faulty", tracked_handle{releases});

    SECTION("write")
    {
        const auto error = capture_upload_error([&] { request.write(0, "abc", 3); });
        REQUIRE(error.kind() == upload_error_kind::PUT_REQUEST_FAILED);
        REQUIRE(std::string{error.what()} == "put request failed");
        REQUIRE_THROWS_AS(std::rethrow_exception(error.source()), std::length_error);

        // the cause appears once in the rendered chain
        REQUIRE(std::string{s3_mount::fs::to_error(error).what()} ==
                "upload error: put request failed: part buffer exhausted");
    }

    SECTION("complete")
    {
        const auto error = capture_upload_error([&] { request.complete(); });
        REQUIRE(error.kind() == upload_error_kind::PUT_REQUEST_FAILED);
        REQUIRE(std::string{s3_mount::fs::to_error(error).what()} ==
                "upload error: put request failed: part buffer exhausted");
    }

    REQUIRE(*releases == 1);
    REQUIRE(capture_upload_error([&] { request.complete(); }).kind() ==
            upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);
}

TEST_CASE("upload_request abandoned while in progress", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);

    {
        auto request = uploads.put(bucket_name, "abandoned", tracked_handle{releases});
        REQUIRE(request.write(0, "partial", 7) == 7);
        REQUIRE(client->is_upload_in_progress("abandoned"));
        REQUIRE(*releases == 0);
    }

    REQUIRE(*releases == 1);
    REQUIRE_FALSE(client->is_upload_in_progress("abandoned"));
    REQUIRE_FALSE(client->contains_key("abandoned"));
    REQUIRE(client->call_count(mock_object_client::operation::COMPLETE) == 0);
}

TEST_CASE("upload_request handle released once across moves", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);

    {
        auto request = uploads.put(bucket_name, "moved", tracked_handle{releases});
        auto moved = std::move(request);

        REQUIRE(moved.write(0, "abc", 3) == 3);
        moved.complete();
        REQUIRE(*releases == 1);
    }

    REQUIRE(*releases == 1);
    REQUIRE(client->object("moved") == to_bytes("abc"));
}

TEST_CASE("upload_request moved-from request is failed", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);

    SECTION("move construction")
    {
        auto request = uploads.put(bucket_name, "source", tracked_handle{releases});
        auto moved = std::move(request);

        REQUIRE_FALSE(request.is_in_progress());
        REQUIRE(moved.is_in_progress());
        REQUIRE(request.key() == "source");

        const auto writes = client->call_count(mock_object_client::operation::WRITE);

        REQUIRE(capture_upload_error([&] { request.write(0, "x", 1); }).kind() ==
                upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);
        REQUIRE(capture_upload_error([&] { request.complete(); }).kind() ==
                upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);

        REQUIRE(client->call_count(mock_object_client::operation::WRITE) == writes);
        REQUIRE(client->call_count(mock_object_client::operation::COMPLETE) == 0);
        REQUIRE(*releases == 0);

        REQUIRE(moved.write(0, "x", 1) == 1);
        moved.complete();

        REQUIRE(*releases == 1);
        REQUIRE(client->object("source") == to_bytes("x"));
    }

    SECTION("move assignment over a request in progress")
    {
        auto replaced_releases = std::make_shared<int>(0);

        auto target = uploads.put(bucket_name, "replaced", tracked_handle{replaced_releases});
        REQUIRE(target.write(0, "old", 3) == 3);

        auto source = uploads.put(bucket_name, "source", tracked_handle{releases});
        REQUIRE(source.write(0, "new", 3) == 3);

        target = std::move(source);

        // the replaced upload is abandoned and its handle released
        REQUIRE(*replaced_releases == 1);
        REQUIRE_FALSE(client->is_upload_in_progress("replaced"));
        REQUIRE_FALSE(client->contains_key("replaced"));

        REQUIRE_FALSE(source.is_in_progress());
        REQUIRE(capture_upload_error([&] { source.write(3, "x", 1); }).kind() ==
                upload_error_kind::PUT_REQUEST_PREVIOUSLY_FAILED);

        REQUIRE(target.key() == "source");
        REQUIRE(target.size() == 3);
        REQUIRE(target.write(3, "er", 2) == 2);
        target.complete();

        REQUIRE(*releases == 1);
        REQUIRE(*replaced_releases == 1);
        REQUIRE(client->object("source") == to_bytes("newer"));
    }
}

TEST_CASE("upload_request empty object", "[upload_request]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto request = uploads.put(bucket_name, "empty", 0);
    const auto result = request.complete();

    REQUIRE(result.size == 0);
    REQUIRE(request.size() == 0);
    REQUIRE(client->object("empty") == std::vector<char>{});
}

TEST_CASE("upload_request maximum object size", "[upload_request][object_too_big]")
{
    // one byte parts limit objects to MAXIMUM_NUMBER_OF_PARTS bytes
    auto client = std::make_shared<mock_object_client>(bucket_name, 1);
    uploader uploads{client};

    REQUIRE(uploads.maximum_object_size() == 10000);

    auto releases = std::make_shared<int>(0);
    auto request = uploads.put(bucket_name, "big", tracked_handle{releases});

    const std::vector<char> data(6000, 'x');
    REQUIRE(request.write(0, data.data(), data.size()) == data.size());

    const auto writes = client->call_count(mock_object_client::operation::WRITE);

    const auto error = capture_upload_error([&] { request.write(6000, data.data(), data.size()); });
    REQUIRE(error.kind() == upload_error_kind::OBJECT_TOO_BIG);
    REQUIRE(error.maximum_size() == 10000);
    REQUIRE(std::string{error.what()} == "object exceeded maximum upload size of 10000 bytes");
    REQUIRE(error.to_errno() == EFBIG);

    // the oversized write was rejected before reaching the client
    REQUIRE(client->call_count(mock_object_client::operation::WRITE) == writes);
    REQUIRE(request.is_in_progress());
    REQUIRE(request.size() == 6000);
    REQUIRE(*releases == 0);

    REQUIRE(request.write(6000, data.data(), 4000) == 4000);
    request.complete();

    REQUIRE(client->object("big")->size() == 10000);
}

TEST_CASE("uploader put failures", "[uploader]")
{
    auto client = std::make_shared<mock_object_client>(bucket_name);
    uploader uploads{client};

    auto releases = std::make_shared<int>(0);

    SECTION("unknown bucket")
    {
        try {
            uploads.put("no-such-bucket", "key", tracked_handle{releases});
            FAIL("expected an object_client_error");
        }
        catch (const object_client_error& e) {
            REQUIRE(e.status() == "ErrorNoSuchBucket");
            REQUIRE(e.meta().http_code == 404);
            REQUIRE(e.meta().error_code == "NoSuchBucket");
        }
    }

    SECTION("injected failure")
    {
        client->inject_failure(mock_object_client::operation::PUT_OBJECT, "key",
            object_client_error{"ErrorAccessDenied", "S3_initiate_multipart failed", {403, "AccessDenied", {}}});

        REQUIRE_THROWS_AS(uploads.put(bucket_name, "key", tracked_handle{releases}), object_client_error);
        REQUIRE_FALSE(client->is_upload_in_progress("key"));

        // the injection is consumed
        auto request = uploads.put(bucket_name, "key", 0);
        REQUIRE(request.is_in_progress());
    }

    REQUIRE(*releases == 1);
}

TEST_CASE("uploader requires a client", "[uploader]")
{
    REQUIRE_THROWS_AS(uploader{nullptr}, std::invalid_argument);
}
