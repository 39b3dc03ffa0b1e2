#include "s3_mount/fs/reply.hpp"
#include "s3_mount/logging/event_log.hpp"

namespace s3_mount::fs
{

    int reply_error(const error& _error, const std::string& _operation, std::uint64_t _request_id)
    {
        logging::log_fs_error_event(_error, _operation, _request_id);
        return _error.to_errno();
    }

} // s3_mount::fs
