#ifndef S3_MOUNT_FS_REPLY_HPP
#define S3_MOUNT_FS_REPLY_HPP

#include "s3_mount/fs/error.hpp"
#include "s3_mount/fs/inode_error.hpp"
#include "s3_mount/upload/upload_error.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace s3_mount::fs
{

    // Logs the fs-error event for _error and returns its errno.
    int reply_error(const error& _error, const std::string& _operation, std::uint64_t _request_id);

    // Runs the body of a filesystem operation and returns the value to hand back to the
    // kernel: 0 on success, otherwise the positive errno of the failure.  Filesystem,
    // upload and inode errors are logged here.  Anything else propagates.
    //
    //     return call_with_errno("write", request_id, [&] {
    //         bytes_written = request.write(offset, data, size);
    //     });
    template <typename Function>
    int call_with_errno(const std::string& _operation, std::uint64_t _request_id, Function&& _function)
    {
        try {
            std::forward<Function>(_function)();
            return 0;
        }
        catch (const error& e) {
            return reply_error(e, _operation, _request_id);
        }
        catch (const upload::upload_error& e) {
            return reply_error(to_error(e), _operation, _request_id);
        }
        catch (const inode_error& e) {
            return reply_error(to_error(e), _operation, _request_id);
        }
    } // call_with_errno

} // s3_mount::fs

#endif // S3_MOUNT_FS_REPLY_HPP
