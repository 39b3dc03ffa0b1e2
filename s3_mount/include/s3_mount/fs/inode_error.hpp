#ifndef S3_MOUNT_FS_INODE_ERROR_HPP
#define S3_MOUNT_FS_INODE_ERROR_HPP

#include "s3_mount/fs/errno_classifier.hpp"
#include "s3_mount/fs/error_metadata.hpp"
#include "s3_mount/s3_transport/object_client.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace s3_mount::fs
{

    enum class inode_error_kind
    {
        CLIENT_ERROR,
        FILE_DOES_NOT_EXIST,
        INODE_DOES_NOT_EXIST,
        INVALID_FILE_NAME,
        NOT_A_DIRECTORY,
        IS_DIRECTORY,
        FILE_ALREADY_EXISTS,
        INODE_NOT_WRITABLE,
        INODE_INVALID_WRITE_STATUS,
        INODE_ALREADY_WRITING,
        INODE_NOT_READABLE_WHILE_WRITING,
        INODE_NOT_WRITABLE_WHILE_READING,
        CANNOT_REMOVE_REMOTE_DIRECTORY,
        DIRECTORY_NOT_EMPTY,
        UNLINK_NOT_PERMITTED_WHILE_WRITING,
        CORRUPTED_METADATA,
        SET_ATTR_NOT_PERMITTED_ON_REMOTE_INODE,
        STALE_INODE
    };

    // Failure reported by the inode table.  _subject names what the error is about, usually
    // a file name or an inode description such as "42 (dir/file)".
    class inode_error : public std::runtime_error, public errno_classifier
    {
    public:

        inode_error(inode_error_kind _kind, const std::string& _subject, error_metadata _metadata = {});

        // The object client failed while the inode table was looking something up.
        static inode_error client_error(const s3_transport::object_client_error& _cause,
                                        const std::string& _subject,
                                        error_metadata _metadata = {});

        int to_errno() const noexcept override;

        inode_error_kind kind() const noexcept
        {
            return kind_;
        }

        const std::string& subject() const noexcept
        {
            return subject_;
        }

        std::exception_ptr source() const noexcept
        {
            return source_;
        }

        const error_metadata& meta() const noexcept
        {
            return metadata_;
        }

    private:

        inode_error_kind   kind_;
        std::string        subject_;
        std::exception_ptr source_;
        error_metadata     metadata_;

    }; // class inode_error

} // s3_mount::fs

#endif // S3_MOUNT_FS_INODE_ERROR_HPP
