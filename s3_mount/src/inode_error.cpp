#include "s3_mount/fs/inode_error.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <utility>

namespace s3_mount::fs
{

    namespace
    {
        std::string describe(inode_error_kind _kind, const std::string& _subject)
        {
            switch (_kind) {
                case inode_error_kind::CLIENT_ERROR:
                    return fmt::format("error from object client while accessing {}", _subject);
                case inode_error_kind::FILE_DOES_NOT_EXIST:
                    return fmt::format("file does not exist: {}", _subject);
                case inode_error_kind::INODE_DOES_NOT_EXIST:
                    return fmt::format("inode {} does not exist", _subject);
                case inode_error_kind::INVALID_FILE_NAME:
                    return fmt::format("invalid file name {}", _subject);
                case inode_error_kind::NOT_A_DIRECTORY:
                    return fmt::format("inode {} is not a directory", _subject);
                case inode_error_kind::IS_DIRECTORY:
                    return fmt::format("inode {} is a directory", _subject);
                case inode_error_kind::FILE_ALREADY_EXISTS:
                    return fmt::format("file already exists at inode {}", _subject);
                case inode_error_kind::INODE_NOT_WRITABLE:
                    return fmt::format("inode {} is not writable", _subject);
                case inode_error_kind::INODE_INVALID_WRITE_STATUS:
                    return fmt::format("invalid write status for inode {}", _subject);
                case inode_error_kind::INODE_ALREADY_WRITING:
                    return fmt::format("inode {} is already being written", _subject);
                case inode_error_kind::INODE_NOT_READABLE_WHILE_WRITING:
                    return fmt::format("inode {} is not readable while being written", _subject);
                case inode_error_kind::INODE_NOT_WRITABLE_WHILE_READING:
                    return fmt::format("inode {} is not writable while being read", _subject);
                case inode_error_kind::CANNOT_REMOVE_REMOTE_DIRECTORY:
                    return fmt::format("remote directory {} cannot be removed", _subject);
                case inode_error_kind::DIRECTORY_NOT_EMPTY:
                    return fmt::format("directory {} is not empty", _subject);
                case inode_error_kind::UNLINK_NOT_PERMITTED_WHILE_WRITING:
                    return fmt::format("inode {} cannot be unlinked while being written", _subject);
                case inode_error_kind::CORRUPTED_METADATA:
                    return fmt::format("corrupted metadata for inode {}", _subject);
                case inode_error_kind::SET_ATTR_NOT_PERMITTED_ON_REMOTE_INODE:
                    return fmt::format("attributes of remote inode {} cannot be changed", _subject);
                case inode_error_kind::STALE_INODE:
                    return fmt::format("inode {} is stale", _subject);
            }

            return fmt::format("unknown inode error for {}", _subject);
        } // describe
    } // namespace

    inode_error::inode_error(inode_error_kind _kind, const std::string& _subject, error_metadata _metadata)
        : std::runtime_error{describe(_kind, _subject)}
        , kind_{_kind}
        , subject_{_subject}
        , source_{}
        , metadata_{std::move(_metadata)}
    {
    }

    inode_error inode_error::client_error(const s3_transport::object_client_error& _cause,
                                          const std::string& _subject,
                                          error_metadata _metadata)
    {
        error_metadata metadata;
        metadata.client_error_meta = _cause.meta();
        metadata.error_code = _cause.meta().error_code;
        metadata.merge(_metadata);

        inode_error error{inode_error_kind::CLIENT_ERROR, _subject, std::move(metadata)};
        error.source_ = std::make_exception_ptr(_cause);
        return error;
    }

    int inode_error::to_errno() const noexcept
    {
        switch (kind_) {
            case inode_error_kind::CLIENT_ERROR:
                return EIO;
            case inode_error_kind::FILE_DOES_NOT_EXIST:
            case inode_error_kind::INODE_DOES_NOT_EXIST:
                return ENOENT;
            case inode_error_kind::INVALID_FILE_NAME:
                return EINVAL;
            case inode_error_kind::NOT_A_DIRECTORY:
                return ENOTDIR;
            case inode_error_kind::IS_DIRECTORY:
                return EISDIR;
            case inode_error_kind::FILE_ALREADY_EXISTS:
                return EEXIST;

            // EINVAL or EROFS would also be reasonable for the writing/reading conflicts,
            // but they are treated like sealed files.
            case inode_error_kind::INODE_NOT_WRITABLE:
            case inode_error_kind::INODE_INVALID_WRITE_STATUS:
            case inode_error_kind::INODE_ALREADY_WRITING:
            case inode_error_kind::INODE_NOT_READABLE_WHILE_WRITING:
            case inode_error_kind::INODE_NOT_WRITABLE_WHILE_READING:
            case inode_error_kind::CANNOT_REMOVE_REMOTE_DIRECTORY:
            case inode_error_kind::UNLINK_NOT_PERMITTED_WHILE_WRITING:
            case inode_error_kind::SET_ATTR_NOT_PERMITTED_ON_REMOTE_INODE:
                return EPERM;

            case inode_error_kind::DIRECTORY_NOT_EMPTY:
                return ENOTEMPTY;
            case inode_error_kind::CORRUPTED_METADATA:
                return EIO;
            case inode_error_kind::STALE_INODE:
                return ESTALE;
        }

        return EIO;
    }

} // s3_mount::fs
