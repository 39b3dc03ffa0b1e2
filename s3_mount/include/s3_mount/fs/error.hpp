#ifndef S3_MOUNT_FS_ERROR_HPP
#define S3_MOUNT_FS_ERROR_HPP

#include "s3_mount/fs/errno_classifier.hpp"
#include "s3_mount/fs/error_metadata.hpp"

#include <irods/irods_logger.hpp>

#include <fmt/format.h>

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace s3_mount::upload
{
    class upload_error;
} // s3_mount::upload

namespace s3_mount::fs
{

    class inode_error;

    // The error returned by filesystem operations.  Only the errno is passed back to the
    // kernel.  The message, source chain and metadata are kept for logging.
    //
    // Instances are created with error_builder and are immutable.
    class error : public std::exception, public errno_classifier
    {
    public:

        error(int _errno,
              std::string _message,
              std::exception_ptr _source,
              irods::experimental::log::level _level,
              error_metadata _metadata);

        // The message followed by the whole chain of sources, e.g.
        // "upload error: put request failed: S3_upload_part failed [...]".
        const char* what() const noexcept override
        {
            return display_.c_str();
        }

        int to_errno() const noexcept override
        {
            return errno_;
        }

        const std::string& message() const noexcept
        {
            return message_;
        }

        std::exception_ptr source() const noexcept
        {
            return source_;
        }

        irods::experimental::log::level level() const noexcept
        {
            return level_;
        }

        const error_metadata& meta() const noexcept
        {
            return metadata_;
        }

    private:

        int                             errno_;
        std::string                     message_;
        std::exception_ptr              source_;
        irods::experimental::log::level level_;
        error_metadata                  metadata_;
        std::string                     display_;

    }; // class error

    // Assembles an error.  Anything not set defaults to no source, a warning level and
    // empty metadata.
    //
    //     return make_error(EINVAL, "cannot use O_SYNC on file handle {}", fh)
    //         .source(std::current_exception())
    //         .build();
    class error_builder
    {
    public:

        error_builder(int _errno, std::string _message);

        error_builder& source(std::exception_ptr _source);

        // Takes a copy of an exception object of its static type.  A caught exception should
        // be passed as std::current_exception() so that its dynamic type is kept.
        template <typename Exception,
                  typename = std::enable_if_t<std::is_class_v<Exception> &&
                                              !std::is_same_v<Exception, std::exception_ptr> &&
                                              !std::is_same_v<Exception, std::exception>>>
        error_builder& source(const Exception& _source)
        {
            return source(std::make_exception_ptr(_source));
        }

        error_builder& level(irods::experimental::log::level _level);

        error_builder& metadata(error_metadata _metadata);

        error build() const;

    private:

        int                             errno_;
        std::string                     message_;
        std::exception_ptr              source_;
        irods::experimental::log::level level_;
        error_metadata                  metadata_;

    }; // class error_builder

    template <typename... Args>
    error_builder make_error(int _errno, fmt::format_string<Args...> _format, Args&&... _args)
    {
        return error_builder{_errno, fmt::format(_format, std::forward<Args>(_args)...)};
    }

    error to_error(const upload::upload_error& _error);
    error to_error(const inode_error& _error);

    // Renders an exception followed by its chain of sources, separated by ": ".
    std::string describe_error_chain(std::exception_ptr _error);

} // s3_mount::fs

#endif // S3_MOUNT_FS_ERROR_HPP
