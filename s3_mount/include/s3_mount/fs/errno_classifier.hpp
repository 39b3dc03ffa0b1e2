#ifndef S3_MOUNT_FS_ERRNO_CLASSIFIER_HPP
#define S3_MOUNT_FS_ERRNO_CLASSIFIER_HPP

namespace s3_mount::fs
{

    // Implemented by errors that can be returned to the kernel as an errno.
    class errno_classifier
    {
    public:

        virtual ~errno_classifier() = default;

        // Positive POSIX error code, e.g. EIO.
        virtual int to_errno() const noexcept = 0;

    }; // class errno_classifier

} // s3_mount::fs

#endif // S3_MOUNT_FS_ERRNO_CLASSIFIER_HPP
