#ifndef S3_MOUNT_LOGGING_CATEGORY_HPP
#define S3_MOUNT_LOGGING_CATEGORY_HPP

#include <irods/irods_logger.hpp>

// 1. Declare the custom category tags.
//    These structures do not need to define a body.
//    A tag allows the logger to locate data specific to its category.
struct s3_mount_logging_category;
struct fs_event_logging_category;

// 2. Specialize the logger configuration for the new categories.
//    This also defines the default configuration for each category.
namespace irods::experimental
{
    // Upload lifecycle and error translation.
    template <>
    class log::logger_config<s3_mount_logging_category>
    {
        static constexpr const char* name = "s3_mount";

        // This is the current log level for the category. This also represents the initial
        // log level. Use the "set_level()" function to adjust the level.
        static inline log::level level = log::level::info;

        friend class logger<s3_mount_logging_category>;
    };

    // Structured fs-error / fs-unsupported events.  Each event is emitted at the
    // severity carried by the error, so every level is enabled by default.
    template <>
    class log::logger_config<fs_event_logging_category>
    {
        static constexpr const char* name = "s3_mount_fs_events";

        static inline log::level level = log::level::trace;

        friend class logger<fs_event_logging_category>;
    };
} // namespace irods::experimental

#endif // S3_MOUNT_LOGGING_CATEGORY_HPP
