#ifndef S3_MOUNT_S3_TRANSPORT_CALLBACKS_HPP
#define S3_MOUNT_S3_TRANSPORT_CALLBACKS_HPP

#include "s3_mount/s3_transport/types.hpp"
#include "s3_mount/s3_transport/util.hpp"

#include <cstdint>
#include <string>

namespace s3_mount::s3_transport
{

    namespace s3_multipart_upload
    {

        namespace initialization_callback
        {
            struct data
            {
                explicit data(libs3_types::bucket_context& _saved_bucket_context)
                    : saved_bucket_context{_saved_bucket_context}
                {}

                libs3_types::bucket_context& saved_bucket_context; // To enable more detailed error messages
                request_status               result;
                std::string                  upload_id;
            };

            libs3_types::status on_response (const libs3_types::char_type* upload_id,
                                             void *callback_data);

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data);

            void on_response_complete (libs3_types::status status,
                                       const libs3_types::error_details *error,
                                       void *callback_data);
        } // end namespace initialization_callback

        // Sends one part from a caller owned buffer.
        namespace part_callback
        {
            struct data
            {
                data(libs3_types::bucket_context& _saved_bucket_context,
                     const libs3_types::char_type* _buffer,
                     std::int64_t _content_length)
                    : saved_bucket_context{_saved_bucket_context}
                    , buffer{_buffer}
                    , content_length{_content_length}
                    , bytes_written{0}
                {}

                libs3_types::bucket_context&  saved_bucket_context; // To enable more detailed error messages
                const libs3_types::char_type* buffer;
                std::int64_t                  content_length;
                std::int64_t                  bytes_written;
                request_status                result;
                std::string                   etag;
            };

            int on_data (int libs3_buffer_size,
                         libs3_types::buffer_type libs3_buffer,
                         void *callback_data);

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data);

            void on_response_completion (libs3_types::status status,
                                         const libs3_types::error_details *error,
                                         void *callback_data);
        } // end namespace part_callback

        // Uploading the multipart completion XML from our buffer
        namespace commit_callback
        {
            struct data
            {
                data(libs3_types::bucket_context& _saved_bucket_context, const std::string& _xml)
                    : saved_bucket_context{_saved_bucket_context}
                    , xml{_xml}
                    , remaining{static_cast<std::int64_t>(_xml.size())}
                    , offset{0}
                {}

                libs3_types::bucket_context& saved_bucket_context; // To enable more detailed error messages
                const std::string&           xml;
                std::int64_t                 remaining;
                std::int64_t                 offset;
                request_status               result;
                std::string                  etag;
            };

            int on_response (int buffer_size,
                             libs3_types::buffer_type buffer,
                             void *callback_data);

            libs3_types::status on_response_xml (const char *location,
                                                 const char *etag,
                                                 void *callback_data);

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data);

            void on_response_completion (libs3_types::status status,
                                         const libs3_types::error_details *error,
                                         void *callback_data);
        } // end namespace commit_callback

        namespace cancel_callback
        {
            // S3_abort_multipart_upload() does not allow a callback_data parameter, so the
            // final operation status is passed using these thread locals.
            extern thread_local request_status               g_response_completion_result;
            extern thread_local libs3_types::bucket_context* g_response_completion_saved_bucket_context;

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data);

            void on_response_completion (libs3_types::status status,
                                         const libs3_types::error_details *error,
                                         void *callback_data);
        } // end namespace cancel_callback

    } // end namespace s3_multipart_upload

} // s3_mount::s3_transport

#endif // S3_MOUNT_S3_TRANSPORT_CALLBACKS_HPP
