#include "s3_mount/s3_transport/callbacks.hpp"

#include <cstring>

namespace s3_mount::s3_transport
{

    namespace s3_multipart_upload
    {

        namespace initialization_callback
        {

            libs3_types::status on_response (const libs3_types::char_type* upload_id,
                                             void *callback_data)
            {
                auto *manager = static_cast<data*>(callback_data);
                manager->upload_id = upload_id ? upload_id : "";
                return libs3_types::status_ok;
            } // end on_response

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data)
            {
                return libs3_types::status_ok;
            } // end on_response_properties

            void on_response_complete (libs3_types::status status,
                                       const libs3_types::error_details *error,
                                       void *callback_data)
            {
                auto *manager = static_cast<data*>(callback_data);
                store_and_log_status(status, error, "s3_multipart_upload::initialization_callback::on_response_complete",
                        manager->saved_bucket_context, manager->result);
            } // end on_response_complete

        } // end namespace initialization_callback

        namespace part_callback
        {

            int on_data (int libs3_buffer_size,
                         libs3_types::buffer_type libs3_buffer,
                         void *callback_data)
            {
                auto *part = static_cast<data*>(callback_data);

                // returning 0 tells libs3 the part body is complete
                if (libs3_buffer_size <= 0 || part->content_length <= part->bytes_written) {
                    return 0;
                }

                const std::int64_t bytes_to_return =
                    libs3_buffer_size < part->content_length - part->bytes_written
                    ? libs3_buffer_size
                    : part->content_length - part->bytes_written;

                std::memcpy(libs3_buffer, part->buffer + part->bytes_written, bytes_to_return);
                part->bytes_written += bytes_to_return;

                return static_cast<int>(bytes_to_return);
            } // end on_data

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data)
            {
                auto *part = static_cast<data*>(callback_data);
                part->etag = properties && properties->eTag ? properties->eTag : "";
                return libs3_types::status_ok;
            } // end on_response_properties

            void on_response_completion (libs3_types::status status,
                                         const libs3_types::error_details *error,
                                         void *callback_data)
            {
                auto *part = static_cast<data*>(callback_data);
                store_and_log_status(status, error, "s3_multipart_upload::part_callback::on_response_completion",
                        part->saved_bucket_context, part->result);
            } // end on_response_completion

        } // end namespace part_callback

        namespace commit_callback
        {

            int on_response (int buffer_size,
                             libs3_types::buffer_type buffer,
                             void *callback_data)
            {
                auto *manager = static_cast<data*>(callback_data);
                std::int64_t ret = 0;
                if (manager->remaining) {
                    const std::int64_t to_read_count = ((manager->remaining > static_cast<std::int64_t>(buffer_size)) ?
                                  static_cast<std::int64_t>(buffer_size) : manager->remaining);
                    std::memcpy(buffer, manager->xml.c_str() + manager->offset, to_read_count);
                    ret = to_read_count;
                }
                manager->remaining -= ret;
                manager->offset += ret;

                return static_cast<int>(ret);
            } // end on_response

            libs3_types::status on_response_xml (const char *location,
                                                 const char *etag,
                                                 void *callback_data)
            {
                auto *manager = static_cast<data*>(callback_data);
                manager->etag = etag ? etag : "";
                return libs3_types::status_ok;
            } // end on_response_xml

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data)
            {
                return libs3_types::status_ok;
            } // end on_response_properties

            void on_response_completion (libs3_types::status status,
                                         const libs3_types::error_details *error,
                                         void *callback_data)
            {
                auto *manager = static_cast<data*>(callback_data);
                store_and_log_status(status, error, "s3_multipart_upload::commit_callback::on_response_completion",
                        manager->saved_bucket_context, manager->result);
            } // end on_response_completion

        } // end namespace commit_callback

        namespace cancel_callback
        {
            thread_local request_status               g_response_completion_result;
            thread_local libs3_types::bucket_context* g_response_completion_saved_bucket_context = nullptr;

            libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                        void *callback_data)
            {
                return libs3_types::status_ok;
            } // end on_response_properties

            void on_response_completion (libs3_types::status status,
                                         const libs3_types::error_details *error,
                                         void *callback_data)
            {
                store_and_log_status(status, error, "s3_multipart_upload::cancel_callback::on_response_completion",
                        *g_response_completion_saved_bucket_context, g_response_completion_result);
            } // end on_response_completion

        } // end namespace cancel_callback

    } // end namespace s3_multipart_upload

} // s3_mount::s3_transport
