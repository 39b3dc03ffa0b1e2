#include "s3_mount/fs/error_metadata.hpp"

namespace s3_mount::fs
{

    namespace
    {
        template <typename T>
        void fill_if_absent(std::optional<T>& _field, const std::optional<T>& _other)
        {
            if (!_field && _other) {
                _field = _other;
            }
        }
    } // namespace

    error_metadata& error_metadata::merge(const error_metadata& _other)
    {
        fill_if_absent(error_code, _other.error_code);
        fill_if_absent(s3_object_key, _other.s3_object_key);
        fill_if_absent(s3_bucket_name, _other.s3_bucket_name);
        fill_if_absent(client_error_meta.http_code, _other.client_error_meta.http_code);
        fill_if_absent(client_error_meta.error_code, _other.client_error_meta.error_code);
        fill_if_absent(client_error_meta.error_message, _other.client_error_meta.error_message);

        return *this;
    }

    bool error_metadata::empty() const noexcept
    {
        return !error_code && !s3_object_key && !s3_bucket_name &&
               !client_error_meta.http_code && !client_error_meta.error_code && !client_error_meta.error_message;
    }

} // s3_mount::fs
