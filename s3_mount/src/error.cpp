#include "s3_mount/fs/error.hpp"
#include "s3_mount/fs/inode_error.hpp"
#include "s3_mount/upload/upload_error.hpp"

#include <utility>

namespace s3_mount::fs
{

    namespace log = irods::experimental::log;

    namespace
    {
        std::string append_source(std::string _description, std::exception_ptr _source)
        {
            if (_source) {
                _description += ": ";
                _description += describe_error_chain(_source);
            }

            return _description;
        }
    } // namespace

    std::string describe_error_chain(std::exception_ptr _error)
    {
        if (!_error) {
            return {};
        }

        try {
            std::rethrow_exception(_error);
        }
        catch (const error& e) {
            return e.what();
        }
        catch (const upload::upload_error& e) {
            return append_source(e.what(), e.source());
        }
        catch (const inode_error& e) {
            return append_source(e.what(), e.source());
        }
        catch (const std::exception& e) {
            std::string description = e.what();

            try {
                std::rethrow_if_nested(e);
            }
            catch (const std::exception&) {
                description = append_source(std::move(description), std::current_exception());
            }

            return description;
        }
        catch (...) {
            return "unknown exception";
        }
    } // describe_error_chain

    error::error(int _errno,
                 std::string _message,
                 std::exception_ptr _source,
                 log::level _level,
                 error_metadata _metadata)
        : errno_{_errno}
        , message_{std::move(_message)}
        , source_{std::move(_source)}
        , level_{_level}
        , metadata_{std::move(_metadata)}
        , display_{append_source(message_, source_)}
    {
    }

    error_builder::error_builder(int _errno, std::string _message)
        : errno_{_errno}
        , message_{std::move(_message)}
        , source_{}
        , level_{log::level::warn}
        , metadata_{}
    {
    }

    error_builder& error_builder::source(std::exception_ptr _source)
    {
        source_ = std::move(_source);
        return *this;
    }

    error_builder& error_builder::level(log::level _level)
    {
        level_ = _level;
        return *this;
    }

    error_builder& error_builder::metadata(error_metadata _metadata)
    {
        metadata_ = std::move(_metadata);
        return *this;
    }

    error error_builder::build() const
    {
        return {errno_, message_, source_, level_, metadata_};
    }

    error to_error(const upload::upload_error& _error)
    {
        return error_builder{_error.to_errno(), "upload error"}
            .source(_error)
            .metadata(_error.meta())
            .build();
    }

    error to_error(const inode_error& _error)
    {
        return error_builder{_error.to_errno(), "inode error"}
            .source(_error)
            .metadata(_error.meta())
            .build();
    }

} // s3_mount::fs
