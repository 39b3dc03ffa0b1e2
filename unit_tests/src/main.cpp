#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "s3_mount/logging_category.hpp"
#include "s3_mount/s3_transport/logging_category.hpp"

#include <irods/irods_logger.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <iostream>
#include <optional>
#include <string>

extern std::string keyfile;
extern std::string hostname;

namespace
{
    namespace log = irods::experimental::log;

    std::optional<log::level> to_level(const std::string& _name)
    {
        if (boost::iequals(_name, "trace"))    { return log::level::trace; }
        if (boost::iequals(_name, "debug"))    { return log::level::debug; }
        if (boost::iequals(_name, "info"))     { return log::level::info; }
        if (boost::iequals(_name, "warn"))     { return log::level::warn; }
        if (boost::iequals(_name, "error"))    { return log::level::error; }
        if (boost::iequals(_name, "critical")) { return log::level::critical; }
        return std::nullopt;
    }
} // namespace

int main( int argc, char* argv[] )
{
  Catch::Session session; // There must be exactly one instance

  std::string log_level = "critical";

  // Build a new parser on top of Catch's
  using namespace Catch::clara;
  auto cli
    = session.cli() // Get Catch's composite command line parser
    | Opt( hostname, "hostname" )
        ["--hostname"]
        ("the S3 host for the [s3_object_client] tests (default: s3.amazonaws.com)")
    | Opt( keyfile, "keyfile" )
        ["--keyfile"]
        ("the file holding the access key and secret access key")
    | Opt( log_level, "level" )
        ["--log-level"]
        ("level for the s3_mount loggers: trace, debug, info, warn, error, critical (default: critical)");

  // Now pass the new composite back to Catch so it uses that
  session.cli( cli );

  int returnCode = session.applyCommandLine( argc, argv );
  if( returnCode != 0 ) // Indicates a command line error
        return returnCode;

  const auto level = to_level(log_level);
  if (!level) {
      std::cerr << "invalid log level: " << log_level << '\n';
      return 1;
  }

  // write log records to stdout instead of syslog
  log::init(true);
  log::logger<s3_transport_logging_category>::set_level(*level);
  log::logger<s3_mount_logging_category>::set_level(*level);
  log::logger<fs_event_logging_category>::set_level(*level);

  int numFailed = session.run();

  // numFailed is clamped to 255 as some unices only use the lower 8 bits.
  return numFailed;
}
