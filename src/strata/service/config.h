#ifndef STRATA_SERVICE_CONFIG_H
#define STRATA_SERVICE_CONFIG_H

#include <strata/blobs/types.hpp>
#include <strata/encodings/json.h>
#include <strata/fs/types.hpp>
#include <strata/storage/sqlite_store.h>
#include <strata/utilities/logging.h>

namespace strata {

struct service_config
{
    // how many threads to use for backing store I/O -
    // The default is one thread for each processor core.
    optional<integer> io_concurrency;

    sqlite_store_config sqlite;

    blob_store_config blobs;

    logging_config logging;
};

// Parse a service config from a JSON document.
//
// The document is an object whose fields are all optional:
//
//   {
//     "io_concurrency": 4,
//     "sqlite": { "path": "/var/lib/strata/strata.db" },
//     "blobs": {
//       "table_prefix": "",
//       "default_segment_length": 1048576,
//       "metadata_cache_ttl": 60000,
//       "segment_cache_ttl": 20000,
//       "sweep_interval": 30000,
//       "throttle_period": 1000
//     },
//     "logging": { "level": "info", "log_file": "strata.log" }
//   }
//
// Durations are given in milliseconds. Unknown fields are ignored. A field
// with the wrong type (or a non-positive io_concurrency) results in a
// parsing_error.
//
// Fields that are absent from the document take their values from
// :defaults.
service_config
parse_service_config(
    json_document const& document,
    service_config const& defaults = service_config());

service_config
parse_service_config(
    string const& json, service_config const& defaults = service_config());

// Read a service config from a JSON file.
service_config
read_service_config(
    file_path const& path, service_config const& defaults = service_config());

} // namespace strata

#endif
