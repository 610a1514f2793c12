#include <strata/service/config.h>

#include <strata/fs/file_io.h>
#include <strata/utilities/text.h>

namespace strata {

namespace {

[[noreturn]] void
throw_config_error(
    char const* expected, json_document const& value, char const* error)
{
    STRATA_THROW(
        parsing_error() << expected_format_info(expected)
                        << parsed_text_info(value.dump())
                        << parsing_error_info(error));
}

void
check_object(json_document const& value, char const* what)
{
    if (!value.is_object())
        throw_config_error(what, value, "expected a JSON object");
}

// Get the named field of :object, or null if it's absent or null.
json_document const*
find_field(json_document const& object, char const* name)
{
    auto i = object.find(name);
    if (i == object.end() || i->is_null())
        return nullptr;
    return &*i;
}

template<class Value>
Value
read_value(json_document const& value, char const* expected)
{
    try
    {
        return value.get<Value>();
    }
    catch (nlohmann::json::type_error& e)
    {
        throw_config_error(expected, value, e.what());
    }
}

void
read_field(json_document const& object, char const* name, string& field)
{
    if (auto const* value = find_field(object, name))
        field = read_value<string>(*value, "string");
}

void
read_field(
    json_document const& object, char const* name, optional<string>& field)
{
    if (auto const* value = find_field(object, name))
        field = read_value<string>(*value, "string");
}

void
read_field(json_document const& object, char const* name, integer& field)
{
    if (auto const* value = find_field(object, name))
    {
        if (!value->is_number_integer())
            throw_config_error("integer", *value, "expected an integer");
        field = read_value<integer>(*value, "integer");
    }
}

void
read_field(
    json_document const& object, char const* name, optional<integer>& field)
{
    integer x = 0;
    if (find_field(object, name))
    {
        read_field(object, name, x);
        field = x;
    }
}

// Durations are expressed in milliseconds.
void
read_field(
    json_document const& object,
    char const* name,
    std::chrono::milliseconds& field)
{
    integer x = 0;
    if (find_field(object, name))
    {
        read_field(object, name, x);
        field = std::chrono::milliseconds(x);
    }
}

void
read_sqlite_config(json_document const& object, sqlite_store_config& config)
{
    check_object(object, "sqlite config");
    read_field(object, "path", config.path);
}

void
read_blob_store_config(json_document const& object, blob_store_config& config)
{
    check_object(object, "blob store config");
    read_field(object, "table_prefix", config.table_prefix);
    read_field(
        object, "default_segment_length", config.default_segment_length);
    read_field(object, "metadata_cache_ttl", config.metadata_cache_ttl);
    read_field(object, "segment_cache_ttl", config.segment_cache_ttl);
    read_field(object, "sweep_interval", config.sweep_interval);
    read_field(object, "throttle_period", config.throttle_period);
}

void
read_logging_config(json_document const& object, logging_config& config)
{
    check_object(object, "logging config");
    read_field(object, "level", config.level);
    read_field(object, "log_file", config.log_file);
}

} // namespace

service_config
parse_service_config(
    json_document const& document, service_config const& defaults)
{
    check_object(document, "service config");
    service_config config = defaults;
    read_field(document, "io_concurrency", config.io_concurrency);
    if (config.io_concurrency && *config.io_concurrency <= 0)
    {
        throw_config_error(
            "positive integer",
            json_document(*config.io_concurrency),
            "io_concurrency must be positive");
    }
    if (auto const* sqlite = find_field(document, "sqlite"))
        read_sqlite_config(*sqlite, config.sqlite);
    if (auto const* blobs = find_field(document, "blobs"))
        read_blob_store_config(*blobs, config.blobs);
    if (auto const* logging = find_field(document, "logging"))
        read_logging_config(*logging, config.logging);
    return config;
}

service_config
parse_service_config(string const& json, service_config const& defaults)
{
    return parse_service_config(parse_json_document(json), defaults);
}

service_config
read_service_config(file_path const& path, service_config const& defaults)
{
    return parse_service_config(read_file_contents(path), defaults);
}

} // namespace strata
