#include <strata/storage/backing_store.h>

namespace strata {

std::vector<column_schema>
primary_key_columns(table_schema const& schema)
{
    std::vector<column_schema> key;
    for (auto const& column : schema.columns)
    {
        if (column.role == column_role::PARTITION_KEY)
            key.push_back(column);
    }
    for (auto const& column : schema.columns)
    {
        if (column.role == column_role::CLUSTER_KEY)
            key.push_back(column);
    }
    return key;
}

template<class Value>
static Value const&
get_cell(table_row const& row, string const& column, char const* type_name)
{
    auto i = row.find(column);
    if (i == row.end())
    {
        STRATA_THROW(
            backing_store_failure() << internal_error_message_info(
                "missing column in result row: " + column));
    }
    auto const* value = std::get_if<Value>(&i->second);
    if (!value)
    {
        STRATA_THROW(
            backing_store_failure() << internal_error_message_info(
                "column " + column + " is not of type " + type_name));
    }
    return *value;
}

integer
get_integer_cell(table_row const& row, string const& column)
{
    return get_cell<integer>(row, column, "integer");
}

string
get_string_cell(table_row const& row, string const& column)
{
    return get_cell<string>(row, column, "string");
}

byte_vector
get_blob_cell(table_row const& row, string const& column)
{
    return get_cell<byte_vector>(row, column, "blob");
}

} // namespace strata
