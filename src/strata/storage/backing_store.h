#ifndef STRATA_STORAGE_BACKING_STORE_H
#define STRATA_STORAGE_BACKING_STORE_H

#include <map>
#include <variant>
#include <vector>

#include <strata/core.h>
#include <strata/utilities/errors.h>

// A backing store is the durable, table-oriented storage behind the blob
// stores. Tables are addressed by a primary key made up of partition-key and
// cluster-key columns; rows with the same partition key are returned in
// cluster-key order.
//
// All operations are synchronous and report failures by throwing
// backing_store_failure. Callers that need asynchronous access run these
// calls on an I/O thread pool.

namespace strata {

// This exception indicates a failure in the operation of a backing store.
STRATA_DEFINE_EXCEPTION(backing_store_failure)
// This provides the name of the table involved.
STRATA_DEFINE_ERROR_INFO(string, table_name)
// This provides the SQL statement involved (if any).
STRATA_DEFINE_ERROR_INFO(string, sql_statement)
// This exception also provides internal_error_message_info.

enum class column_type
{
    ASCII,
    INT,
    BIGINT,
    TEXT,
    BLOB
};

enum class column_role
{
    PARTITION_KEY,
    CLUSTER_KEY,
    DATA
};

struct column_schema
{
    string name;
    column_type type;
    column_role role = column_role::DATA;
};

struct table_schema
{
    string name;
    std::vector<column_schema> columns;
};

// Get the primary key columns of :schema (partition keys, then cluster keys).
std::vector<column_schema>
primary_key_columns(table_schema const& schema);

// A cell holds a single column value. ASCII and TEXT columns are strings,
// INT and BIGINT columns are integers and BLOB columns are byte vectors.
typedef std::variant<integer, string, byte_vector> cell;

typedef std::map<string, cell> table_row;

// an equality condition on a single column
struct where_clause
{
    string column;
    cell value;
};

struct column_assignment
{
    string column;
    cell value;
};

struct table_reader
{
    virtual ~table_reader() = default;

    // Select the given columns from all rows matching every clause in
    // :where, ordered by cluster key.
    virtual std::vector<table_row>
    select(
        std::vector<string> const& columns,
        std::vector<where_clause> const& where)
        = 0;

    // Select the given columns from the (first) row matching :where.
    optional<table_row>
    select_one(
        std::vector<string> const& columns,
        std::vector<where_clause> const& where)
    {
        auto rows = select(columns, where);
        if (rows.empty())
            return none;
        return std::move(rows.front());
    }
};

struct table_writer
{
    virtual ~table_writer() = default;

    // Write :assignments into the row identified by :where, creating it if
    // necessary. :where must name every primary key column.
    virtual void
    upsert(
        std::vector<column_assignment> const& assignments,
        std::vector<where_clause> const& where)
        = 0;

    // Delete all rows matching :where.
    virtual void
    remove(std::vector<where_clause> const& where) = 0;
};

struct backing_table : table_reader, table_writer
{
    virtual string const&
    name() const = 0;
};

struct backing_store
{
    virtual ~backing_store() = default;

    // Create the table described by :schema (if it doesn't already exist)
    // and return a handle to it.
    // The returned reference remains valid for the lifetime of the store.
    virtual backing_table&
    provision_table(table_schema const& schema) = 0;
};

// Get the value of a required column from a row.
// Throws backing_store_failure if the column is missing or has the wrong
// type.
integer
get_integer_cell(table_row const& row, string const& column);
string
get_string_cell(table_row const& row, string const& column);
byte_vector
get_blob_cell(table_row const& row, string const& column);

} // namespace strata

#endif
