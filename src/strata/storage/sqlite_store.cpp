#include <strata/storage/sqlite_store.h>

#include <cctype>
#include <filesystem>
#include <map>
#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <strata/utilities/logging.h>

namespace strata {

struct sqlite_table : backing_table
{
    sqlite_table(sqlite_store_impl& store, table_schema schema)
        : store_(store), schema_(std::move(schema))
    {
    }

    string const&
    name() const override
    {
        return schema_.name;
    }

    std::vector<table_row>
    select(
        std::vector<string> const& columns,
        std::vector<where_clause> const& where) override;

    void
    upsert(
        std::vector<column_assignment> const& assignments,
        std::vector<where_clause> const& where) override;

    void
    remove(std::vector<where_clause> const& where) override;

 private:
    column_schema const&
    find_column(string const& name) const;

    sqlite_store_impl& store_;
    table_schema schema_;
};

struct sqlite_store_impl
{
    string path;

    sqlite3* db = nullptr;

    // prepared statements, indexed by their SQL text
    std::map<string, sqlite3_stmt*> statements;

    std::map<string, std::unique_ptr<sqlite_table>> tables;

    // protects all access to the database
    std::mutex mutex;
};

// SQLITE UTILITIES

[[noreturn]] static void
throw_store_error(
    string const& table, string const& sql, string const& message)
{
    STRATA_THROW(
        backing_store_failure()
        << table_name_info(table) << sql_statement_info(sql)
        << internal_error_message_info(message));
}

static void
open_db(sqlite_store_impl& store)
{
    int code = sqlite3_open(store.path.c_str(), &store.db);
    if (code != SQLITE_OK)
    {
        // SQLite allocates a handle even when the open fails.
        sqlite3_close(store.db);
        store.db = nullptr;
        STRATA_THROW(
            backing_store_failure() << internal_error_message_info(
                "failed to open database " + store.path + ": "
                + sqlite3_errstr(code)));
    }
}

static string
copy_and_free_message(char* msg)
{
    if (msg)
    {
        string s = msg;
        sqlite3_free(msg);
        return s;
    }
    else
        return "";
}

static void
execute_sql(sqlite_store_impl const& store, string const& table, string const& sql)
{
    char* msg = nullptr;
    int code = sqlite3_exec(store.db, sql.c_str(), 0, 0, &msg);
    string error = copy_and_free_message(msg);
    if (code != SQLITE_OK)
        throw_store_error(table, sql, "error executing SQL: " + error);
}

// Check a return code from SQLite.
static void
check_sqlite_code(
    sqlite_store_impl const& store,
    string const& table,
    string const& sql,
    int code)
{
    if (code != SQLITE_OK)
    {
        throw_store_error(
            table, sql, string("SQLite error: ") + sqlite3_errmsg(store.db));
    }
}

// Get a prepared statement for :sql, creating it if necessary.
// The returned statement is always valid, reset and free of bindings.
static sqlite3_stmt*
prepare_statement(
    sqlite_store_impl& store, string const& table, string const& sql)
{
    auto cached = store.statements.find(sql);
    if (cached != store.statements.end())
    {
        // A failed step leaves an error code here, but the statement is
        // still usable.
        sqlite3_reset(cached->second);
        check_sqlite_code(
            store, table, sql, sqlite3_clear_bindings(cached->second));
        return cached->second;
    }

    sqlite3_stmt* statement;
    auto code = sqlite3_prepare_v2(
        store.db,
        sql.c_str(),
        boost::numeric_cast<int>(sql.length()),
        &statement,
        nullptr);
    if (code != SQLITE_OK)
    {
        throw_store_error(
            table,
            sql,
            string("error preparing SQL statement: ")
                + sqlite3_errmsg(store.db));
    }
    store.statements[sql] = statement;
    return statement;
}

static bool
cell_matches_type(cell const& value, column_type type)
{
    switch (type)
    {
        case column_type::INT:
        case column_type::BIGINT:
            return std::holds_alternative<integer>(value);
        case column_type::ASCII:
        case column_type::TEXT:
            return std::holds_alternative<string>(value);
        case column_type::BLOB:
            return std::holds_alternative<byte_vector>(value);
    }
    return false;
}

static char const*
sql_type_name(column_type type)
{
    switch (type)
    {
        case column_type::INT:
        case column_type::BIGINT:
            return "integer";
        case column_type::ASCII:
        case column_type::TEXT:
            return "text";
        case column_type::BLOB:
            return "blob";
    }
    STRATA_THROW(
        internal_check_failed()
        << internal_error_message_info("invalid column_type"));
}

// Bind a cell to a parameter of a prepared statement.
// :value must outlive the execution of the statement.
static void
bind_cell(
    sqlite_store_impl const& store,
    string const& table,
    string const& sql,
    sqlite3_stmt* statement,
    int parameter_index,
    cell const& value)
{
    int code;
    if (auto const* i = std::get_if<integer>(&value))
    {
        code = sqlite3_bind_int64(statement, parameter_index, *i);
    }
    else if (auto const* s = std::get_if<string>(&value))
    {
        code = sqlite3_bind_text64(
            statement,
            parameter_index,
            s->c_str(),
            s->size(),
            SQLITE_STATIC,
            SQLITE_UTF8);
    }
    else
    {
        auto const& bytes = std::get<byte_vector>(value);
        // A null data pointer would bind NULL rather than an empty blob.
        code = bytes.empty()
                   ? sqlite3_bind_zeroblob(statement, parameter_index, 0)
                   : sqlite3_bind_blob64(
                       statement,
                       parameter_index,
                       bytes.data(),
                       bytes.size(),
                       SQLITE_STATIC);
    }
    check_sqlite_code(store, table, sql, code);
}

static cell
read_cell(sqlite3_stmt* statement, int column_index, column_type type)
{
    switch (type)
    {
        case column_type::INT:
        case column_type::BIGINT:
            return integer(sqlite3_column_int64(statement, column_index));
        case column_type::ASCII:
        case column_type::TEXT: {
            auto const* text = reinterpret_cast<char const*>(
                sqlite3_column_text(statement, column_index));
            auto size = sqlite3_column_bytes(statement, column_index);
            return text ? string(text, size) : string();
        }
        case column_type::BLOB: {
            auto const* data = static_cast<std::uint8_t const*>(
                sqlite3_column_blob(statement, column_index));
            auto size = sqlite3_column_bytes(statement, column_index);
            return data ? byte_vector(data, data + size) : byte_vector();
        }
    }
    STRATA_THROW(
        internal_check_failed()
        << internal_error_message_info("invalid column_type"));
}

// Execute a prepared statement (with variables already bound to it) and check
// that it finished successfully.
// This should only be used for statements that don't return results.
static void
execute_prepared_statement(
    sqlite_store_impl const& store,
    string const& table,
    string const& sql,
    sqlite3_stmt* statement)
{
    auto code = sqlite3_step(statement);
    if (code != SQLITE_DONE)
    {
        throw_store_error(
            table,
            sql,
            string("SQL statement failed: ") + sqlite3_errmsg(store.db));
    }
    check_sqlite_code(store, table, sql, sqlite3_reset(statement));
}

// Execute a prepared query (with variables already bound to it), pass all
// the rows from the result set into the supplied callback, and check that the
// query finishes successfully.
template<class RowHandler>
static void
execute_prepared_query(
    sqlite_store_impl const& store,
    string const& table,
    string const& sql,
    sqlite3_stmt* statement,
    RowHandler const& row_handler)
{
    int code;
    while ((code = sqlite3_step(statement)) == SQLITE_ROW)
        row_handler(statement);
    if (code != SQLITE_DONE)
    {
        throw_store_error(
            table,
            sql,
            string("SQL query failed: ") + sqlite3_errmsg(store.db));
    }
    check_sqlite_code(store, table, sql, sqlite3_reset(statement));
}

// SQL GENERATION

static bool
is_valid_identifier(string const& id)
{
    if (id.empty() || std::isdigit(static_cast<unsigned char>(id[0])))
        return false;
    for (char c : id)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
            return false;
    }
    return true;
}

static string
quote_identifier(string const& id)
{
    return "\"" + id + "\"";
}

static string
parameter(int index)
{
    return "?" + std::to_string(index);
}

// Generate a where clause whose parameters start at :first_parameter.
static string
where_sql(std::vector<where_clause> const& where, int first_parameter)
{
    string sql;
    int index = first_parameter;
    for (auto const& clause : where)
    {
        sql += (index == first_parameter) ? " where " : " and ";
        sql += quote_identifier(clause.column) + " = " + parameter(index++);
    }
    return sql;
}

// SQLITE TABLE

column_schema const&
sqlite_table::find_column(string const& name) const
{
    for (auto const& column : schema_.columns)
    {
        if (column.name == name)
            return column;
    }
    throw_store_error(schema_.name, "", "unknown column: " + name);
}

std::vector<table_row>
sqlite_table::select(
    std::vector<string> const& columns, std::vector<where_clause> const& where)
{
    std::vector<column_schema> selected;
    if (columns.empty())
    {
        selected = schema_.columns;
    }
    else
    {
        for (auto const& column : columns)
            selected.push_back(find_column(column));
    }

    string sql = "select ";
    for (std::size_t i = 0; i != selected.size(); ++i)
    {
        if (i != 0)
            sql += ", ";
        sql += quote_identifier(selected[i].name);
    }
    sql += " from " + quote_identifier(schema_.name) + where_sql(where, 1);
    string order_by;
    for (auto const& column : schema_.columns)
    {
        if (column.role == column_role::CLUSTER_KEY)
        {
            order_by += order_by.empty() ? " order by " : ", ";
            order_by += quote_identifier(column.name);
        }
    }
    sql += order_by + ";";

    std::scoped_lock<std::mutex> lock(store_.mutex);
    auto* statement = prepare_statement(store_, schema_.name, sql);
    int index = 1;
    for (auto const& clause : where)
    {
        if (!cell_matches_type(clause.value, find_column(clause.column).type))
        {
            throw_store_error(
                schema_.name, sql, "type mismatch for column " + clause.column);
        }
        bind_cell(store_, schema_.name, sql, statement, index++, clause.value);
    }

    std::vector<table_row> rows;
    execute_prepared_query(
        store_, schema_.name, sql, statement, [&](sqlite3_stmt* result) {
            table_row row;
            for (std::size_t i = 0; i != selected.size(); ++i)
            {
                int column_index = boost::numeric_cast<int>(i);
                if (sqlite3_column_type(result, column_index) != SQLITE_NULL)
                {
                    row.emplace(
                        selected[i].name,
                        read_cell(result, column_index, selected[i].type));
                }
            }
            rows.push_back(std::move(row));
        });
    return rows;
}

void
sqlite_table::upsert(
    std::vector<column_assignment> const& assignments,
    std::vector<where_clause> const& where)
{
    auto key = primary_key_columns(schema_);
    if (key.empty())
        throw_store_error(schema_.name, "", "table has no primary key");
    if (where.size() != key.size())
    {
        throw_store_error(
            schema_.name, "", "upsert must specify every primary key column");
    }
    for (auto const& column : key)
    {
        bool found = false;
        for (auto const& clause : where)
        {
            if (clause.column == column.name)
                found = true;
        }
        if (!found)
        {
            throw_store_error(
                schema_.name, "", "upsert is missing key column " + column.name);
        }
    }

    string names, values;
    int index = 1;
    auto add_column = [&](string const& column) {
        if (index != 1)
        {
            names += ", ";
            values += ", ";
        }
        names += quote_identifier(column);
        values += parameter(index++);
    };
    for (auto const& clause : where)
        add_column(clause.column);
    for (auto const& assignment : assignments)
        add_column(assignment.column);

    string conflict_target;
    for (auto const& column : key)
    {
        if (!conflict_target.empty())
            conflict_target += ", ";
        conflict_target += quote_identifier(column.name);
    }
    string update;
    for (auto const& assignment : assignments)
    {
        update += update.empty() ? "update set " : ", ";
        auto column = quote_identifier(assignment.column);
        update += column + " = excluded." + column;
    }

    string sql = "insert into " + quote_identifier(schema_.name) + " ("
                 + names + ") values (" + values + ") on conflict ("
                 + conflict_target + ") do "
                 + (update.empty() ? string("nothing") : update) + ";";

    std::scoped_lock<std::mutex> lock(store_.mutex);
    auto* statement = prepare_statement(store_, schema_.name, sql);
    index = 1;
    auto bind = [&](string const& column, cell const& value) {
        if (!cell_matches_type(value, find_column(column).type))
        {
            throw_store_error(
                schema_.name, sql, "type mismatch for column " + column);
        }
        bind_cell(store_, schema_.name, sql, statement, index++, value);
    };
    for (auto const& clause : where)
        bind(clause.column, clause.value);
    for (auto const& assignment : assignments)
        bind(assignment.column, assignment.value);
    execute_prepared_statement(store_, schema_.name, sql, statement);
}

void
sqlite_table::remove(std::vector<where_clause> const& where)
{
    string sql
        = "delete from " + quote_identifier(schema_.name) + where_sql(where, 1)
          + ";";

    std::scoped_lock<std::mutex> lock(store_.mutex);
    auto* statement = prepare_statement(store_, schema_.name, sql);
    int index = 1;
    for (auto const& clause : where)
    {
        if (!cell_matches_type(clause.value, find_column(clause.column).type))
        {
            throw_store_error(
                schema_.name, sql, "type mismatch for column " + clause.column);
        }
        bind_cell(store_, schema_.name, sql, statement, index++, clause.value);
    }
    execute_prepared_statement(store_, schema_.name, sql, statement);
}

// SQLITE STORE

sqlite_store::sqlite_store(sqlite_store_config const& config)
    : impl_(new sqlite_store_impl)
{
    initialize_logging();

    impl_->path = config.path;
    if (config.path != ":memory:")
    {
        auto dir = std::filesystem::path(config.path).parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                STRATA_THROW(
                    backing_store_failure() << internal_error_message_info(
                        "failed to create database directory "
                        + dir.string() + ": " + ec.message()));
            }
        }
    }
    open_db(*impl_);

    spdlog::get("strata")->debug("opened SQLite store at {}", impl_->path);
}

sqlite_store::~sqlite_store()
{
    for (auto& [sql, statement] : impl_->statements)
        sqlite3_finalize(statement);
    if (impl_->db)
        sqlite3_close(impl_->db);
}

backing_table&
sqlite_store::provision_table(table_schema const& schema)
{
    if (!is_valid_identifier(schema.name))
        throw_store_error(schema.name, "", "invalid table name");
    for (auto const& column : schema.columns)
    {
        if (!is_valid_identifier(column.name))
            throw_store_error(schema.name, "", "invalid column name: " + column.name);
    }

    std::scoped_lock<std::mutex> lock(impl_->mutex);
    auto existing = impl_->tables.find(schema.name);
    if (existing != impl_->tables.end())
        return *existing->second;

    string sql = "create table if not exists " + quote_identifier(schema.name)
                 + " (";
    for (auto const& column : schema.columns)
    {
        sql += quote_identifier(column.name) + " "
               + sql_type_name(column.type) + ", ";
    }
    auto key = primary_key_columns(schema);
    if (key.empty())
    {
        // Drop the trailing separator.
        sql.resize(sql.size() - 2);
    }
    else
    {
        sql += "primary key (";
        for (std::size_t i = 0; i != key.size(); ++i)
        {
            if (i != 0)
                sql += ", ";
            sql += quote_identifier(key[i].name);
        }
        sql += ")";
    }
    sql += ");";
    execute_sql(*impl_, schema.name, sql);

    auto table = std::make_unique<sqlite_table>(*impl_, schema);
    auto& result = *table;
    impl_->tables.emplace(schema.name, std::move(table));

    spdlog::get("strata")->debug("provisioned table {}", schema.name);
    return result;
}

string const&
sqlite_store::path() const
{
    return impl_->path;
}

} // namespace strata
