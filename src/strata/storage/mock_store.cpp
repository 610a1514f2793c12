#include <strata/storage/mock_store.h>

#include <algorithm>

namespace strata {

mock_table::mock_table(mock_store& store, table_schema schema)
    : store_(store),
      schema_(std::move(schema)),
      key_(primary_key_columns(schema_))
{
}

void
mock_table::check_columns(std::vector<string> const& columns) const
{
    for (auto const& name : columns)
    {
        bool found = false;
        for (auto const& column : schema_.columns)
        {
            if (column.name == name)
                found = true;
        }
        if (!found)
        {
            STRATA_THROW(
                backing_store_failure()
                << table_name_info(schema_.name)
                << internal_error_message_info("unknown column: " + name));
        }
    }
}

static bool
row_matches(table_row const& row, std::vector<where_clause> const& where)
{
    for (auto const& clause : where)
    {
        auto i = row.find(clause.column);
        if (i == row.end() || i->second != clause.value)
            return false;
    }
    return true;
}

std::vector<table_row>
mock_table::select(
    std::vector<string> const& columns, std::vector<where_clause> const& where)
{
    ++select_count_;
    if (store_.fail_reads_)
    {
        STRATA_THROW(
            backing_store_failure()
            << table_name_info(schema_.name)
            << internal_error_message_info("simulated read failure"));
    }
    check_columns(columns);

    std::scoped_lock<std::mutex> lock(mutex_);
    std::vector<table_row> results;
    for (auto const& [key, row] : rows_)
    {
        if (!row_matches(row, where))
            continue;
        if (columns.empty())
        {
            results.push_back(row);
        }
        else
        {
            table_row projected;
            for (auto const& column : columns)
            {
                auto i = row.find(column);
                if (i != row.end())
                    projected.insert(*i);
            }
            results.push_back(std::move(projected));
        }
    }
    return results;
}

void
mock_table::upsert(
    std::vector<column_assignment> const& assignments,
    std::vector<where_clause> const& where)
{
    ++upsert_count_;
    if (store_.write_hook_)
        store_.write_hook_(schema_.name);
    if (store_.fail_writes_)
    {
        STRATA_THROW(
            backing_store_failure()
            << table_name_info(schema_.name)
            << internal_error_message_info("simulated write failure"));
    }

    std::vector<cell> key;
    for (auto const& column : key_)
    {
        auto clause = std::find_if(
            where.begin(), where.end(), [&](where_clause const& c) {
                return c.column == column.name;
            });
        if (clause == where.end())
        {
            STRATA_THROW(
                backing_store_failure()
                << table_name_info(schema_.name)
                << internal_error_message_info(
                       "upsert is missing key column " + column.name));
        }
        key.push_back(clause->value);
    }

    std::scoped_lock<std::mutex> lock(mutex_);
    auto& row = rows_[key];
    for (auto const& clause : where)
        row[clause.column] = clause.value;
    for (auto const& assignment : assignments)
        row[assignment.column] = assignment.value;
}

void
mock_table::remove(std::vector<where_clause> const& where)
{
    ++remove_count_;
    if (store_.write_hook_)
        store_.write_hook_(schema_.name);
    if (store_.fail_writes_)
    {
        STRATA_THROW(
            backing_store_failure()
            << table_name_info(schema_.name)
            << internal_error_message_info("simulated write failure"));
    }

    std::scoped_lock<std::mutex> lock(mutex_);
    std::erase_if(rows_, [&](auto const& entry) {
        return row_matches(entry.second, where);
    });
}

std::size_t
mock_table::row_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return rows_.size();
}

backing_table&
mock_store::provision_table(table_schema const& schema)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    auto& table = tables_[schema.name];
    if (!table)
        table = std::make_unique<mock_table>(*this, schema);
    return *table;
}

mock_table&
mock_store::get_table(string const& name)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    auto i = tables_.find(name);
    if (i == tables_.end())
    {
        STRATA_THROW(
            backing_store_failure() << table_name_info(name)
                                    << internal_error_message_info(
                                           "table hasn't been provisioned"));
    }
    return *i->second;
}

} // namespace strata
