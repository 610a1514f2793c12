#ifndef STRATA_STORAGE_MOCK_STORE_H
#define STRATA_STORAGE_MOCK_STORE_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include <strata/storage/backing_store.h>

namespace strata {

// An in-memory backing store for testing.
//
// Reads and writes can be made to fail on demand, and every table keeps
// counts of the operations performed on it, so tests can observe when (and
// how often) the caches in front of the store actually reach it.

struct mock_store;

struct mock_table : backing_table
{
    mock_table(mock_store& store, table_schema schema);

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

    // the number of rows currently stored in the table
    std::size_t
    row_count() const;

    // operation counts (including failed operations)
    int
    select_count() const
    {
        return select_count_;
    }
    int
    upsert_count() const
    {
        return upsert_count_;
    }
    int
    remove_count() const
    {
        return remove_count_;
    }

 private:
    void
    check_columns(std::vector<string> const& columns) const;

    mock_store& store_;
    table_schema schema_;
    std::vector<column_schema> key_;

    // rows, indexed by their primary key values (in key column order)
    std::map<std::vector<cell>, table_row> rows_;

    std::atomic<int> select_count_ = 0;
    std::atomic<int> upsert_count_ = 0;
    std::atomic<int> remove_count_ = 0;

    // protects :rows_
    mutable std::mutex mutex_;
};

struct mock_store : backing_store, noncopyable
{
    backing_table&
    provision_table(table_schema const& schema) override;

    // Get a previously provisioned table.
    // Throws backing_store_failure if no such table exists.
    mock_table&
    get_table(string const& name);

    // While set, every select() fails with backing_store_failure.
    void
    fail_reads(bool fail)
    {
        fail_reads_ = fail;
    }

    // While set, every upsert() and remove() fails with
    // backing_store_failure.
    void
    fail_writes(bool fail)
    {
        fail_writes_ = fail;
    }

    // Call :hook (with the table name) at the start of every upsert() and
    // remove(), before any injected failure. This lets tests act in the
    // middle of a write. It should be set before the store is shared with
    // other threads.
    void
    on_write(std::function<void(string const& table)> hook)
    {
        write_hook_ = std::move(hook);
    }

 private:
    friend struct mock_table;

    std::atomic<bool> fail_reads_ = false;
    std::atomic<bool> fail_writes_ = false;
    std::function<void(string const& table)> write_hook_;

    std::map<string, std::unique_ptr<mock_table>> tables_;

    // protects :tables_
    std::mutex mutex_;
};

} // namespace strata

#endif
