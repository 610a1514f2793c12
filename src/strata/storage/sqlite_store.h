#ifndef STRATA_STORAGE_SQLITE_STORE_H
#define STRATA_STORAGE_SQLITE_STORE_H

#include <memory>

#include <strata/storage/backing_store.h>

namespace strata {

// A backing store implemented on top of a single SQLite database.
//
// Each provisioned table maps to an SQLite table whose primary key is the
// schema's partition-key columns followed by its cluster-key columns.
//
// The store is internally protected by a mutex, so it (and its tables) can be
// used concurrently from multiple threads.

struct sqlite_store_config
{
    // the path to the database file, or ":memory:" for a private in-memory
    // database
    string path = ":memory:";
};

struct sqlite_store_impl;

struct sqlite_store : backing_store, noncopyable
{
    // Open (or create) the database described by :config.
    // Throws backing_store_failure if the database can't be opened.
    explicit sqlite_store(sqlite_store_config const& config = {});

    ~sqlite_store();

    backing_table&
    provision_table(table_schema const& schema) override;

    string const&
    path() const;

 private:
    std::unique_ptr<sqlite_store_impl> impl_;
};

} // namespace strata

#endif
