#include <strata/storage/sqlite_store.h>

#include <strata/fs/utilities.h>
#include <strata/utilities/testing.h>

using namespace strata;

namespace {

table_schema
make_test_schema()
{
    return table_schema{
        .name = "readings",
        .columns = {
            {"station", column_type::ASCII, column_role::PARTITION_KEY},
            {"seq", column_type::INT, column_role::CLUSTER_KEY},
            {"label", column_type::TEXT},
            {"payload", column_type::BLOB},
            {"total", column_type::BIGINT}}};
}

} // namespace

TEST_CASE("SQLite store upserts and selects", "[storage][sqlite]")
{
    sqlite_store store;
    REQUIRE(store.path() == ":memory:");
    auto& table = store.provision_table(make_test_schema());
    REQUIRE(table.name() == "readings");

    // Provisioning again returns the same table.
    REQUIRE(&store.provision_table(make_test_schema()) == &table);

    table.upsert(
        {{"label", string("second")},
         {"payload", byte_vector{4, 5}},
         {"total", integer(1) << 40}},
        {{"station", string("north")}, {"seq", integer(2)}});
    table.upsert(
        {{"label", string("first")}, {"payload", byte_vector{1, 2, 3}}},
        {{"station", string("north")}, {"seq", integer(1)}});
    table.upsert(
        {{"label", string("elsewhere")}},
        {{"station", string("south")}, {"seq", integer(1)}});

    auto rows = table.select({}, {{"station", string("north")}});
    REQUIRE(rows.size() == 2);
    // Rows come back in cluster key order.
    REQUIRE(get_integer_cell(rows[0], "seq") == 1);
    REQUIRE(get_string_cell(rows[0], "label") == "first");
    REQUIRE(get_blob_cell(rows[0], "payload") == byte_vector{1, 2, 3});
    // Columns that were never written are absent.
    REQUIRE(rows[0].find("total") == rows[0].end());
    REQUIRE(get_integer_cell(rows[1], "seq") == 2);
    REQUIRE(get_integer_cell(rows[1], "total") == integer(1) << 40);

    auto label = table.select_one(
        {"label"}, {{"station", string("south")}, {"seq", integer(1)}});
    REQUIRE(label);
    REQUIRE(label->size() == 1);
    REQUIRE(get_string_cell(*label, "label") == "elsewhere");

    REQUIRE(!table.select_one(
        {"label"}, {{"station", string("east")}, {"seq", integer(1)}}));
}

TEST_CASE("SQLite store upserts are idempotent", "[storage][sqlite]")
{
    sqlite_store store;
    auto& table = store.provision_table(make_test_schema());

    for (int i = 0; i != 3; ++i)
    {
        table.upsert(
            {{"label", string("same")}},
            {{"station", string("west")}, {"seq", integer(7)}});
    }
    REQUIRE(table.select({}, {{"station", string("west")}}).size() == 1);

    // Updating only some columns leaves the others alone.
    table.upsert(
        {{"payload", byte_vector{9}}},
        {{"station", string("west")}, {"seq", integer(7)}});
    auto row = table.select_one({}, {{"station", string("west")}});
    REQUIRE(row);
    REQUIRE(get_string_cell(*row, "label") == "same");
    REQUIRE(get_blob_cell(*row, "payload") == byte_vector{9});
}

TEST_CASE("SQLite store stores empty blobs", "[storage][sqlite]")
{
    sqlite_store store;
    auto& table = store.provision_table(make_test_schema());
    table.upsert(
        {{"payload", byte_vector()}},
        {{"station", string("empty")}, {"seq", integer(0)}});
    auto row = table.select_one({"payload"}, {{"station", string("empty")}});
    REQUIRE(row);
    REQUIRE(get_blob_cell(*row, "payload").empty());
}

TEST_CASE("SQLite store removes rows", "[storage][sqlite]")
{
    sqlite_store store;
    auto& table = store.provision_table(make_test_schema());
    for (integer i = 0; i != 4; ++i)
    {
        table.upsert(
            {{"label", string("x")}},
            {{"station", string("north")}, {"seq", i}});
    }

    table.remove({{"station", string("north")}, {"seq", integer(2)}});
    auto rows = table.select({"seq"}, {{"station", string("north")}});
    REQUIRE(rows.size() == 3);
    REQUIRE(get_integer_cell(rows[2], "seq") == 3);

    table.remove({{"station", string("north")}});
    REQUIRE(table.select({}, {{"station", string("north")}}).empty());
}

TEST_CASE("SQLite store rejects bad requests", "[storage][sqlite]")
{
    sqlite_store store;
    auto& table = store.provision_table(make_test_schema());

    // unknown columns
    REQUIRE_THROWS_AS(
        table.select({"bogus"}, {{"station", string("north")}}),
        backing_store_failure);
    REQUIRE_THROWS_AS(
        table.select({}, {{"bogus", string("north")}}), backing_store_failure);

    // type mismatches
    REQUIRE_THROWS_AS(
        table.select({}, {{"station", integer(1)}}), backing_store_failure);

    // an incomplete primary key
    REQUIRE_THROWS_AS(
        table.upsert(
            {{"label", string("x")}}, {{"station", string("north")}}),
        backing_store_failure);

    // invalid identifiers
    REQUIRE_THROWS_AS(
        store.provision_table(table_schema{
            .name = "bad name",
            .columns
            = {{"id", column_type::INT, column_role::PARTITION_KEY}}}),
        backing_store_failure);

    // The table is still usable after a failure.
    table.upsert(
        {{"label", string("ok")}},
        {{"station", string("north")}, {"seq", integer(1)}});
    REQUIRE(table.select({}, {{"station", string("north")}}).size() == 1);
}

TEST_CASE("SQLite store persists to disk", "[storage][sqlite]")
{
    reset_directory("sqlite_store_test");
    auto path = string("sqlite_store_test/nested/store.db");

    {
        sqlite_store store(sqlite_store_config{.path = path});
        auto& table = store.provision_table(make_test_schema());
        table.upsert(
            {{"label", string("durable")}},
            {{"station", string("north")}, {"seq", integer(1)}});
    }
    {
        sqlite_store store(sqlite_store_config{.path = path});
        auto& table = store.provision_table(make_test_schema());
        auto row = table.select_one({"label"}, {{"station", string("north")}});
        REQUIRE(row);
        REQUIRE(get_string_cell(*row, "label") == "durable");
    }
}
