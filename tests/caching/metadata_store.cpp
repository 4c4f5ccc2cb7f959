#include <stash/caching/metadata_store.hpp>

#include <chrono>
#include <fstream>
#include <sstream>
#include <vector>

#include <sqlite3.h>

#include <stash/fs/utilities.hpp>
#include <stash/io/urls.hpp>
#include <stash/utilities/testing.hpp>

using namespace stash;

namespace {

// Get a fresh (empty) directory to hold a store for a test case.
file_path
make_store_dir(string const& name)
{
    file_path dir = file_path("metadata_store") / name;
    reset_directory(dir);
    return std::filesystem::absolute(dir);
}

// Run some SQL directly against the database file at :path, bypassing the
// store.
void
execute_raw_sql(file_path const& path, string const& sql)
{
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    char* error = nullptr;
    int code = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    string message = error ? error : "";
    sqlite3_free(error);
    sqlite3_close(db);
    INFO(message);
    REQUIRE(code == SQLITE_OK);
}

// Get the names of all tables in the database file at :path.
std::vector<string>
get_table_names(file_path const& path)
{
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    sqlite3_stmt* statement = nullptr;
    REQUIRE(
        sqlite3_prepare_v2(
            db,
            "select name from sqlite_master where type = 'table';",
            -1,
            &statement,
            nullptr)
        == SQLITE_OK);
    std::vector<string> names;
    while (sqlite3_step(statement) == SQLITE_ROW)
    {
        names.push_back(reinterpret_cast<char const*>(
            sqlite3_column_text(statement, 0)));
    }
    sqlite3_finalize(statement);
    sqlite3_close(db);
    return names;
}

cache_record
make_record(
    string path,
    optional<string> last_modified = none,
    optional<string> etag = none,
    optional<string> expires = none)
{
    return cache_record{
        std::move(path),
        std::move(last_modified),
        std::move(etag),
        std::move(expires)};
}

} // namespace

TEST_CASE("fresh metadata store", "[caching][metadata_store]")
{
    auto dir = make_store_dir("fresh");
    auto path = dir / "cache.db";

    {
        metadata_store store(path);
        REQUIRE(
            store.location()
            == std::filesystem::canonical(dir) / "cache.db");
        REQUIRE(store.find("http://example.com/") == none);
    }

    REQUIRE(get_table_names(path) == std::vector<string>{"urls"});
}

TEST_CASE("in-memory metadata store", "[caching][metadata_store]")
{
    metadata_store store(":memory:");
    REQUIRE(store.location() == file_path(":memory:"));
    REQUIRE(store.find("http://example.com/") == none);

    auto record = make_record("path/to/data");
    store.begin_write("http://example.com/", record).commit();
    REQUIRE(store.look_up("http://example.com/") == record);
}

TEST_CASE("reopened metadata store", "[caching][metadata_store]")
{
    auto dir = make_store_dir("reopened");
    auto path = dir / "cache.db";

    auto record = make_record("content/abc", some(string("x")));
    {
        metadata_store store(path);
        store.begin_write("http://example.com/", record).commit();
    }
    {
        metadata_store store(path);
        REQUIRE(store.look_up("http://example.com/") == record);
    }
    REQUIRE(get_table_names(path) == std::vector<string>{"urls"});
}

TEST_CASE("metadata store in a missing directory", "[caching][metadata_store]")
{
    try
    {
        metadata_store store("does/not/exist/cache.db");
        FAIL("no exception thrown");
    }
    catch (metadata_store_init_failure& e)
    {
        get_required_error_info<metadata_store_path_info>(e);
        get_required_error_info<internal_error_message_info>(e);
    }
}

TEST_CASE("metadata store that isn't a database", "[caching][metadata_store]")
{
    auto dir = make_store_dir("not_a_database");
    auto path = dir / "cache.db";
    {
        std::ofstream out(path, std::ios::binary);
        out << string(4096, 'x');
    }
    REQUIRE_THROWS_AS(metadata_store(path), metadata_store_init_failure);
}

TEST_CASE(
    "metadata store with an incompatible version", "[caching][metadata_store]")
{
    auto dir = make_store_dir("incompatible");
    auto path = dir / "cache.db";
    execute_raw_sql(path, "pragma user_version = 2;");
    REQUIRE_THROWS_AS(metadata_store(path), metadata_store_init_failure);
    // The file is left alone.
    REQUIRE(exists(path));
}

TEST_CASE("unknown URLs", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    store.begin_write("http://example.com/one", make_record("path/to/data"))
        .commit();

    REQUIRE(store.find("http://example.com/two") == none);
    try
    {
        store.look_up("http://example.com/two");
        FAIL("no exception thrown");
    }
    catch (url_not_in_cache& e)
    {
        REQUIRE(
            get_required_error_info<cached_url_info>(e)
            == "http://example.com/two");
    }
}

TEST_CASE("records with validators", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto record = make_record(
        "path/to/data",
        some(string("Thu, 01 Jan 1970 00:00:00 GMT")),
        some(string("some-etag")),
        some(string("Fri, 02 Jan 1970 00:00:00 GMT")));
    store.begin_write("http://example.com/", record).commit();

    REQUIRE(store.find("http://example.com/") == some(record));
}

TEST_CASE("records with an invalid path", "[caching][metadata_store]")
{
    auto dir = make_store_dir("invalid_path");
    auto path = dir / "cache.db";

    metadata_store store(path);
    execute_raw_sql(
        path,
        "insert into urls (url, path, last_modified, etag, expires)"
        " values ('http://example.com/', cast('abc' as blob),"
        " null, null, null);");

    try
    {
        store.find("http://example.com/");
        FAIL("no exception thrown");
    }
    catch (corrupt_cache_record& e)
    {
        REQUIRE(get_required_error_info<column_name_info>(e) == "path");
        REQUIRE(
            get_required_error_info<cached_url_info>(e)
            == "http://example.com/");
    }

    // The store is still usable afterwards.
    auto record = make_record("content/fixed");
    store.begin_write("http://example.com/", record).commit();
    REQUIRE(store.look_up("http://example.com/") == record);
}

TEST_CASE(
    "records with paths outside the cache", "[caching][metadata_store]")
{
    auto dir = make_store_dir("outside_paths");
    auto path = dir / "cache.db";

    metadata_store store(path);
    for (string planted :
         {"/etc/hostname", "../outside", "content/../../outside", ""})
    {
        INFO(planted);
        execute_raw_sql(
            path,
            "insert or replace into urls (url, path)"
            " values ('http://example.com/', '"
                + planted + "');");
        try
        {
            store.find("http://example.com/");
            FAIL("no exception thrown");
        }
        catch (corrupt_cache_record& e)
        {
            REQUIRE(get_required_error_info<column_name_info>(e) == "path");
        }
    }

    // Dots that aren't path components are fine.
    execute_raw_sql(
        path,
        "insert or replace into urls (url, path)"
        " values ('http://example.com/', 'content/..abc');");
    REQUIRE(
        store.look_up("http://example.com/") == make_record("content/..abc"));
}

TEST_CASE("records with invalid validators", "[caching][metadata_store]")
{
    auto dir = make_store_dir("invalid_validators");
    auto path = dir / "cache.db";

    metadata_store store(path);
    execute_raw_sql(
        path,
        "insert into urls (url, path, last_modified, etag, expires)"
        " values ('http://example.com/', 'path/to/data',"
        " cast('abc' as blob), cast('def' as blob), cast('ghi' as blob));");

    // Validators that aren't text are treated as absent.
    REQUIRE(
        store.look_up("http://example.com/") == make_record("path/to/data"));
}

TEST_CASE("fragments in lookups", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto record = make_record("path/to/data");
    store.begin_write("http://example.com/", record).commit();

    REQUIRE(store.look_up("http://example.com/#top") == record);
}

TEST_CASE("fragments in writes", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto record_one
        = make_record("path/to/data/one", none, some(string("one")));
    auto record_two
        = make_record("path/to/data/two", none, some(string("two")));

    store.begin_write("http://example.com/#frag", record_one).commit();
    store.begin_write("http://example.com/", record_two).commit();

    // Any fragment (or none) gets the same record.
    REQUIRE(store.look_up("http://example.com/#frag") == record_two);
    REQUIRE(store.look_up("http://example.com/#garf") == record_two);
    REQUIRE(store.look_up("http://example.com/") == record_two);

    store.begin_write("http://example.com/#boop", record_one).commit();

    REQUIRE(store.look_up("http://example.com/#frag") == record_one);
    REQUIRE(store.look_up("http://example.com/#garf") == record_one);
    REQUIRE(store.look_up("http://example.com/") == record_one);
}

TEST_CASE("uncommitted writes", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    {
        auto transaction = store.begin_write(
            "http://example.com/", make_record("path/to/data"));
        // Don't commit before the end of the block!
    }

    REQUIRE(store.find("http://example.com/") == none);

    // Since the transaction was rolled back, new ones can be started.
    auto record = make_record("path/to/other/data");
    store.begin_write("http://example.com/", record).commit();
    REQUIRE(store.look_up("http://example.com/") == record);
}

TEST_CASE("pending writes", "[caching][metadata_store]")
{
    auto dir = make_store_dir("pending");
    auto path = dir / "cache.db";

    metadata_store writer(path);
    metadata_store reader(path);

    auto record = make_record("content/abc");
    auto transaction = writer.begin_write("http://example.com/", record);

    // The store doing the writing sees the pending record, but other stores
    // don't.
    REQUIRE(writer.find("http://example.com/") == some(record));
    REQUIRE(reader.find("http://example.com/") == none);

    transaction.commit();
    REQUIRE(writer.find("http://example.com/") == some(record));
    REQUIRE(reader.find("http://example.com/") == some(record));
}

TEST_CASE("failed commits", "[caching][metadata_store]")
{
    auto dir = make_store_dir("failed_commit");
    auto path = dir / "cache.db";

    metadata_store store(path, std::chrono::milliseconds(100));

    auto original = make_record("content/original");
    store.begin_write("http://example.com/", original).commit();

    // Hold a read lock on the database from another connection, in the middle
    // of a query, so that the commit can't finish.
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    sqlite3_stmt* statement = nullptr;
    REQUIRE(
        sqlite3_prepare_v2(
            db, "select url from urls;", -1, &statement, nullptr)
        == SQLITE_OK);
    REQUIRE(sqlite3_step(statement) == SQLITE_ROW);

    auto transaction = store.begin_write(
        "http://example.com/", make_record("content/replacement"));
    try
    {
        transaction.commit();
        FAIL("no exception thrown");
    }
    catch (metadata_store_failure& e)
    {
        REQUIRE(
            get_required_error_info<metadata_store_path_info>(e)
            == store.location());
        get_required_error_info<internal_error_message_info>(e);
    }

    sqlite3_finalize(statement);
    sqlite3_close(db);

    // The failed write was rolled back.
    REQUIRE(store.look_up("http://example.com/") == original);
    metadata_store other(path);
    REQUIRE(other.look_up("http://example.com/") == original);

    // The transaction is finished, and the store can take new ones.
    REQUIRE_THROWS_AS(transaction.commit(), internal_check_failed);
    auto replacement = make_record("content/replacement");
    store.begin_write("http://example.com/", replacement).commit();
    REQUIRE(other.look_up("http://example.com/") == replacement);
}

TEST_CASE("uncommitted overwrites", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto original = make_record("path/to/data/one");
    store.begin_write("http://example.com/", original).commit();

    {
        auto transaction = store.begin_write(
            "http://example.com/", make_record("path/to/data/two"));
    }

    REQUIRE(store.look_up("http://example.com/") == original);
}

TEST_CASE("overwritten records", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto record_one
        = make_record("path/to/data/one", none, some(string("one")));
    auto record_two
        = make_record("path/to/data/two", none, some(string("two")));

    store.begin_write("http://example.com/", record_one).commit();
    REQUIRE(store.look_up("http://example.com/") == record_one);

    store.begin_write("http://example.com/", record_two).commit();
    REQUIRE(store.look_up("http://example.com/") == record_two);
}

TEST_CASE("concurrent transactions", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto transaction = store.begin_write(
        "http://example.com/one", make_record("path/to/data/one"));
    REQUIRE_THROWS_AS(
        (void) store.begin_write(
            "http://example.com/two", make_record("path/to/data/two")),
        internal_check_failed);

    transaction.commit();
    REQUIRE(store.find("http://example.com/one") != none);
    REQUIRE(store.find("http://example.com/two") == none);
}

TEST_CASE("transaction commits", "[caching][metadata_store]")
{
    metadata_store store(":memory:");

    auto record = make_record("path/to/data");
    auto transaction = store.begin_write("http://example.com/", record);

    // Moving a transaction transfers the responsibility for committing it.
    auto moved = std::move(transaction);
    REQUIRE_THROWS_AS(transaction.commit(), internal_check_failed);

    moved.commit();
    REQUIRE(store.look_up("http://example.com/") == record);

    REQUIRE_THROWS_AS(moved.commit(), internal_check_failed);
}

TEST_CASE("metadata store equality", "[caching][metadata_store]")
{
    auto dir = make_store_dir("equality");

    metadata_store a(dir / "cache.db");
    metadata_store b(dir / "cache.db");
    metadata_store c(dir / "cache-2.db");

    REQUIRE(a == b);
    REQUIRE(a != c);

    // Relative paths refer to the same store as their absolute forms.
    metadata_store d(std::filesystem::relative(dir) / "." / "cache.db");
    REQUIRE(a == d);
}

TEST_CASE("metadata store output", "[caching][metadata_store]")
{
    auto dir = make_store_dir("output");
    metadata_store store(dir / "cache.db");

    std::ostringstream s;
    s << store;
    REQUIRE(s.str() == "metadata_store{" + store.location().string() + "}");
}

TEST_CASE("cache record output", "[caching][metadata_store]")
{
    std::ostringstream s;
    s << make_record("content/abc", none, some(string("\"xyz\"")));
    REQUIRE(
        s.str()
        == "cache_record{path: \"content/abc\", last_modified: none, "
           "etag: \"\"xyz\"\", expires: none}");
}
