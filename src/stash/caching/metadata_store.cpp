#include <stash/caching/metadata_store.hpp>

#include <chrono>
#include <mutex>
#include <ostream>

#include <boost/numeric/conversion/cast.hpp>

#include <sqlite3.h>

#include <stash/core/logging.hpp>
#include <stash/io/urls.hpp>

namespace stash {

bool
operator==(cache_record const& a, cache_record const& b)
{
    return a.path == b.path && a.last_modified == b.last_modified
           && a.etag == b.etag && a.expires == b.expires;
}
bool
operator!=(cache_record const& a, cache_record const& b)
{
    return !(a == b);
}

static void
write_optional_field(
    std::ostream& s, char const* name, optional<string> const& value)
{
    s << ", " << name << ": ";
    if (value)
        s << '"' << *value << '"';
    else
        s << "none";
}

std::ostream&
operator<<(std::ostream& s, cache_record const& record)
{
    s << "cache_record{path: \"" << record.path << '"';
    write_optional_field(s, "last_modified", record.last_modified);
    write_optional_field(s, "etag", record.etag);
    write_optional_field(s, "expires", record.expires);
    s << "}";
    return s;
}

struct metadata_store_impl
{
    file_path location;

    sqlite3* db = nullptr;

    // prepared statements
    sqlite3_stmt* database_version_query = nullptr;
    sqlite3_stmt* look_up_record_query = nullptr;
    sqlite3_stmt* write_record_statement = nullptr;

    // how long to wait for other connections to release their locks
    std::chrono::milliseconds busy_timeout;

    // Is there a transaction that hasn't been committed or rolled back yet?
    bool transaction_pending = false;

    // protects all access to the database connection
    std::mutex mutex;
};

// SQLITE UTILITIES

static void
throw_query_error(
    metadata_store_impl const& store, string const& sql, string const& error)
{
    STASH_THROW(
        metadata_store_failure()
        << metadata_store_path_info(store.location)
        << internal_error_message_info(
               "error executing SQL query\n"
               "SQL query: "
               + sql + "\n" + "error: " + error));
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

// Execute some SQL and report whether or not it succeeded (rather than
// throwing). This is for cleanup paths that have to keep going.
static bool
try_execute_sql(
    metadata_store_impl const& store, string const& sql, string& error)
{
    char* msg = nullptr;
    int code = sqlite3_exec(store.db, sql.c_str(), 0, 0, &msg);
    error = copy_and_free_message(msg);
    if (code != SQLITE_OK && error.empty())
        error = sqlite3_errstr(code);
    return code == SQLITE_OK;
}

static void
execute_sql(metadata_store_impl const& store, string const& sql)
{
    string error;
    if (!try_execute_sql(store, sql, error))
        throw_query_error(store, sql, error);
}

// Check a return code from SQLite.
static void
check_sqlite_code(metadata_store_impl const& store, int code)
{
    if (code != SQLITE_OK)
    {
        STASH_THROW(
            metadata_store_failure()
            << metadata_store_path_info(store.location)
            << internal_error_message_info(
                   string("SQLite error: ") + sqlite3_errstr(code)));
    }
}

// Create a prepared statement.
// This checks to make sure that the creation was successful, so the returned
// pointer is always valid.
static sqlite3_stmt*
prepare_statement(metadata_store_impl const& store, string const& sql)
{
    sqlite3_stmt* statement;
    auto code = sqlite3_prepare_v2(
        store.db,
        sql.c_str(),
        boost::numeric_cast<int>(sql.length()),
        &statement,
        nullptr);
    if (code != SQLITE_OK)
    {
        STASH_THROW(
            metadata_store_failure()
            << metadata_store_path_info(store.location)
            << internal_error_message_info(
                   "error preparing SQL query\n"
                   "SQL query: "
                   + sql
                   + "\n"
                     "error: "
                   + sqlite3_errmsg(store.db)));
    }
    return statement;
}

// Bind a string to a parameter of a prepared statement.
static void
bind_string(
    metadata_store_impl const& store,
    sqlite3_stmt* statement,
    int parameter_index,
    string const& value)
{
    check_sqlite_code(
        store,
        sqlite3_bind_text64(
            statement,
            parameter_index,
            value.c_str(),
            value.size(),
            SQLITE_STATIC,
            SQLITE_UTF8));
}

// Bind an optional string to a parameter of a prepared statement.
// If the string is absent, NULL is bound.
static void
bind_optional_string(
    metadata_store_impl const& store,
    sqlite3_stmt* statement,
    int parameter_index,
    optional<string> const& value)
{
    if (value)
        bind_string(store, statement, parameter_index, *value);
    else
    {
        check_sqlite_code(
            store, sqlite3_bind_null(statement, parameter_index));
    }
}

static void
throw_statement_error(
    metadata_store_impl const& store, sqlite3_stmt* statement, int code)
{
    // Resetting the statement makes it usable again. (It also returns the
    // error code again, which we already have.)
    sqlite3_reset(statement);
    STASH_THROW(
        metadata_store_failure()
        << metadata_store_path_info(store.location)
        << internal_error_message_info(
               string("SQL query failed\n") + "error: "
               + sqlite3_errstr(code)));
}

// Execute a prepared statement (with variables already bound to it) and check
// that it finished successfully.
// This should only be used for statements that don't return results.
static void
execute_prepared_statement(
    metadata_store_impl const& store, sqlite3_stmt* statement)
{
    auto code = sqlite3_step(statement);
    if (code != SQLITE_DONE)
        throw_statement_error(store, statement, code);
    check_sqlite_code(store, sqlite3_reset(statement));
}

struct sqlite_row
{
    sqlite3_stmt* statement;
};

static int
read_int32(sqlite_row& row, int column_index)
{
    return sqlite3_column_int(row.statement, column_index);
}

// A column value as it was stored, without any interpretation.
struct raw_column
{
    int type = SQLITE_NULL;
    string text;
};

static raw_column
read_raw_column(sqlite_row& row, int column_index)
{
    raw_column column;
    column.type = sqlite3_column_type(row.statement, column_index);
    if (column.type == SQLITE_TEXT)
    {
        column.text = string(
            reinterpret_cast<char const*>(
                sqlite3_column_text(row.statement, column_index)),
            sqlite3_column_bytes(row.statement, column_index));
    }
    return column;
}

// Execute a prepared statement (with variables already bound to it), pass all
// the rows from the result set into the supplied callback, and check that the
// query finishes successfully.
struct expected_column_count
{
    int value;
};
struct single_row_result
{
    bool value;
};
template<class RowHandler>
static void
execute_prepared_statement(
    metadata_store_impl const& store,
    sqlite3_stmt* statement,
    expected_column_count expected_columns,
    single_row_result single_row,
    RowHandler const& row_handler)
{
    int row_count = 0;
    int code;
    while (true)
    {
        code = sqlite3_step(statement);
        if (code == SQLITE_ROW)
        {
            if (sqlite3_column_count(statement) != expected_columns.value)
            {
                sqlite3_reset(statement);
                STASH_THROW(
                    metadata_store_failure()
                    << metadata_store_path_info(store.location)
                    << internal_error_message_info(string(
                           "SQL query result column count incorrect\n")));
            }
            sqlite_row row;
            row.statement = statement;
            row_handler(row);
            ++row_count;
        }
        else
        {
            break;
        }
    }
    if (code != SQLITE_DONE)
        throw_statement_error(store, statement, code);
    check_sqlite_code(store, sqlite3_reset(statement));
    if (single_row.value && row_count != 1)
    {
        STASH_THROW(
            metadata_store_failure()
            << metadata_store_path_info(store.location)
            << internal_error_message_info(
                   string("SQL query row count incorrect\n")));
    }
}

// Roll back the pending transaction.
// Failures are logged rather than thrown since this is always done in the
// course of cleaning up.
static void
roll_back(metadata_store_impl& store)
{
    store.transaction_pending = false;
    string error;
    if (try_execute_sql(store, "rollback;", error))
    {
        get_logger()->debug(
            "rolled back changes to {}", store.location.string());
    }
    else
    {
        get_logger()->warn(
            "failed to roll back changes to {}: {}",
            store.location.string(),
            error);
    }
}

// RECORDS

// Interpret an optional text column.
// Anything other than text or NULL is treated as absent.
static optional<string>
interpret_optional_column(
    string const& url, char const* column_name, raw_column const& column)
{
    switch (column.type)
    {
        case SQLITE_TEXT:
            return some(column.text);
        case SQLITE_NULL:
            return none;
        default:
            get_logger()->warn(
                "{} for {} contained a value of type {}; ignoring it",
                column_name,
                url,
                column.type);
            return none;
    }
}

// Does :path stay within the directory it's relative to?
static bool
is_contained_relative_path(string const& path)
{
    if (path.empty())
        return false;
    file_path relative(path);
    if (relative.has_root_path())
        return false;
    for (auto const& part : relative)
    {
        if (part == "..")
            return false;
    }
    return true;
}

// Get the record associated with a particular (normalized) URL (if any).
static optional<cache_record>
look_up_record(metadata_store_impl& store, string const& url)
{
    bool exists = false;
    raw_column path, last_modified, etag, expires;

    bind_string(store, store.look_up_record_query, 1, url);
    execute_prepared_statement(
        store,
        store.look_up_record_query,
        expected_column_count{4},
        single_row_result{false},
        [&](sqlite_row& row) {
            path = read_raw_column(row, 0);
            last_modified = read_raw_column(row, 1);
            etag = read_raw_column(row, 2);
            expires = read_raw_column(row, 3);
            exists = true;
        });

    if (!exists)
    {
        get_logger()->debug("no record for {}", url);
        return none;
    }

    if (path.type != SQLITE_TEXT || !is_contained_relative_path(path.text))
    {
        STASH_THROW(
            corrupt_cache_record()
            << cached_url_info(url) << column_name_info("path")
            << metadata_store_path_info(store.location));
    }

    cache_record record;
    record.path = std::move(path.text);
    record.last_modified
        = interpret_optional_column(url, "last_modified", last_modified);
    record.etag = interpret_optional_column(url, "etag", etag);
    record.expires = interpret_optional_column(url, "expires", expires);

    get_logger()->debug(
        "record for {}: path {}, etag {}, last modified {}",
        url,
        record.path,
        record.etag ? *record.etag : "(none)",
        record.last_modified ? *record.last_modified : "(none)");

    return record;
}

// SETUP

static file_path
canonicalize_location(file_path const& location)
{
    // The in-memory sentinel has no parent directory to canonicalize.
    if (location == ":memory:")
        return location;

    // The store file itself needn't exist, but its parent directory must.
    auto parent = location.parent_path();
    if (parent.empty())
        parent = ".";
    return std::filesystem::canonical(parent) / location.filename();
}

static void
open_db(metadata_store_impl& store)
{
    int code = sqlite3_open(store.location.string().c_str(), &store.db);
    if (code != SQLITE_OK)
    {
        string message = store.db ? sqlite3_errmsg(store.db)
                                  : sqlite3_errstr(code);
        sqlite3_close(store.db);
        store.db = nullptr;
        STASH_THROW(
            metadata_store_failure()
            << metadata_store_path_info(store.location)
            << internal_error_message_info(
                   "failed to open metadata store: " + message));
    }
}

static void
shut_down(metadata_store_impl& store)
{
    if (store.db)
    {
        sqlite3_finalize(store.database_version_query);
        sqlite3_finalize(store.look_up_record_query);
        sqlite3_finalize(store.write_record_statement);
        store.database_version_query = nullptr;
        store.look_up_record_query = nullptr;
        store.write_record_statement = nullptr;
        sqlite3_close(store.db);
        store.db = nullptr;
    }
}

// Open (or create) the database and verify that the version number is what
// we expect.
static void
open_and_check_db(metadata_store_impl& store)
{
    int const expected_database_version = 1;

    open_db(store);

    // Wait for other connections that are writing to the same file rather
    // than failing right away.
    check_sqlite_code(
        store,
        sqlite3_busy_timeout(
            store.db, boost::numeric_cast<int>(store.busy_timeout.count())));

    // Get the version number embedded in the database.
    store.database_version_query
        = prepare_statement(store, "pragma user_version;");
    int database_version = 0;
    execute_prepared_statement(
        store,
        store.database_version_query,
        expected_column_count{1},
        single_row_result{true},
        [&](sqlite_row& row) { database_version = read_int32(row, 0); });

    // A database_version of 0 indicates a fresh database, so initialize it.
    if (database_version == 0)
    {
        get_logger()->debug(
            "initializing metadata store schema in {}",
            store.location.string());
        execute_sql(
            store,
            "begin;"
            " create table if not exists urls("
            " url text not null unique,"
            " path text not null,"
            " last_modified text,"
            " etag text,"
            " expires text);"
            " pragma user_version = "
                + std::to_string(expected_database_version)
                + ";"
                  " commit;");
    }
    // If we find a database from a different version, abort.
    else if (database_version != expected_database_version)
    {
        STASH_THROW(
            metadata_store_failure()
            << metadata_store_path_info(store.location)
            << internal_error_message_info(
                   "incompatible database version: "
                   + std::to_string(database_version)));
    }
}

static void
initialize(
    metadata_store_impl& store,
    file_path const& location,
    std::chrono::milliseconds busy_timeout)
{
    store.busy_timeout = busy_timeout;

    try
    {
        store.location = canonicalize_location(location);
    }
    catch (std::filesystem::filesystem_error& e)
    {
        STASH_THROW(
            metadata_store_init_failure()
            << metadata_store_path_info(location)
            << internal_error_message_info(e.what()));
    }

    get_logger()->debug(
        "opening metadata store in {}", store.location.string());

    try
    {
        open_and_check_db(store);

        // Initialize our prepared statements.
        store.look_up_record_query = prepare_statement(
            store,
            "select path, last_modified, etag, expires"
            " from urls where url=?1;");
        store.write_record_statement = prepare_statement(
            store,
            "insert or replace into urls"
            " (url, path, last_modified, etag, expires)"
            " values (?1, ?2, ?3, ?4, ?5);");
    }
    catch (metadata_store_failure& e)
    {
        shut_down(store);
        STASH_THROW(
            metadata_store_init_failure()
            << metadata_store_path_info(store.location)
            << internal_error_message_info(get_error_message(e)));
    }
}

// TRANSACTIONS

metadata_transaction::metadata_transaction(metadata_store_impl& store)
    : store_(&store)
{
}

metadata_transaction::metadata_transaction(metadata_transaction&& other)
    : store_(other.store_), finished_(other.finished_)
{
    other.store_ = nullptr;
}

metadata_transaction::~metadata_transaction()
{
    if (!store_ || finished_)
        return;

    auto& store = *store_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    get_logger()->debug("transaction abandoned without commit");
    roll_back(store);
}

void
metadata_transaction::commit()
{
    if (!store_ || finished_)
    {
        STASH_THROW(
            internal_check_failed() << internal_error_message_info(
                "metadata transaction committed twice"));
    }

    auto& store = *store_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    finished_ = true;
    store.transaction_pending = false;

    string error;
    if (!try_execute_sql(store, "commit;", error))
    {
        get_logger()->debug("failed to commit changes: {}", error);
        // Report the original failure, even if the rollback fails too.
        roll_back(store);
        throw_query_error(store, "commit;", error);
    }

    get_logger()->debug("committed changes to {}", store.location.string());
}

// API

metadata_store::metadata_store(file_path const& location)
    : metadata_store(location, std::chrono::seconds(10))
{
}

metadata_store::metadata_store(
    file_path const& location, std::chrono::milliseconds busy_timeout)
    : impl_(new metadata_store_impl)
{
    initialize(*impl_, location, busy_timeout);
}

metadata_store::~metadata_store()
{
    shut_down(*impl_);
}

file_path const&
metadata_store::location() const
{
    return impl_->location;
}

optional<cache_record>
metadata_store::find(string const& url)
{
    auto key = normalize_url(url);

    auto& store = *this->impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    return look_up_record(store, key);
}

cache_record
metadata_store::look_up(string const& url)
{
    auto record = this->find(url);
    if (!record)
    {
        STASH_THROW(
            url_not_in_cache() << cached_url_info(normalize_url(url))
                               << metadata_store_path_info(impl_->location));
    }
    return std::move(*record);
}

metadata_transaction
metadata_store::begin_write(string const& url, cache_record const& record)
{
    auto key = normalize_url(url);

    auto& store = *this->impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    if (store.transaction_pending)
    {
        STASH_THROW(
            internal_check_failed() << internal_error_message_info(
                "metadata transaction begun while another is pending"));
    }

    get_logger()->debug("writing {} for {}", record.path, key);

    execute_sql(store, "begin;");
    store.transaction_pending = true;
    try
    {
        auto* statement = store.write_record_statement;
        bind_string(store, statement, 1, key);
        bind_string(store, statement, 2, record.path);
        bind_optional_string(store, statement, 3, record.last_modified);
        bind_optional_string(store, statement, 4, record.etag);
        bind_optional_string(store, statement, 5, record.expires);
        execute_prepared_statement(store, statement);
    }
    catch (metadata_store_failure&)
    {
        roll_back(store);
        throw;
    }

    return metadata_transaction(store);
}

bool
operator==(metadata_store const& a, metadata_store const& b)
{
    return a.location() == b.location();
}
bool
operator!=(metadata_store const& a, metadata_store const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, metadata_store const& store)
{
    s << "metadata_store{" << store.location().string() << "}";
    return s;
}

} // namespace stash
