#include <cachet/caching/sqlite_blob_store.hpp>

#include <filesystem>
#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <sqlite3.h>

#include <cachet/fs/app_dirs.hpp>

namespace cachet {

bool
operator==(
    sqlite_blob_store_config const& a, sqlite_blob_store_config const& b)
{
    return a.directory == b.directory && a.file_name == b.file_name;
}

struct sqlite_blob_store_impl
{
    file_path path;

    sqlite3* db = nullptr;

    // prepared statements
    sqlite3_stmt* database_version_query = nullptr;
    sqlite3_stmt* write_blob_statement = nullptr;
    sqlite3_stmt* remove_blob_statement = nullptr;
    sqlite3_stmt* look_up_blob_query = nullptr;
    sqlite3_stmt* blob_list_query = nullptr;
    sqlite3_stmt* key_list_query = nullptr;
    sqlite3_stmt* summary_query = nullptr;

    // protects all access to the store
    std::mutex mutex;
};

// SQLITE UTILITIES

static void
open_db(sqlite_blob_store_impl& store)
{
    if (sqlite3_open(store.path.string().c_str(), &store.db) != SQLITE_OK)
    {
        CACHET_THROW(
            blob_store_failure()
            << blob_store_path_info(store.path)
            << internal_error_message_info(
                   "failed to open database file: "
                   + string(sqlite3_errmsg(store.db))));
    }
}

static void
throw_query_error(
    sqlite_blob_store_impl const& store, string const& sql, string const& error)
{
    CACHET_THROW(
        blob_store_failure()
        << blob_store_path_info(store.path)
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

static void
execute_sql(sqlite_blob_store_impl const& store, string const& sql)
{
    char* msg = nullptr;
    int code = sqlite3_exec(store.db, sql.c_str(), 0, 0, &msg);
    string error = copy_and_free_message(msg);
    if (code != SQLITE_OK)
        throw_query_error(store, sql, error);
}

// Check a return code from SQLite.
static void
check_sqlite_code(sqlite_blob_store_impl const& store, int code)
{
    if (code != SQLITE_OK)
    {
        CACHET_THROW(
            blob_store_failure()
            << blob_store_path_info(store.path)
            << internal_error_message_info(
                   string("SQLite error: ") + sqlite3_errstr(code)));
    }
}

// Create a prepared statement.
// This checks to make sure that the creation was successful, so the returned
// pointer is always valid.
static sqlite3_stmt*
prepare_statement(sqlite_blob_store_impl const& store, string const& sql)
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
        CACHET_THROW(
            blob_store_failure()
            << blob_store_path_info(store.path)
            << internal_error_message_info(
                   "error preparing SQL query\n"
                   "SQL query: "
                   + sql
                   + "\n"
                     "error: "
                   + sqlite3_errstr(code)));
    }
    return statement;
}

// Bind a string to a parameter of a prepared statement.
static void
bind_string(
    sqlite_blob_store_impl const& store,
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

// Bind a blob to a parameter of a prepared statement.
static void
bind_blob(
    sqlite_blob_store_impl const& store,
    sqlite3_stmt* statement,
    int parameter_index,
    string const& value)
{
    check_sqlite_code(
        store,
        sqlite3_bind_blob64(
            statement,
            parameter_index,
            value.data(),
            value.size(),
            SQLITE_STATIC));
}

// Execute a prepared statement (with variables already bound to it) and check
// that it finished successfully.
// This should only be used for statements that don't return results.
static void
execute_prepared_statement(
    sqlite_blob_store_impl const& store, sqlite3_stmt* statement)
{
    auto code = sqlite3_step(statement);
    // Reset the statement whether or not the step succeeded, so that it's
    // ready for the next use.
    sqlite3_reset(statement);
    if (code != SQLITE_DONE)
    {
        CACHET_THROW(
            blob_store_failure() << blob_store_path_info(store.path)
                                 << internal_error_message_info(
                                        string("SQL query failed\n")
                                        + "error: " + sqlite3_errstr(code)));
    }
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

static int64_t
read_int64(sqlite_row& row, int column_index)
{
    return sqlite3_column_int64(row.statement, column_index);
}

static string
read_string(sqlite_row& row, int column_index)
{
    auto text = sqlite3_column_text(row.statement, column_index);
    auto size = sqlite3_column_bytes(row.statement, column_index);
    return text ? string(reinterpret_cast<char const*>(text), size) : string();
}

static string
read_blob(sqlite_row& row, int column_index)
{
    // The blob pointer must be requested before the size.
    auto data = sqlite3_column_blob(row.statement, column_index);
    auto size = sqlite3_column_bytes(row.statement, column_index);
    return data ? string(reinterpret_cast<char const*>(data), size) : string();
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
    sqlite_blob_store_impl const& store,
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
                CACHET_THROW(
                    blob_store_failure()
                    << blob_store_path_info(store.path)
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
    sqlite3_reset(statement);
    if (code != SQLITE_DONE)
    {
        CACHET_THROW(
            blob_store_failure() << blob_store_path_info(store.path)
                                 << internal_error_message_info(
                                        string("SQL query failed\n")
                                        + "error: " + sqlite3_errstr(code)));
    }
    if (single_row.value && row_count != 1)
    {
        CACHET_THROW(
            blob_store_failure() << blob_store_path_info(store.path)
                                 << internal_error_message_info(string(
                                        "SQL query row count incorrect\n")));
    }
}

static void
shut_down(sqlite_blob_store_impl& store)
{
    if (store.db)
    {
        sqlite3_finalize(store.database_version_query);
        sqlite3_finalize(store.write_blob_statement);
        sqlite3_finalize(store.remove_blob_statement);
        sqlite3_finalize(store.look_up_blob_query);
        sqlite3_finalize(store.blob_list_query);
        sqlite3_finalize(store.key_list_query);
        sqlite3_finalize(store.summary_query);
        store.database_version_query = nullptr;
        store.write_blob_statement = nullptr;
        store.remove_blob_statement = nullptr;
        store.look_up_blob_query = nullptr;
        store.blob_list_query = nullptr;
        store.key_list_query = nullptr;
        store.summary_query = nullptr;
        sqlite3_close(store.db);
        store.db = nullptr;
    }
}

// Open (or create) the database file and verify that the version number is
// what we expect.
static void
open_and_check_db(sqlite_blob_store_impl& store)
{
    int const expected_database_version = 1;

    open_db(store);

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
        execute_sql(
            store,
            "create table blobs("
            " key text primary key not null,"
            " value blob not null,"
            " updated_at datetime);");
        execute_sql(
            store,
            "pragma user_version = "
                + lexical_cast<string>(expected_database_version) + ";");
    }
    // If we find a database from a different version, abort.
    else if (database_version != expected_database_version)
    {
        CACHET_THROW(
            blob_store_failure()
            << blob_store_path_info(store.path)
            << internal_error_message_info("incompatible database"));
    }
}

static void
initialize(sqlite_blob_store_impl& store, sqlite_blob_store_config const& config)
{
    file_path dir = config.directory ? file_path(*config.directory)
                                     : get_user_cache_dir("cachet");
    // Create the directory if it doesn't exist.
    if (!exists(dir))
        create_directories(dir);

    store.path = dir / config.file_name;

    // Open the database file.
    try
    {
        open_and_check_db(store);
    }
    catch (blob_store_failure&)
    {
        // If the first attempt fails, we may have an incompatible or corrupt
        // database, so shut everything down, discard the file, and try
        // again.
        shut_down(store);
        std::filesystem::remove(store.path);
        open_and_check_db(store);
    }

    // Set various performance tuning flags.
    execute_sql(store, "pragma synchronous = normal;");
    execute_sql(store, "pragma journal_mode = wal;");

    // Initialize our prepared statements.
    store.write_blob_statement = prepare_statement(
        store,
        "insert or replace into blobs(key, value, updated_at)"
        " values(?1, ?2, strftime('%Y-%m-%d %H:%M:%f', 'now'));");
    store.remove_blob_statement
        = prepare_statement(store, "delete from blobs where key=?1;");
    store.look_up_blob_query
        = prepare_statement(store, "select value from blobs where key=?1;");
    store.blob_list_query = prepare_statement(
        store, "select key, value from blobs order by key;");
    store.key_list_query
        = prepare_statement(store, "select key from blobs order by key;");
    store.summary_query = prepare_statement(
        store, "select count(key), coalesce(sum(length(value)), 0) from blobs;");
}

// API

sqlite_blob_store::sqlite_blob_store(sqlite_blob_store_config const& config)
    : impl_(new sqlite_blob_store_impl)
{
    try
    {
        initialize(*impl_, config);
    }
    catch (...)
    {
        shut_down(*impl_);
        throw;
    }
}

sqlite_blob_store::~sqlite_blob_store()
{
    shut_down(*impl_);
}

std::vector<std::pair<string, string>>
sqlite_blob_store::read_all()
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    std::vector<std::pair<string, string>> blobs;
    execute_prepared_statement(
        store,
        store.blob_list_query,
        expected_column_count{2},
        single_row_result{false},
        [&](sqlite_row& row) {
            blobs.emplace_back(read_string(row, 0), read_blob(row, 1));
        });
    return blobs;
}

std::vector<string>
sqlite_blob_store::list_keys()
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    std::vector<string> keys;
    execute_prepared_statement(
        store,
        store.key_list_query,
        expected_column_count{1},
        single_row_result{false},
        [&](sqlite_row& row) { keys.push_back(read_string(row, 0)); });
    return keys;
}

void
sqlite_blob_store::write(string const& key, string const& blob)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    bind_string(store, store.write_blob_statement, 1, key);
    bind_blob(store, store.write_blob_statement, 2, blob);
    execute_prepared_statement(store, store.write_blob_statement);
}

void
sqlite_blob_store::remove(string const& key)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    bind_string(store, store.remove_blob_statement, 1, key);
    execute_prepared_statement(store, store.remove_blob_statement);
}

optional<string>
sqlite_blob_store::find(string const& key)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    optional<string> blob;
    bind_string(store, store.look_up_blob_query, 1, key);
    execute_prepared_statement(
        store,
        store.look_up_blob_query,
        expected_column_count{1},
        single_row_result{false},
        [&](sqlite_row& row) { blob = read_blob(row, 0); });
    return blob;
}

sqlite_blob_store_info
sqlite_blob_store::get_summary_info()
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);

    sqlite_blob_store_info info;
    info.path = store.path.string();
    execute_prepared_statement(
        store,
        store.summary_query,
        expected_column_count{2},
        single_row_result{true},
        [&](sqlite_row& row) {
            info.entry_count = read_int64(row, 0);
            info.total_size = read_int64(row, 1);
        });
    return info;
}

} // namespace cachet
