#include "cpanbridge/handlers/DatabaseHandler.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"
#include "cpanbridge/protocol/Json.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

constexpr int kBusyTimeoutMs = 5000;

// Shared by a connection and its statements so the database outlives every
// statement compiled against it.
struct SqliteDatabase {
    sqlite3* db{nullptr};

    ~SqliteDatabase() {
        if (db != nullptr) {
            sqlite3_close_v2(db);
        }
    }
};

struct ConnectionState final : NativeState {
    std::shared_ptr<SqliteDatabase> database;
    std::string dsn;
    std::string username;
    std::string path;
    bool auto_commit{true};
    std::string last_error;
    int last_errno{0};

    sqlite3* db() const { return database->db; }
};

struct StatementState final : NativeState {
    std::shared_ptr<SqliteDatabase> database;
    sqlite3_stmt* stmt{nullptr};
    std::string sql;
    bool executed{false};
    bool row_pending{false};
    std::map<std::string, Value> inout_params;
    std::string last_error;
    int last_errno{0};

    ~StatementState() override {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
    }
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

// Accepts "dbi:SQLite:dbname=<path>[;attr=...]", "dbi:SQLite:<path>", or a
// bare path. Other DBI drivers are rejected.
std::string database_path_from_dsn(const std::string& dsn) {
    std::string rest = dsn;
    if (lowercase(dsn.substr(0, 4)) == "dbi:") {
        const auto colon = dsn.find(':', 4);
        const std::string driver = dsn.substr(4, colon == std::string::npos ? std::string::npos : colon - 4);
        if (lowercase(driver) != "sqlite") {
            throw_validation_error("Unsupported database driver: " + driver);
        }
        rest = colon == std::string::npos ? std::string{} : dsn.substr(colon + 1);
    }

    std::string path = rest;
    std::size_t start = 0;
    while (start <= rest.size()) {
        const auto end = rest.find(';', start);
        const std::string part = rest.substr(start, end == std::string::npos ? std::string::npos : end - start);
        const auto eq = part.find('=');
        if (eq != std::string::npos) {
            const auto key = lowercase(part.substr(0, eq));
            if (key == "dbname" || key == "database" || key == "db") {
                path = part.substr(eq + 1);
                break;
            }
        } else if (start == 0) {
            path = part;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    if (path.empty()) {
        throw_validation_error("DSN does not name a database: " + dsn);
    }
    return path;
}

Value column_value(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return Value(static_cast<std::int64_t>(sqlite3_column_int64(stmt, index)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt, index));
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return Value(std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, index))));
        }
        case SQLITE_BLOB: {
            const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, index));
            const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, index));
            return Value(blob ? std::string(blob, size) : std::string{});
        }
        default:
            return Value{};
    }
}

int bind_value(sqlite3_stmt* stmt, int index, const Value& value) {
    switch (value.type()) {
        case Json::nullValue:
            return sqlite3_bind_null(stmt, index);
        case Json::booleanValue:
            return sqlite3_bind_int(stmt, index, value.asBool() ? 1 : 0);
        case Json::intValue:
            return sqlite3_bind_int64(stmt, index, value.asInt64());
        case Json::uintValue:
            if (!value.isInt64()) {
                return sqlite3_bind_double(stmt, index, value.asDouble());
            }
            return sqlite3_bind_int64(stmt, index, value.asInt64());
        case Json::realValue:
            return sqlite3_bind_double(stmt, index, value.asDouble());
        case Json::stringValue: {
            const auto text = value.asString();
            return sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        case Json::objectValue:
        case Json::arrayValue: {
            const auto text = protocol::to_json(value);
            return sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
    }
    return SQLITE_MISUSE;
}

// Resolves ":name", "@name", "$name", "name" or a 1-based position.
int parameter_index(sqlite3_stmt* stmt, const std::string& name) {
    if (!name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::stoi(name);
    }
    if (!name.empty() && (name.front() == ':' || name.front() == '@' || name.front() == '$')) {
        return sqlite3_bind_parameter_index(stmt, name.c_str());
    }
    for (const char prefix : {':', '@', '$'}) {
        if (const int index = sqlite3_bind_parameter_index(stmt, (prefix + name).c_str()); index > 0) {
            return index;
        }
    }
    return 0;
}

// bind_params entries are either plain values or {"value": v, ...} records.
const Value& bound_value(const Value& entry) {
    if (entry.isObject()) {
        if (const auto* inner = find_member(entry, "value")) {
            return *inner;
        }
    }
    return entry;
}

Value column_info(sqlite3_stmt* stmt) {
    const int count = sqlite3_column_count(stmt);
    Value info(Json::objectValue);
    info["count"] = Value(count);
    info["names"] = Value(Json::arrayValue);
    auto& names = info["names"];
    info["types"] = Value(Json::arrayValue);
    auto& types = info["types"];
    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        names.append(std::string(name ? name : ""));
        const char* declared = sqlite3_column_decltype(stmt, i);
        types.append(declared ? Value(std::string(declared)) : Value{});
    }
    return info;
}

Value current_row(sqlite3_stmt* stmt, bool as_hash) {
    const int count = sqlite3_column_count(stmt);
    Value row = as_hash ? Value(Json::objectValue) : Value(Json::arrayValue);
    for (int i = 0; i < count; ++i) {
        if (as_hash) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name ? name : std::to_string(i)] = column_value(stmt, i);
        } else {
            row.append(column_value(stmt, i));
        }
    }
    return row;
}

bool wants_hash(const Value& params) {
    const auto format = lowercase(params::string_or(params, "format", "array"));
    if (format != "array" && format != "hash") {
        throw_validation_error("Parameter 'format' must be 'array' or 'hash'");
    }
    return format == "hash";
}

}  // namespace

class DatabaseHandler::Impl {
public:
    using Operation = Value (Impl::*)(const Value&, HandlerContext&);

    Impl() {
        operations_ = {
            {"connect", &Impl::connect},
            {"connect_cached", &Impl::connect_cached},
            {"disconnect", &Impl::disconnect},
            {"ping", &Impl::ping},
            {"prepare", &Impl::prepare},
            {"execute_statement", &Impl::execute_statement},
            {"fetch_row", &Impl::fetch_row},
            {"fetch_all", &Impl::fetch_all},
            {"finish_statement", &Impl::finish_statement},
            {"execute_immediate", &Impl::execute_immediate},
            {"begin_transaction", &Impl::begin_transaction},
            {"commit", &Impl::commit},
            {"rollback", &Impl::rollback},
            {"bind_param_inout", &Impl::bind_param_inout},
            {"get_out_params", &Impl::get_out_params},
            {"get_connection_error", &Impl::get_connection_error},
            {"get_statement_error", &Impl::get_statement_error},
        };
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& [name, _] : operations_) {
            result.push_back(name);
        }
        return result;
    }

    Value invoke(const std::string& function, const Value& params, HandlerContext& context) {
        const auto it = operations_.find(function);
        if (it == operations_.end()) {
            throw_validation_error("Unknown database function: " + function);
        }
        return (this->*(it->second))(params, context);
    }

private:
    struct StatementAccess {
        HandlePtr connection;
        HandlePtr statement;
    };

    // Statements are parented to their connection; a mismatch is a caller error.
    StatementAccess statement_access(const Value& params, HandlerContext& context) {
        const auto statement_id = params::require_string(params, "statement_id");
        auto statement = context.acquire(statement_id, HandleKind::PreparedStatement);
        const auto connection_id = params::string_or(params, "connection_id", statement->parent());
        if (connection_id != statement->parent()) {
            throw_validation_error("Statement " + statement_id + " does not belong to connection " + connection_id);
        }
        auto connection = context.acquire(connection_id, HandleKind::DatabaseConnection);
        return {std::move(connection), std::move(statement)};
    }

    [[noreturn]] static void fail(ConnectionState& connection, const std::string& prefix) {
        connection.last_errno = sqlite3_errcode(connection.db());
        connection.last_error = sqlite3_errmsg(connection.db());
        throw_execution_error(prefix + connection.last_error);
    }

    [[noreturn]] static void fail(ConnectionState& connection, StatementState& statement, const std::string& prefix) {
        statement.last_errno = sqlite3_errcode(connection.db());
        statement.last_error = sqlite3_errmsg(connection.db());
        connection.last_errno = statement.last_errno;
        connection.last_error = statement.last_error;
        throw_execution_error(prefix + statement.last_error);
    }

    static void exec(ConnectionState& connection, const char* sql, const std::string& prefix) {
        char* message = nullptr;
        if (sqlite3_exec(connection.db(), sql, nullptr, nullptr, &message) != SQLITE_OK) {
            connection.last_errno = sqlite3_errcode(connection.db());
            connection.last_error = message ? message : sqlite3_errmsg(connection.db());
            sqlite3_free(message);
            throw_execution_error(prefix + connection.last_error);
        }
    }

    Value connect(const Value& params, HandlerContext& context) {
        const auto dsn = params::require_string(params, "dsn");
        const auto username = params::string_or(params, "username", "");
        const auto& options = params::member(params, "options");

        auto state = std::make_unique<ConnectionState>();
        state->dsn = dsn;
        state->username = username;
        state->path = database_path_from_dsn(dsn);
        state->auto_commit = params::boolean_or(options, "AutoCommit", true);
        state->database = std::make_shared<SqliteDatabase>();

        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
        const int rc = sqlite3_open_v2(state->path.c_str(), &state->database->db, flags, nullptr);
        if (rc != SQLITE_OK) {
            const std::string message = state->database->db ? sqlite3_errmsg(state->database->db) : sqlite3_errstr(rc);
            throw_execution_error("Cannot connect to " + dsn + ": " + message);
        }
        sqlite3_busy_timeout(state->database->db, kBusyTimeoutMs);
        sqlite3_extended_result_codes(state->database->db, 1);
        if (!state->auto_commit) {
            exec(*state, "BEGIN", "Cannot start transaction: ");
        }

        log_event(StructuredLogger::Level::Debug, "database.connected", {{"path", state->path}});

        Value result(Json::objectValue);
        result["db_type"] = "SQLite";
        result["connection_id"] = Value(context.create(HandleKind::DatabaseConnection, std::move(state)));
        return result;
    }

    Value connect_cached(const Value& params, HandlerContext& context) {
        const auto dsn = params::require_string(params, "dsn");
        const auto username = params::string_or(params, "username", "");
        for (const auto& handle : context.pool().by_kind(HandleKind::DatabaseConnection)) {
            const auto& state = handle->state_as<ConnectionState>();
            if (state.dsn == dsn && state.username == username) {
                handle->touch();
                Value result(Json::objectValue);
                result["db_type"] = "SQLite";
                result["connection_id"] = Value(handle->id());
                result["cached"] = Value(true);
                return result;
            }
        }
        Value result = connect(params, context);
        result["cached"] = Value(false);
        return result;
    }

    Value disconnect(const Value& params, HandlerContext& context) {
        const auto connection_id = params::require_string(params, "connection_id");
        context.acquire(connection_id, HandleKind::DatabaseConnection);
        const auto statements = context.pool().children_of(connection_id).size();
        context.pool().remove(connection_id);

        Value result(Json::objectValue);
        result["connection_id"] = Value(connection_id);
        result["disconnected"] = Value(true);
        result["statements_closed"] = Value(static_cast<std::uint64_t>(statements));
        return result;
    }

    Value ping(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "connection_id"), HandleKind::DatabaseConnection);
        std::scoped_lock guard(handle->mutex());
        auto& connection = handle->state_as<ConnectionState>();
        const bool alive = sqlite3_exec(connection.db(), "SELECT 1", nullptr, nullptr, nullptr) == SQLITE_OK;

        Value result(Json::objectValue);
        result["ping"] = Value(alive);
        return result;
    }

    Value prepare(const Value& params, HandlerContext& context) {
        const auto connection_id = params::require_string(params, "connection_id");
        const auto sql = params::require_string(params, "sql");
        auto handle = context.acquire(connection_id, HandleKind::DatabaseConnection);

        auto statement = std::make_unique<StatementState>();
        {
            std::scoped_lock guard(handle->mutex());
            auto& connection = handle->state_as<ConnectionState>();
            statement->database = connection.database;
            statement->sql = sql;
            const int rc = sqlite3_prepare_v2(connection.db(), sql.c_str(), static_cast<int>(sql.size()), &statement->stmt, nullptr);
            if (rc != SQLITE_OK) {
                fail(connection, "Prepare failed: ");
            }
            if (statement->stmt == nullptr) {
                throw_execution_error("Prepare failed: statement is empty");
            }
        }

        Value result(Json::objectValue);
        result["statement_id"] = Value(context.create(HandleKind::PreparedStatement, std::move(statement), connection_id));
        return result;
    }

    Value execute_statement(const Value& params, HandlerContext& context) {
        auto access = statement_access(params, context);
        std::scoped_lock guard(access.connection->mutex(), access.statement->mutex());
        auto& connection = access.connection->state_as<ConnectionState>();
        auto& statement = access.statement->state_as<StatementState>();

        sqlite3_reset(statement.stmt);
        sqlite3_clear_bindings(statement.stmt);
        statement.executed = false;
        statement.row_pending = false;

        for (const auto& [name, value] : statement.inout_params) {
            bind_named(connection, statement, name, value);
        }
        const auto& values = params::member(params, "bind_values");
        if (!values.isNull() && !values.isArray()) {
            throw_validation_error("Parameter 'bind_values' must be an array");
        }
        int position = 1;
        for (const auto& value : values) {
            if (bind_value(statement.stmt, position, value) != SQLITE_OK) {
                fail(connection, statement, "Bind failed: ");
            }
            ++position;
        }
        const auto& named = params::member(params, "bind_params");
        if (!named.isNull() && !named.isObject()) {
            throw_validation_error("Parameter 'bind_params' must be an object");
        }
        for (const auto& name : named.getMemberNames()) {
            bind_named(connection, statement, name, bound_value(named[name]));
        }

        const int rc = sqlite3_step(statement.stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            sqlite3_reset(statement.stmt);
            fail(connection, statement, "Execute failed: ");
        }
        statement.executed = true;
        statement.row_pending = rc == SQLITE_ROW;
        statement.last_error.clear();
        statement.last_errno = 0;

        const bool is_query = sqlite3_column_count(statement.stmt) > 0;
        Value result(Json::objectValue);
        result["rows_affected"] = Value(static_cast<std::int64_t>(is_query ? -1 : sqlite3_changes(connection.db())));
        result["column_info"] = is_query ? column_info(statement.stmt) : Value{};
        return result;
    }

    void bind_named(ConnectionState& connection, StatementState& statement, const std::string& name, const Value& value) {
        const int index = parameter_index(statement.stmt, name);
        if (index <= 0 || index > sqlite3_bind_parameter_count(statement.stmt)) {
            throw_validation_error("Unknown bind parameter: " + name);
        }
        if (bind_value(statement.stmt, index, value) != SQLITE_OK) {
            fail(connection, statement, "Bind failed: ");
        }
    }

    // Emits the pending row and steps to the next one.
    std::optional<Value> next_row(ConnectionState& connection, StatementState& statement, bool as_hash) {
        if (!statement.executed) {
            throw_execution_error("Statement not executed");
        }
        if (!statement.row_pending) {
            return std::nullopt;
        }
        Value row = current_row(statement.stmt, as_hash);
        const int rc = sqlite3_step(statement.stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            statement.row_pending = false;
            fail(connection, statement, "Fetch failed: ");
        }
        statement.row_pending = rc == SQLITE_ROW;
        return row;
    }

    Value fetch_row(const Value& params, HandlerContext& context) {
        const bool as_hash = wants_hash(params);
        auto access = statement_access(params, context);
        std::scoped_lock guard(access.connection->mutex(), access.statement->mutex());
        auto& connection = access.connection->state_as<ConnectionState>();
        auto& statement = access.statement->state_as<StatementState>();

        Value result(Json::objectValue);
        if (auto row = next_row(connection, statement, as_hash)) {
            result["row"] = std::move(*row);
        } else {
            result["row"] = Value{};
            result["finished"] = Value(true);
        }
        return result;
    }

    Value fetch_all(const Value& params, HandlerContext& context) {
        const bool as_hash = wants_hash(params);
        auto access = statement_access(params, context);
        std::scoped_lock guard(access.connection->mutex(), access.statement->mutex());
        auto& connection = access.connection->state_as<ConnectionState>();
        auto& statement = access.statement->state_as<StatementState>();

        Value result(Json::objectValue);
        result["rows"] = Value(Json::arrayValue);
        auto& rows = result["rows"];
        while (auto row = next_row(connection, statement, as_hash)) {
            rows.append(std::move(*row));
        }
        result["count"] = Value(static_cast<std::uint64_t>(rows.size()));
        return result;
    }

    Value finish_statement(const Value& params, HandlerContext& context) {
        auto access = statement_access(params, context);
        std::scoped_lock guard(access.connection->mutex(), access.statement->mutex());
        auto& statement = access.statement->state_as<StatementState>();
        sqlite3_reset(statement.stmt);
        statement.executed = false;
        statement.row_pending = false;

        Value result(Json::objectValue);
        result["statement_id"] = Value(access.statement->id());
        result["finished"] = Value(true);
        return result;
    }

    // Runs every statement in |sql|; bind_values apply to each one that takes parameters.
    Value execute_immediate(const Value& params, HandlerContext& context) {
        const auto sql = params::require_string(params, "sql");
        const auto& values = params::member(params, "bind_values");
        if (!values.isNull() && !values.isArray()) {
            throw_validation_error("Parameter 'bind_values' must be an array");
        }
        auto handle = context.acquire(params::require_string(params, "connection_id"), HandleKind::DatabaseConnection);
        std::scoped_lock guard(handle->mutex());
        auto& connection = handle->state_as<ConnectionState>();

        const char* cursor = sql.c_str();
        const char* end = cursor + sql.size();
        std::int64_t rows_affected = 0;
        while (cursor < end) {
            sqlite3_stmt* raw = nullptr;
            const char* tail = nullptr;
            if (sqlite3_prepare_v2(connection.db(), cursor, static_cast<int>(end - cursor), &raw, &tail) != SQLITE_OK) {
                fail(connection, "Execute failed: ");
            }
            std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(raw, &sqlite3_finalize);
            cursor = tail;
            if (!stmt) {
                continue;
            }
            int position = 1;
            for (const auto& value : values) {
                if (position > sqlite3_bind_parameter_count(stmt.get())) {
                    break;
                }
                if (bind_value(stmt.get(), position++, value) != SQLITE_OK) {
                    fail(connection, "Bind failed: ");
                }
            }
            int rc = SQLITE_ROW;
            while (rc == SQLITE_ROW) {
                rc = sqlite3_step(stmt.get());
            }
            if (rc != SQLITE_DONE) {
                fail(connection, "Execute failed: ");
            }
            rows_affected = sqlite3_changes(connection.db());
        }
        connection.last_error.clear();
        connection.last_errno = 0;

        Value result(Json::objectValue);
        result["rows_affected"] = Value(rows_affected);
        return result;
    }

    Value begin_transaction(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "connection_id"), HandleKind::DatabaseConnection);
        std::scoped_lock guard(handle->mutex());
        auto& connection = handle->state_as<ConnectionState>();
        if (sqlite3_get_autocommit(connection.db()) == 0) {
            throw_execution_error("Already in a transaction");
        }
        exec(connection, "BEGIN", "Begin failed: ");

        Value result(Json::objectValue);
        result["transaction"] = "started";
        return result;
    }

    Value commit(const Value& params, HandlerContext& context) {
        return finish_transaction(params, context, "COMMIT", "committed");
    }

    Value rollback(const Value& params, HandlerContext& context) {
        return finish_transaction(params, context, "ROLLBACK", "rolled_back");
    }

    // With AutoCommit off a new transaction starts right after each commit/rollback.
    Value finish_transaction(const Value& params, HandlerContext& context, const char* sql, const char* outcome) {
        auto handle = context.acquire(params::require_string(params, "connection_id"), HandleKind::DatabaseConnection);
        std::scoped_lock guard(handle->mutex());
        auto& connection = handle->state_as<ConnectionState>();

        Value result(Json::objectValue);
        if (sqlite3_get_autocommit(connection.db()) != 0) {
            result[outcome] = Value(false);
            result["warning"] = Value(std::string(sql) + " ineffective with AutoCommit enabled");
            return result;
        }
        exec(connection, sql, std::string(sql) + " failed: ");
        if (!connection.auto_commit) {
            exec(connection, "BEGIN", "Cannot start transaction: ");
        }
        result[outcome] = Value(true);
        return result;
    }

    Value bind_param_inout(const Value& params, HandlerContext& context) {
        auto statement = context.acquire(params::require_string(params, "statement_id"), HandleKind::PreparedStatement);
        const auto name = params::require_string(params, "param_name");
        std::scoped_lock guard(statement->mutex());
        auto& state = statement->state_as<StatementState>();
        if (parameter_index(state.stmt, name) <= 0) {
            throw_validation_error("Unknown bind parameter: " + name);
        }
        state.inout_params[name] = params::member(params, "value");

        Value result(Json::objectValue);
        result["param_name"] = Value(name);
        result["bound"] = Value(true);
        return result;
    }

    Value get_out_params(const Value& params, HandlerContext& context) {
        auto statement = context.acquire(params::require_string(params, "statement_id"), HandleKind::PreparedStatement);
        std::scoped_lock guard(statement->mutex());
        const auto& state = statement->state_as<StatementState>();

        Value result(Json::objectValue);
        result["out_params"] = Value(Json::objectValue);
        auto& out = result["out_params"];
        for (const auto& [name, value] : state.inout_params) {
            out[name] = value;
        }
        return result;
    }

    Value get_connection_error(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "connection_id"), HandleKind::DatabaseConnection);
        std::scoped_lock guard(handle->mutex());
        const auto& connection = handle->state_as<ConnectionState>();

        Value result(Json::objectValue);
        result["error"] = connection.last_error.empty() ? Value{} : Value(connection.last_error);
        result["errno"] = Value(connection.last_errno);
        return result;
    }

    Value get_statement_error(const Value& params, HandlerContext& context) {
        auto statement = context.acquire(params::require_string(params, "statement_id"), HandleKind::PreparedStatement);
        std::scoped_lock guard(statement->mutex());
        const auto& state = statement->state_as<StatementState>();

        Value result(Json::objectValue);
        result["error"] = state.last_error.empty() ? Value{} : Value(state.last_error);
        result["errno"] = Value(state.last_errno);
        return result;
    }

    std::map<std::string, Operation> operations_;
};

DatabaseHandler::DatabaseHandler()
    : impl_(std::make_unique<Impl>()) {}

DatabaseHandler::~DatabaseHandler() = default;

std::vector<std::string> DatabaseHandler::functions() const {
    return impl_->names();
}

Value DatabaseHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

}  // namespace cpanbridge::handlers
