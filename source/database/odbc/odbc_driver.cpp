#include "database/odbc/odbc_driver.hpp"
#include "utils/debug_log.hpp"

#include <sql.h>
#include <sqlext.h>

#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace odbc_driver {

using database_driver::CellType;
using database_driver::CellValue;
using database_driver::DatabaseError;

namespace {

// SQL Server specific type codes (from msodbcsql.h).
constexpr SQLSMALLINT kSqlServerVariant = -150;
constexpr SQLSMALLINT kSqlServerTime2 = -154;
constexpr SQLSMALLINT kSqlServerDateTimeOffset = -155;

// Parameters longer than this are bound as (max) types.
constexpr size_t kMaxInlineParameterLength = 4000;

constexpr size_t kChunkSize = 8192;

// Drop the "[vendor][driver][source]" prefixes ODBC puts in front of server messages.
std::string strip_vendor_prefix(const std::string &message) {
    size_t position = 0;
    while (position < message.size() && message[position] == '[') {
        size_t closing = message.find(']', position);
        if (closing == std::string::npos) {
            break;
        }
        position = closing + 1;
    }
    return message.substr(position);
}

// Collect every diagnostic record attached to a handle, one message per line.
std::string collect_diagnostics(SQLSMALLINT handle_type, SQLHANDLE handle) {
    std::string message;
    for (SQLSMALLINT record = 1;; ++record) {
        SQLCHAR state[6] = {0};
        SQLINTEGER native_error = 0;
        SQLCHAR text[2048] = {0};
        SQLSMALLINT text_length = 0;
        SQLRETURN status = SQLGetDiagRec(handle_type, handle, record, state, &native_error,
                                         text, static_cast<SQLSMALLINT>(sizeof(text)), &text_length);
        if (!SQL_SUCCEEDED(status)) {
            break;
        }
        if (!message.empty()) {
            message += "\n";
        }
        message += strip_vendor_prefix(reinterpret_cast<const char *>(text));
    }
    return message;
}

// Throw DatabaseError unless status indicates success (SQL_NO_DATA counts as success).
void check(SQLRETURN status, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string &context) {
    if (SQL_SUCCEEDED(status) || status == SQL_NO_DATA) {
        return;
    }
    std::string diagnostics = collect_diagnostics(handle_type, handle);
    if (diagnostics.empty()) {
        diagnostics = context + " failed";
    }
    throw DatabaseError(diagnostics);
}

// Owns one ODBC handle and frees it on destruction.
class OdbcHandle {
public:
    OdbcHandle(SQLSMALLINT handle_type, SQLHANDLE parent) : handle_type_(handle_type) {
        SQLRETURN status = SQLAllocHandle(handle_type, parent, &handle_);
        if (!SQL_SUCCEEDED(status)) {
            handle_ = SQL_NULL_HANDLE;
            throw DatabaseError("Cannot allocate ODBC handle");
        }
    }

    ~OdbcHandle() {
        if (handle_ != SQL_NULL_HANDLE) {
            SQLFreeHandle(handle_type_, handle_);
        }
    }

    OdbcHandle(const OdbcHandle &) = delete;
    OdbcHandle &operator=(const OdbcHandle &) = delete;

    SQLHANDLE get() const { return handle_; }
    SQLSMALLINT type() const { return handle_type_; }

private:
    SQLSMALLINT handle_type_;
    SQLHANDLE handle_ = SQL_NULL_HANDLE;
};

// Environment and connection handles, shared by the connection and its cursors
// so a cursor can never outlive the connection it reads from.
struct ConnectionHandles {
    OdbcHandle environment{SQL_HANDLE_ENV, SQL_NULL_HANDLE};
    std::unique_ptr<OdbcHandle> connection;
    bool connected = false;

    ~ConnectionHandles() {
        if (connected) {
            SQLDisconnect(connection->get());
        }
    }
};

// Text buffers bound to statement parameters. Heap-allocated so the bound
// addresses stay put until the statement is freed.
struct BoundParameters {
    std::vector<std::string> values;
    std::vector<SQLLEN> lengths;
};

void bind_text_parameters(SQLHANDLE statement, BoundParameters &parameters) {
    parameters.lengths.resize(parameters.values.size());
    for (size_t index = 0; index < parameters.values.size(); ++index) {
        std::string &value = parameters.values[index];
        parameters.lengths[index] = static_cast<SQLLEN>(value.size());

        SQLSMALLINT sql_type = value.size() > kMaxInlineParameterLength ? SQL_WLONGVARCHAR : SQL_WVARCHAR;
        SQLULEN column_size = value.empty() ? 1 : static_cast<SQLULEN>(value.size());

        SQLRETURN status = SQLBindParameter(statement, static_cast<SQLUSMALLINT>(index + 1), SQL_PARAM_INPUT,
                                            SQL_C_CHAR, sql_type, column_size, 0,
                                            static_cast<SQLPOINTER>(&value[0]),
                                            static_cast<SQLLEN>(value.size()), &parameters.lengths[index]);
        check(status, SQL_HANDLE_STMT, statement, "SQLBindParameter");
    }
}

// Normalize "2024-01-02 03:04:05.123" to "2024-01-02T03:04:05.123" and
// "... 03:04:05 +01:00" to "...T03:04:05+01:00".
std::string to_iso8601(std::string text) {
    if (text.size() > 10 && text[4] == '-' && text[10] == ' ') {
        text[10] = 'T';
    }
    size_t offset_space = text.find(" +");
    if (offset_space == std::string::npos) {
        offset_space = text.find(" -");
    }
    if (offset_space != std::string::npos) {
        text.erase(offset_space, 1);
    }
    return text;
}

class OdbcCursor : public database_driver::ResultCursor {
public:
    OdbcCursor(std::shared_ptr<ConnectionHandles> handles, std::unique_ptr<OdbcHandle> statement,
               std::unique_ptr<BoundParameters> parameters)
        : handles_(std::move(handles)), statement_(std::move(statement)), parameters_(std::move(parameters)) {
        advance_to_row_set();
        describe_columns();
    }

    int column_count() const override {
        return static_cast<int>(column_names_.size());
    }

    std::string column_name(int column_index) const override {
        return column_names_.at(static_cast<size_t>(column_index));
    }

    bool fetch_next() override {
        if (column_names_.empty()) {
            return false;
        }
        SQLRETURN status = SQLFetch(statement_->get());
        if (status == SQL_NO_DATA) {
            return false;
        }
        check(status, SQL_HANDLE_STMT, statement_->get(), "SQLFetch");
        return true;
    }

    CellValue read_cell(int column_index) override {
        SQLUSMALLINT column_number = static_cast<SQLUSMALLINT>(column_index + 1);
        CellValue cell;

        switch (column_types_.at(static_cast<size_t>(column_index))) {
        case SQL_BIT: {
            SQLCHAR value = 0;
            if (read_fixed(column_number, SQL_C_BIT, &value, sizeof(value))) {
                cell.type = CellType::Boolean;
                cell.boolean_value = value != 0;
            }
            break;
        }
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT: {
            SQLBIGINT value = 0;
            if (read_fixed(column_number, SQL_C_SBIGINT, &value, sizeof(value))) {
                cell.type = CellType::Integer;
                cell.integer_value = static_cast<int64_t>(value);
            }
            break;
        }
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE: {
            SQLDOUBLE value = 0.0;
            if (read_fixed(column_number, SQL_C_DOUBLE, &value, sizeof(value))) {
                cell.type = CellType::Float;
                cell.float_value = value;
            }
            break;
        }
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            if (read_chunked(column_number, SQL_C_CHAR, cell.text_value)) {
                cell.type = CellType::Decimal;
            }
            break;
        case SQL_TYPE_DATE:
        case SQL_TYPE_TIME:
        case SQL_TYPE_TIMESTAMP:
        case kSqlServerTime2:
        case kSqlServerDateTimeOffset:
            if (read_chunked(column_number, SQL_C_CHAR, cell.text_value)) {
                cell.type = CellType::DateTime;
                cell.text_value = to_iso8601(cell.text_value);
            }
            break;
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY: {
            std::string bytes;
            if (read_chunked(column_number, SQL_C_BINARY, bytes)) {
                cell.type = CellType::Binary;
                cell.binary_value.assign(bytes.begin(), bytes.end());
            }
            break;
        }
        case kSqlServerVariant:
        default:
            if (read_chunked(column_number, SQL_C_CHAR, cell.text_value)) {
                cell.type = CellType::String;
            }
            break;
        }

        return cell;
    }

private:
    // Skip results without columns (row counts of INSERT/UPDATE/...) so the
    // cursor sits on the first result set that has rows to read.
    void advance_to_row_set() {
        for (;;) {
            SQLSMALLINT column_count = 0;
            SQLRETURN status = SQLNumResultCols(statement_->get(), &column_count);
            check(status, SQL_HANDLE_STMT, statement_->get(), "SQLNumResultCols");
            if (column_count > 0) {
                return;
            }
            status = SQLMoreResults(statement_->get());
            if (status == SQL_NO_DATA) {
                return;
            }
            check(status, SQL_HANDLE_STMT, statement_->get(), "SQLMoreResults");
        }
    }

    void describe_columns() {
        SQLSMALLINT column_count = 0;
        check(SQLNumResultCols(statement_->get(), &column_count), SQL_HANDLE_STMT, statement_->get(),
              "SQLNumResultCols");

        for (SQLSMALLINT column_number = 1; column_number <= column_count; ++column_number) {
            SQLCHAR name[512] = {0};
            SQLSMALLINT name_length = 0;
            SQLSMALLINT data_type = 0;
            SQLULEN column_size = 0;
            SQLSMALLINT decimal_digits = 0;
            SQLSMALLINT nullable = 0;
            SQLRETURN status = SQLDescribeCol(statement_->get(), static_cast<SQLUSMALLINT>(column_number), name,
                                              static_cast<SQLSMALLINT>(sizeof(name)), &name_length, &data_type,
                                              &column_size, &decimal_digits, &nullable);
            check(status, SQL_HANDLE_STMT, statement_->get(), "SQLDescribeCol");
            column_names_.emplace_back(reinterpret_cast<const char *>(name));
            column_types_.push_back(data_type);
        }
    }

    // Read a fixed-size value. Returns false when the value is NULL.
    bool read_fixed(SQLUSMALLINT column_number, SQLSMALLINT target_type, SQLPOINTER buffer, SQLLEN buffer_size) {
        SQLLEN indicator = 0;
        SQLRETURN status = SQLGetData(statement_->get(), column_number, target_type, buffer, buffer_size, &indicator);
        check(status, SQL_HANDLE_STMT, statement_->get(), "SQLGetData");
        return status != SQL_NO_DATA && indicator != SQL_NULL_DATA;
    }

    // Read a character or binary value in chunks. Returns false when the value is NULL.
    bool read_chunked(SQLUSMALLINT column_number, SQLSMALLINT target_type, std::string &output) {
        // Character data is null-terminated inside the buffer, binary data is not.
        const size_t usable = target_type == SQL_C_CHAR ? kChunkSize - 1 : kChunkSize;
        std::vector<char> buffer(kChunkSize);

        for (;;) {
            SQLLEN indicator = 0;
            SQLRETURN status = SQLGetData(statement_->get(), column_number, target_type, buffer.data(),
                                          static_cast<SQLLEN>(buffer.size()), &indicator);
            if (status == SQL_NO_DATA) {
                break;
            }
            check(status, SQL_HANDLE_STMT, statement_->get(), "SQLGetData");
            if (indicator == SQL_NULL_DATA) {
                return false;
            }

            size_t chunk_length = usable;
            if (indicator != SQL_NO_TOTAL && static_cast<size_t>(indicator) < usable) {
                chunk_length = static_cast<size_t>(indicator);
            }
            output.append(buffer.data(), chunk_length);

            if (status == SQL_SUCCESS) {
                break;
            }
        }
        return true;
    }

    std::shared_ptr<ConnectionHandles> handles_;
    std::unique_ptr<OdbcHandle> statement_;
    std::unique_ptr<BoundParameters> parameters_;
    std::vector<std::string> column_names_;
    std::vector<SQLSMALLINT> column_types_;
};

class OdbcConnection : public database_driver::Connection {
public:
    explicit OdbcConnection(const std::string &connection_string) : handles_(std::make_shared<ConnectionHandles>()) {
        SQLHANDLE environment = handles_->environment.get();
        check(SQLSetEnvAttr(environment, SQL_ATTR_ODBC_VERSION, reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0),
              SQL_HANDLE_ENV, environment, "SQLSetEnvAttr");

        handles_->connection = std::make_unique<OdbcHandle>(SQL_HANDLE_DBC, environment);

        std::string odbc_string = build_odbc_connection_string(connection_string);
        std::vector<SQLCHAR> connection_text(odbc_string.begin(), odbc_string.end());
        connection_text.push_back('\0');

        SQLRETURN status = SQLDriverConnect(handles_->connection->get(), nullptr, connection_text.data(), SQL_NTS,
                                            nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
        check(status, SQL_HANDLE_DBC, handles_->connection->get(), "SQLDriverConnect");
        handles_->connected = true;
    }

    void execute_non_query(const std::string &statement_text) override {
        debug_log::log("Executing statement: " + statement_text);
        OdbcHandle statement(SQL_HANDLE_STMT, handles_->connection->get());
        execute_direct(statement.get(), statement_text);
    }

    std::unique_ptr<database_driver::ResultCursor> execute_query(const std::string &query) override {
        debug_log::log("Executing query: " + query);
        auto statement = std::make_unique<OdbcHandle>(SQL_HANDLE_STMT, handles_->connection->get());
        execute_direct(statement->get(), query);
        return std::make_unique<OdbcCursor>(handles_, std::move(statement), nullptr);
    }

    std::unique_ptr<database_driver::ResultCursor> execute_parameterized_query(
        const std::string &query, const std::vector<std::string> &parameters) override {
        debug_log::log("Executing parameterized query: " + query);
        auto statement = std::make_unique<OdbcHandle>(SQL_HANDLE_STMT, handles_->connection->get());
        auto bound = std::make_unique<BoundParameters>();
        bound->values = parameters;
        bind_text_parameters(statement->get(), *bound);
        execute_direct(statement->get(), query);
        return std::make_unique<OdbcCursor>(handles_, std::move(statement), std::move(bound));
    }

    std::unique_ptr<database_driver::ResultCursor> execute_procedure(
        const std::string &schema, const std::string &procedure,
        const std::vector<database_driver::ProcedureParameter> &parameters) override {
        std::string command = "EXEC " + database_driver::quote_identifier(schema) + "." +
                              database_driver::quote_identifier(procedure);

        auto bound = std::make_unique<BoundParameters>();
        for (size_t index = 0; index < parameters.size(); ++index) {
            command += (index == 0) ? " " : ", ";
            command += parameters[index].name + " = ?";
            bound->values.push_back(parameters[index].value);
        }

        debug_log::log("Executing procedure: " + command);
        auto statement = std::make_unique<OdbcHandle>(SQL_HANDLE_STMT, handles_->connection->get());
        bind_text_parameters(statement->get(), *bound);
        execute_direct(statement->get(), command);
        return std::make_unique<OdbcCursor>(handles_, std::move(statement), std::move(bound));
    }

private:
    static void execute_direct(SQLHANDLE statement, const std::string &text) {
        std::vector<SQLCHAR> statement_text(text.begin(), text.end());
        statement_text.push_back('\0');
        SQLRETURN status = SQLExecDirect(statement, statement_text.data(), SQL_NTS);
        check(status, SQL_HANDLE_STMT, statement, "SQLExecDirect");
    }

    std::shared_ptr<ConnectionHandles> handles_;
};

} // namespace

std::unique_ptr<database_driver::Connection> open_connection(const std::string &connection_string) {
    return std::make_unique<OdbcConnection>(connection_string);
}

database_driver::ConnectionFactory make_connection_factory(const std::string &connection_string) {
    return [connection_string]() { return open_connection(connection_string); };
}

} // namespace odbc_driver
