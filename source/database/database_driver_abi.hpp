#ifndef SQLMCPS_DATABASE_DRIVER_ABI_HPP
#define SQLMCPS_DATABASE_DRIVER_ABI_HPP

// Database driver abstraction interface.
// The tool handlers only talk to these types; the ODBC driver under
// database/odbc/ implements them for SQL Server, and the tests supply an
// in-memory implementation.

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace database_driver {

// Raised for any failure reported by the database or its driver.
// what() carries the driver's diagnostic text unchanged.
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string &message) : std::runtime_error(message) {}
};

enum class CellType {
    Null,
    Integer,
    Float,
    Decimal,  // exact numeric, kept as its decimal text
    String,
    Boolean,
    DateTime, // ISO-8601 text
    Binary
};

// One value read from a result row. Only the member matching type is meaningful.
struct CellValue {
    CellType type = CellType::Null;
    int64_t integer_value = 0;
    double float_value = 0.0;
    bool boolean_value = false;
    std::string text_value; // String, Decimal, DateTime
    std::vector<unsigned char> binary_value;
};

// A live, forward-only handle over one result set.
class ResultCursor {
public:
    virtual ~ResultCursor() = default;

    virtual int column_count() const = 0;
    virtual std::string column_name(int column_index) const = 0;

    // Advance to the next row. Returns false when the rows are exhausted.
    virtual bool fetch_next() = 0;

    // Read a column of the current row. Each column is read at most once per row.
    virtual CellValue read_cell(int column_index) = 0;
};

// A named stored procedure argument. value is passed to the server as text.
struct ProcedureParameter {
    std::string name;
    std::string value;
};

// One open connection to the server. Closed when destroyed.
class Connection {
public:
    virtual ~Connection() = default;

    // Run a statement that returns no rows (e.g. USE [db]).
    virtual void execute_non_query(const std::string &statement) = 0;

    // Run a query and return a cursor over its first result set.
    virtual std::unique_ptr<ResultCursor> execute_query(const std::string &query) = 0;

    // Run a query with '?' placeholders bound, in order, to the given text values.
    virtual std::unique_ptr<ResultCursor> execute_parameterized_query(
        const std::string &query, const std::vector<std::string> &parameters) = 0;

    // Invoke [schema].[procedure] with named parameters.
    virtual std::unique_ptr<ResultCursor> execute_procedure(
        const std::string &schema, const std::string &procedure,
        const std::vector<ProcedureParameter> &parameters) = 0;
};

// Opens a fresh connection. Throws DatabaseError when the server cannot be reached.
using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

// Wrap an identifier in brackets, doubling any closing bracket.
std::string quote_identifier(const std::string &identifier);

} // namespace database_driver

#endif // SQLMCPS_DATABASE_DRIVER_ABI_HPP
