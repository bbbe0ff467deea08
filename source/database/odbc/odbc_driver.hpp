#ifndef SQLMCPS_ODBC_DRIVER_HPP
#define SQLMCPS_ODBC_DRIVER_HPP

// ODBC driver for SQL Server.
// Implements the database_driver interface on top of the ODBC C API
// (unixODBC driver manager + Microsoft ODBC Driver for SQL Server).

#include <memory>
#include <string>

#include "database/database_driver_abi.hpp"

namespace odbc_driver {

// Driver used when the connection string does not name one.
constexpr const char *kDefaultDriver = "ODBC Driver 18 for SQL Server";

// Rewrite a SqlClient-style connection string ("Server=...;User Id=...;Password=...")
// into ODBC keywords, adding Driver={...} when it is missing. ODBC strings pass
// through with only their keyword spelling normalized.
std::string build_odbc_connection_string(const std::string &connection_string);

// Open a new connection. Throws database_driver::DatabaseError on failure.
std::unique_ptr<database_driver::Connection> open_connection(const std::string &connection_string);

// A factory that opens a new connection with the given connection string on each call.
database_driver::ConnectionFactory make_connection_factory(const std::string &connection_string);

} // namespace odbc_driver

#endif // SQLMCPS_ODBC_DRIVER_HPP
