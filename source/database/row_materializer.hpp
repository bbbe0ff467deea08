#ifndef SQLMCPS_ROW_MATERIALIZER_HPP
#define SQLMCPS_ROW_MATERIALIZER_HPP

// Turns a result cursor into JSON rows.

#include "database/database_driver_abi.hpp"
#include "protocol/json_rpc.hpp"

namespace row_materializer {

using json = json_rpc::json;

// Convert a single cell to JSON. Null cells become JSON null.
json cell_to_json(const database_driver::CellValue &cell);

// Drain the cursor. Returns a JSON array of objects, one per row, with keys
// in column order. A NULL column is present with a null value.
json materialize(database_driver::ResultCursor &cursor);

} // namespace row_materializer

#endif // SQLMCPS_ROW_MATERIALIZER_HPP
