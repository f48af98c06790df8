#pragma once

#include "qrouter/main/config.hpp"
#include "qrouter/main/query_engine.hpp"

namespace qrouter {

//! Builds the row-store engine named by config.transactional_engine
unique_ptr<QueryEngine> CreateTransactionalEngine(const RouterConfig &config);
//! Builds the DuckDB engine over config.duckdb_path
unique_ptr<QueryEngine> CreateAnalyticalEngine(const RouterConfig &config);

} // namespace qrouter
