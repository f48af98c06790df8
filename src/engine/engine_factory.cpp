#include "qrouter/engine/engine_factory.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/logging.hpp"
#include "qrouter/engine/duckdb_engine.hpp"
#include "qrouter/engine/mysql_engine.hpp"
#include "qrouter/engine/postgresql_engine.hpp"

namespace qrouter {

unique_ptr<QueryEngine> CreateTransactionalEngine(const RouterConfig &config) {
    unique_ptr<QueryEngine> engine;
    if (config.transactional_engine == "postgresql") {
        engine = make_uniq<PostgreSQLEngine>(config.postgresql_connection);
    } else if (config.transactional_engine == "mysql") {
        MySQLConnectionInfo info;
        info.host = config.mysql_host;
        info.port = config.mysql_port;
        info.user = config.mysql_user;
        info.password = config.mysql_password;
        info.database = config.mysql_database;
        engine = make_uniq<MySQLEngine>(std::move(info));
    } else {
        throw ConfigurationException("unknown transactional engine \"" + config.transactional_engine + "\"");
    }
    if (!engine->IsAvailable()) {
        // connection is retried on first use
        logW("transactional engine " + engine->GetName() + " is not reachable yet");
    } else {
        logI("transactional engine: " + engine->GetEngineInfo());
    }
    return engine;
}

unique_ptr<QueryEngine> CreateAnalyticalEngine(const RouterConfig &config) {
    unique_ptr<QueryEngine> engine = make_uniq<DuckDBEngine>(config.duckdb_path);
    logI("analytical engine: " + engine->GetEngineInfo());
    return engine;
}

} // namespace qrouter
