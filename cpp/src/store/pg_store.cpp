#include "factlog/store/pg_store.hpp"

#include "factlog/db/helpers.hpp"
#include "factlog/error.hpp"
#include "factlog/logging.hpp"

namespace factlog {

namespace {

const char* SCHEMA_SQL = R"SQL(
    CREATE TABLE IF NOT EXISTS factlog_tx (
        tx          BIGSERIAL PRIMARY KEY,
        tx_instant  TIMESTAMPTZ NOT NULL DEFAULT now()
    );
    CREATE TABLE IF NOT EXISTS factlog_fact (
        entity      TEXT NOT NULL,
        tx          BIGINT NOT NULL REFERENCES factlog_tx(tx),
        attribute   TEXT NOT NULL,
        value_type  CHAR(1) NOT NULL,
        value       TEXT NOT NULL,
        added       BOOLEAN NOT NULL
    );
    CREATE INDEX IF NOT EXISTS factlog_fact_entity_tx_idx ON factlog_fact (entity, tx);
)SQL";

// Instants cross the wire as ISO-8601 UTC text so Instant::parse can read them
#define FACTLOG_ISO_INSTANT(col) \
    "to_char(" col " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"')"

const char* HISTORY_SQL =
    "SELECT f.tx, f.attribute, f.value_type, f.value, f.added, "
    FACTLOG_ISO_INSTANT("t.tx_instant")
    " FROM factlog_fact f JOIN factlog_tx t ON t.tx = f.tx"
    " WHERE f.entity = $1";

// Latest fact per attribute; within a tx the assertion sorts before the retraction
const char* CURRENT_SQL =
    "SELECT attribute, value_type, value FROM ("
    "  SELECT DISTINCT ON (attribute) attribute, value_type, value, added"
    "  FROM factlog_fact WHERE entity = $1"
    "  ORDER BY attribute, tx DESC, added DESC"
    ") latest WHERE added";

const char* INSERT_TX_SQL =
    "INSERT INTO factlog_tx (tx_instant) VALUES (COALESCE($1::timestamptz, now()))"
    " RETURNING tx, " FACTLOG_ISO_INSTANT("tx_instant");

const char* INSERT_FACT_SQL =
    "INSERT INTO factlog_fact (entity, tx, attribute, value_type, value, added)"
    " VALUES ($1, $2, $3, $4, $5, $6)";

const char* LOCK_ENTITY_SQL = "SELECT pg_advisory_xact_lock(hashtext($1))";

#undef FACTLOG_ISO_INSTANT

Value decode_value(const db::Result& res, int row, int type_col, int value_col) {
    std::string tag = res.str(row, type_col);
    if (tag.size() != 1) {
        throw InvalidArgumentError("Bad value_type '" + tag + "' in factlog_fact", "PgFactStore");
    }
    return Value::decode(tag[0], res.str(row, value_col));
}

AttributeMap read_current(PGconn* conn, const EntityId& entity) {
    db::Result res = db::exec_checked(conn, CURRENT_SQL, {entity}, "PgFactStore::query_current");
    AttributeMap current;
    for (int row = 0; row < res.ntuples(); ++row) {
        current.emplace(res.str(row, 0), decode_value(res, row, 1, 2));
    }
    return current;
}

} // anonymous namespace

void PgFactStore::ensure_schema() {
    db::PooledConnection conn(pool_);
    db::exec_checked(conn, SCHEMA_SQL, {}, "PgFactStore::ensure_schema");
    LOG_INFO("factlog schema ready");
}

std::vector<FactRecord> PgFactStore::query_history(const EntityId& entity) {
    db::PooledConnection conn(pool_);

    // One consistent read of the whole log, even with concurrent writers
    db::Transaction tx(conn, "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");
    db::Result res = db::exec_checked(conn, HISTORY_SQL, {entity}, "PgFactStore::query_history");

    std::vector<FactRecord> facts;
    facts.reserve(static_cast<size_t>(res.ntuples()));
    for (int row = 0; row < res.ntuples(); ++row) {
        FactRecord fact;
        fact.tx = res.int64(row, 0);
        fact.attribute = res.str(row, 1);
        fact.value = decode_value(res, row, 2, 3);
        fact.added = res.boolean(row, 4);
        if (!res.is_null(row, 5)) {
            fact.tx_instant = Instant::parse(res.str(row, 5));
        }
        facts.push_back(std::move(fact));
    }
    tx.commit();

    LOG_DEBUG("Read ", facts.size(), " facts for ", entity);
    return facts;
}

std::optional<AttributeMap> PgFactStore::query_current(const EntityId& entity) {
    db::PooledConnection conn(pool_);
    AttributeMap current = read_current(conn, entity);
    if (current.empty()) return std::nullopt;
    return current;
}

std::optional<TxId> PgFactStore::transact(const EntityId& entity, const AttributeMap& changes,
                                          std::optional<Instant> instant) {
    FACTLOG_CHECK_ARGUMENT(!entity.empty(), "Entity id must not be empty");
    FACTLOG_CHECK_ARGUMENT(!instant || instant->in_range(), "Transaction instant out of range");

    db::PooledConnection conn(pool_);
    db::Transaction tx(conn);
    db::exec_checked(conn, LOCK_ENTITY_SQL, {entity}, "PgFactStore::transact");

    std::vector<FactRecord> facts = plan_assertions(read_current(conn, entity), changes);
    std::optional<TxId> written = write(entity, std::move(facts), instant, conn);
    if (written) tx.commit();
    return written;
}

std::optional<TxId> PgFactStore::retract(const EntityId& entity,
                                         const std::vector<Attribute>& attributes,
                                         std::optional<Instant> instant) {
    FACTLOG_CHECK_ARGUMENT(!entity.empty(), "Entity id must not be empty");
    FACTLOG_CHECK_ARGUMENT(!instant || instant->in_range(), "Transaction instant out of range");

    db::PooledConnection conn(pool_);
    db::Transaction tx(conn);
    db::exec_checked(conn, LOCK_ENTITY_SQL, {entity}, "PgFactStore::retract");

    std::vector<FactRecord> facts = plan_retractions(read_current(conn, entity), attributes);
    std::optional<TxId> written = write(entity, std::move(facts), instant, conn);
    if (written) tx.commit();
    return written;
}

std::optional<TxId> PgFactStore::write(const EntityId& entity, std::vector<FactRecord> facts,
                                       std::optional<Instant> instant, PGconn* conn) {
    if (facts.empty()) return std::nullopt;

    // A NULL instant lets the server stamp now()
    const char* instant_param = nullptr;
    std::string instant_text;
    if (instant) {
        instant_text = instant->to_string();
        instant_param = instant_text.c_str();
    }
    db::Result tx_row(PQexecParams(conn, INSERT_TX_SQL, 1, nullptr, &instant_param,
                                   nullptr, nullptr, 0));
    if (!tx_row.ok() || tx_row.ntuples() != 1) {
        throw StoreUnavailableError("Insert into factlog_tx failed: " + tx_row.error_message(),
                                    "PgFactStore::write");
    }
    const TxId tx = tx_row.int64(0, 0);
    const std::string tx_text = std::to_string(tx);

    for (const auto& fact : facts) {
        db::exec_checked(conn, INSERT_FACT_SQL,
                         {entity, tx_text, fact.attribute, std::string(1, fact.value.type_tag()),
                          fact.value.encode(), fact.added ? "true" : "false"},
                         "PgFactStore::write");
    }

    LOG_DEBUG("tx ", tx, " wrote ", facts.size(), " facts for ", entity, " at ", tx_row.str(0, 1));
    return tx;
}

} // namespace factlog
