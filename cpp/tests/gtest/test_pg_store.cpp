// =============================================================================
// PostgreSQL Fact Store Tests
// =============================================================================
//
// Runs against the database named by FACTLOG_DB_* (see Config); every test
// skips when no server is reachable. Each test writes under its own entity id
// so reruns never see earlier data.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "factlog/config.hpp"
#include "factlog/error.hpp"
#include "factlog/reconstruct/pipeline.hpp"
#include "factlog/store/pg_store.hpp"
#include "order_history.hpp"

using namespace factlog;
using namespace factlog::testing;

class PgFactStoreTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        Config::getInstance().load();
        db::ConnectionConfig cc = db::ConnectionConfig::from_config(Config::getInstance());

        db::Connection probe(cc);
        if (!probe.ok()) {
            skip_reason_ = std::string("PostgreSQL not reachable: ") + probe.error();
            return;
        }

        store_ = std::make_unique<PgFactStore>(cc, 2);
        try {
            store_->ensure_schema();
        } catch (const FactlogException& e) {
            skip_reason_ = e.what();
            store_.reset();
        }
    }

    static void TearDownTestSuite() {
        store_.reset();
    }

    void SetUp() override {
        if (!store_) {
            GTEST_SKIP() << skip_reason_;
        }
        auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
        entity_ = std::string("test-") +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + "-" +
                  std::to_string(stamp);
    }

    static std::unique_ptr<PgFactStore> store_;
    static std::string skip_reason_;
    std::string entity_;
};

std::unique_ptr<PgFactStore> PgFactStoreTest::store_;
std::string PgFactStoreTest::skip_reason_;

TEST_F(PgFactStoreTest, UnknownEntity) {
    EXPECT_TRUE(store_->query_history(entity_).empty());
    EXPECT_FALSE(store_->query_current(entity_).has_value());
}

TEST_F(PgFactStoreTest, ValuesSurviveTheWire) {
    AttributeMap values = {
        {"s", "it's \"quoted\"\nmultiline"},
        {"i", int64_t(-9007199254740993)},
        {"d", 0.1},
        {"b", false},
        {"t", at("2018-07-01T12:00:00.125Z")},
        {"u", order_uuid()},
        {"k", Value::keyword("order.status/shipped")},
    };
    ASSERT_TRUE(store_->transact(entity_, values).has_value());

    auto current = store_->query_current(entity_);
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(*current, values);
}

TEST_F(PgFactStoreTest, OutOfRangeInstantNeverWritten) {
    const Instant year_10000(Instant::MAX_MILLIS + 1);
    EXPECT_THROW(store_->transact(entity_, {{"due", year_10000}}), InvalidArgumentError);
    EXPECT_THROW(store_->transact(entity_, {{"a", 1}}, year_10000), InvalidArgumentError);
    EXPECT_TRUE(store_->query_history(entity_).empty());

    // Boundary instants survive the round trip, so history stays readable
    const Instant last(Instant::MAX_MILLIS);
    ASSERT_TRUE(store_->transact(entity_, {{"due", last}}).has_value());
    EXPECT_EQ(store_->query_current(entity_)->at("due"), Value(last));
    EXPECT_EQ(store_->query_history(entity_).size(), 1u);
}

TEST_F(PgFactStoreTest, ChangeWritesRetractAndAssert) {
    TxId tx1 = *store_->transact(entity_, {{"a", 1}, {"b", 2}}, at("2018-07-01T12:00:00Z"));
    TxId tx2 = *store_->transact(entity_, {{"a", 10}}, at("2018-07-01T12:10:00Z"));
    EXPECT_GT(tx2, tx1);

    auto history = store_->query_history(entity_);
    ASSERT_EQ(history.size(), 4u);
    for (const auto& fact : history) {
        ASSERT_TRUE(fact.tx_instant.has_value());
        if (fact.tx == tx2) {
            EXPECT_EQ(fact.attribute, "a");
            EXPECT_EQ(*fact.tx_instant, at("2018-07-01T12:10:00Z"));
        }
    }
}

TEST_F(PgFactStoreTest, NoOpTransactionWritesNothing) {
    store_->transact(entity_, {{"a", 1}});
    EXPECT_FALSE(store_->transact(entity_, {{"a", 1}}).has_value());
    EXPECT_EQ(store_->query_history(entity_).size(), 1u);
}

TEST_F(PgFactStoreTest, Retract) {
    store_->transact(entity_, {{"a", 1}, {"b", 2}});
    ASSERT_TRUE(store_->retract(entity_, {"b"}).has_value());
    EXPECT_EQ(*store_->query_current(entity_), (AttributeMap{{"a", 1}}));
    EXPECT_FALSE(store_->retract(entity_, {"b"}).has_value());
}

TEST_F(PgFactStoreTest, ReconstructOrderScenario) {
    const Instant t1 = at("2018-07-01T12:00:00Z");
    store_->transact(entity_, {
        {"order/id", order_uuid()},
        {"order/operator", "me"},
        {"order/time", t1},
        {"order/action", "place order"},
    }, t1);
    store_->transact(entity_, {
        {"order/operator", "logistics system"},
        {"order/action", "assign to warehouse A"},
    });
    store_->transact(entity_, {
        {"order/operator", "shipper B"},
        {"order/time", at("2018-07-01T12:20:00Z")},
        {"order/action", "ship to logistics center C"},
        {"order/location", "warehouse A"},
    });

    Reconstructor reconstructor(*store_);
    auto snapshots = reconstructor.reconstruct(entity_);
    auto expected = reconstruct(order_history());

    ASSERT_EQ(snapshots.size(), expected.size());
    for (size_t i = 0; i < snapshots.size(); ++i) {
        EXPECT_EQ(snapshots[i].state, expected[i].state) << "snapshot " << i;
    }
    EXPECT_EQ(snapshots.back().state, *store_->query_current(entity_));
}

TEST_F(PgFactStoreTest, ConnectionsReturnToPool) {
    store_->transact(entity_, {{"a", 1}});
    store_->query_history(entity_);
    store_->query_current(entity_);

    auto [idle, open] = store_->pool().stats();
    EXPECT_EQ(idle, open);
    EXPECT_LE(open, store_->pool().max_size());
}

TEST(PgFactStoreOfflineTest, UnreachableServerIsStoreUnavailable) {
    db::ConnectionConfig cc;
    cc.host = "127.0.0.1";
    cc.port = "1";
    cc.connect_timeout = 1;

    PgFactStore store(cc, 1);
    EXPECT_THROW(store.query_history("order-1"), StoreUnavailableError);

    Reconstructor reconstructor(store);
    EXPECT_THROW(reconstructor.reconstruct("order-1"), StoreUnavailableError);
}
