#include <gtest/gtest.h>
#include <set>
#include "store/sqlite_history_store.hpp"
#include "sync/sync_client.hpp"
#include "test_utils.hpp"

using namespace histvault;
using namespace histvault::sync;

// Two hosts of one user syncing through an in-process relay
class SyncConvergenceTest : public ::testing::Test {
protected:
    test::TempDir dir{"histvault_convergence"};
    test::ServerStack server;
    crypto::SymmetricKey key = crypto::generate_key();

    std::string laptop_token;
    std::string desktop_token;
    store::SqliteHistoryStore laptop_store{":memory:"};
    store::SqliteHistoryStore desktop_store{":memory:"};

    void SetUp() override {
        test::init_test_logging();
        laptop_token = server.register_user("alice");
        desktop_token = server.service.login(api::LoginRequest{"alice", "password-alice"}).session;
    }

    SyncReport sync_host(const std::string& host, const std::string& token, store::HistoryStore& store,
                         test::InProcessApi& api, const SyncOptions& options = SyncOptions{}) {
        SyncClient client(SessionContext{token, key, host}, api, store, checkpoint_for(host));
        return client.sync(options);
    }

    CheckpointFile checkpoint_for(const std::string& host) const {
        return CheckpointFile(dir / (host + ".json"));
    }

    static std::set<std::string> ids(store::HistoryStore& store) {
        std::set<std::string> result;
        for (const auto& record : store.recent(100000)) {
            result.insert(record.id);
        }
        return result;
    }
};

TEST_F(SyncConvergenceTest, DesktopReceivesLaptopHistory) {
    std::vector<history::HistoryRecord> uploaded;
    for (int i = 1; i <= 5; ++i) {
        uploaded.push_back(test::make_record("laptop", 1000 + i, "cmd " + std::to_string(i)));
        laptop_store.insert_if_absent(uploaded.back());
    }

    test::InProcessApi laptop_api(server.service, laptop_token);
    const auto laptop_report = sync_host("laptop", laptop_token, laptop_store, laptop_api);
    EXPECT_EQ(laptop_report.uploaded, 5u);
    EXPECT_EQ(laptop_report.downloaded, 0u);

    test::InProcessApi desktop_api(server.service, desktop_token);
    const auto desktop_report = sync_host("desktop", desktop_token, desktop_store, desktop_api);
    EXPECT_EQ(desktop_report.downloaded, 5u);
    EXPECT_EQ(desktop_report.uploaded, 0u);

    const auto received = desktop_store.records_since(history::epoch(), "desktop", 100);
    ASSERT_EQ(received.size(), 5u);
    for (std::size_t i = 0; i < received.size(); ++i) {
        EXPECT_EQ(received[i], uploaded[i]);
    }
    EXPECT_EQ(desktop_store.count(), 5);
    EXPECT_EQ(checkpoint_for("desktop").load().last_sync_timestamp, uploaded.back().timestamp);
}

TEST_F(SyncConvergenceTest, BothHostsConvergeToUnion) {
    const int n = 130;
    const int m = 70;
    for (int i = 0; i < n; ++i) {
        laptop_store.insert_if_absent(test::make_record("laptop", 2000 + 2 * i));
    }
    for (int i = 0; i < m; ++i) {
        desktop_store.insert_if_absent(test::make_record("desktop", 2001 + 2 * i));
    }
    const auto laptop_own = ids(laptop_store);
    const auto desktop_own = ids(desktop_store);

    test::InProcessApi laptop_api(server.service, laptop_token);
    test::InProcessApi desktop_api(server.service, desktop_token);
    SyncOptions options;
    options.page_size = 50;

    sync_host("laptop", laptop_token, laptop_store, laptop_api, options);
    const auto desktop_report = sync_host("desktop", desktop_token, desktop_store, desktop_api, options);
    const auto laptop_report = sync_host("laptop", laptop_token, laptop_store, laptop_api, options);

    EXPECT_EQ(desktop_report.downloaded, static_cast<std::size_t>(n));
    EXPECT_EQ(laptop_report.downloaded, static_cast<std::size_t>(m));
    // no host gets its own records back
    EXPECT_EQ(desktop_report.skipped, 0u);
    EXPECT_EQ(laptop_report.skipped, 0u);

    EXPECT_EQ(laptop_store.count(), n + m);
    EXPECT_EQ(desktop_store.count(), n + m);
    EXPECT_EQ(ids(laptop_store), ids(desktop_store));

    std::set<std::string> expected = laptop_own;
    expected.insert(desktop_own.begin(), desktop_own.end());
    EXPECT_EQ(ids(laptop_store), expected);
    EXPECT_EQ(server.service.count(server.service.authenticate("Token " + laptop_token)).count, n + m);
}

TEST_F(SyncConvergenceTest, ConvergedHostsSkipDownload) {
    laptop_store.insert_if_absent(test::make_record("laptop", 10));
    desktop_store.insert_if_absent(test::make_record("desktop", 20));

    test::InProcessApi laptop_api(server.service, laptop_token);
    test::InProcessApi desktop_api(server.service, desktop_token);
    sync_host("laptop", laptop_token, laptop_store, laptop_api);
    sync_host("desktop", desktop_token, desktop_store, desktop_api);
    sync_host("laptop", laptop_token, laptop_store, laptop_api);

    const int calls_before = laptop_api.sync_calls;
    const auto report = sync_host("laptop", laptop_token, laptop_store, laptop_api);
    EXPECT_EQ(laptop_api.sync_calls, calls_before);
    EXPECT_EQ(report.pages, 0u);
    EXPECT_EQ(report.uploaded, 0u);
}

TEST_F(SyncConvergenceTest, ForcedResyncIsIdempotent) {
    for (int i = 0; i < 10; ++i) {
        laptop_store.insert_if_absent(test::make_record("laptop", 100 + i));
    }
    test::InProcessApi laptop_api(server.service, laptop_token);
    test::InProcessApi desktop_api(server.service, desktop_token);
    sync_host("laptop", laptop_token, laptop_store, laptop_api);
    sync_host("desktop", desktop_token, desktop_store, desktop_api);

    SyncOptions force;
    force.force = true;
    const auto report = sync_host("desktop", desktop_token, desktop_store, desktop_api, force);
    EXPECT_EQ(report.downloaded, 0u);
    EXPECT_EQ(report.skipped, 10u);
    EXPECT_EQ(desktop_store.count(), 10);
    EXPECT_EQ(server.service.count(server.service.authenticate("Token " + desktop_token)).count, 10);
}

TEST_F(SyncConvergenceTest, OtherUsersKeyCannotReadHistory) {
    laptop_store.insert_if_absent(test::make_record("laptop", 10));
    test::InProcessApi laptop_api(server.service, laptop_token);
    sync_host("laptop", laptop_token, laptop_store, laptop_api);

    // same account, wrong key on the second host
    test::InProcessApi desktop_api(server.service, desktop_token);
    SyncClient client(SessionContext{desktop_token, crypto::generate_key(), "desktop"}, desktop_api,
                      desktop_store, checkpoint_for("desktop"));
    try {
        client.sync();
        FAIL() << "sync decrypted with a foreign key";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Crypto);
    }
    EXPECT_EQ(desktop_store.count(), 0);
}

TEST_F(SyncConvergenceTest, LateUploaderReachesEveryHost) {
    const std::string work_token = server.service.login(api::LoginRequest{"alice", "password-alice"}).session;
    store::SqliteHistoryStore work_store{":memory:"};
    test::InProcessApi laptop_api(server.service, laptop_token);
    test::InProcessApi desktop_api(server.service, desktop_token);
    test::InProcessApi work_api(server.service, work_token);

    laptop_store.insert_if_absent(test::make_record("laptop", 10));
    desktop_store.insert_if_absent(test::make_record("desktop", 80));
    // recorded while offline, older than what the laptop has already seen
    work_store.insert_if_absent(test::make_record("work", 50));

    sync_host("desktop", desktop_token, desktop_store, desktop_api);
    sync_host("laptop", laptop_token, laptop_store, laptop_api);
    EXPECT_EQ(laptop_store.count(), 2);

    sync_host("work", work_token, work_store, work_api);
    const auto report = sync_host("laptop", laptop_token, laptop_store, laptop_api);
    EXPECT_EQ(report.downloaded, 1u);
    sync_host("desktop", desktop_token, desktop_store, desktop_api);

    EXPECT_EQ(laptop_store.count(), 3);
    EXPECT_EQ(desktop_store.count(), 3);
    EXPECT_EQ(work_store.count(), 3);
    EXPECT_EQ(ids(laptop_store), ids(desktop_store));
    EXPECT_EQ(ids(laptop_store), ids(work_store));
    EXPECT_EQ(checkpoint_for("laptop").load().last_sync_timestamp,
              history::epoch() + std::chrono::seconds(80));
}

TEST_F(SyncConvergenceTest, TiedTimestampsCrossPageBoundaries) {
    for (int i = 0; i < 5; ++i) {
        laptop_store.insert_if_absent(test::make_record("laptop", 300));
    }
    test::InProcessApi laptop_api(server.service, laptop_token);
    test::InProcessApi desktop_api(server.service, desktop_token);
    SyncOptions options;
    options.page_size = 2;

    EXPECT_EQ(sync_host("laptop", laptop_token, laptop_store, laptop_api, options).uploaded, 5u);
    const auto report = sync_host("desktop", desktop_token, desktop_store, desktop_api, options);
    EXPECT_EQ(report.downloaded, 5u);
    EXPECT_EQ(report.pages, 3u);
    EXPECT_EQ(ids(desktop_store), ids(laptop_store));
}
