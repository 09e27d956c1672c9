#include <gtest/gtest.h>
#include <fstream>
#include "store/store_error.hpp"
#include "sync/checkpoint.hpp"
#include "sync/sync_lock.hpp"
#include "test_utils.hpp"

using namespace histvault;
using namespace histvault::sync;

class CheckpointTest : public ::testing::Test {
protected:
    test::TempDir dir{"histvault_checkpoint"};

    void SetUp() override {
        test::init_test_logging();
    }

    void write_file(const std::string& name, const std::string& contents) {
        std::ofstream out(dir / name);
        out << contents;
    }
};

TEST_F(CheckpointTest, MissingFileStartsAtEpoch) {
    CheckpointFile file(dir / "checkpoint.json");
    const auto checkpoint = file.load();

    EXPECT_EQ(checkpoint.last_sync_timestamp, history::epoch());
    EXPECT_EQ(checkpoint.last_sync_seq, 0);
    EXPECT_EQ(checkpoint.last_upload_timestamp, history::epoch());
    EXPECT_TRUE(checkpoint.last_upload_id.empty());
}

TEST_F(CheckpointTest, SaveThenLoad) {
    CheckpointFile file(dir / "state" / "checkpoint.json");
    SyncCheckpoint checkpoint;
    checkpoint.last_sync_timestamp = history::from_nanos(1619353000123456789LL);
    checkpoint.last_sync_seq = 4242;
    checkpoint.last_upload_timestamp = history::from_nanos(1700000000000000001LL);
    checkpoint.last_upload_id = "0d3f1c2ab5e84f6c9a7b1e2d3c4b5a69";

    file.save(checkpoint);
    EXPECT_EQ(file.load(), checkpoint);
    EXPECT_FALSE(std::filesystem::exists(dir / "state" / "checkpoint.json.tmp"));

    checkpoint.last_sync_seq += 5;
    file.save(checkpoint);
    EXPECT_EQ(CheckpointFile(dir / "state" / "checkpoint.json").load(), checkpoint);
}

TEST_F(CheckpointTest, CorruptFileIsAnError) {
    write_file("garbage.json", "{ not json");
    EXPECT_THROW(CheckpointFile(dir / "garbage.json").load(), store::StoreError);

    write_file("missing_field.json", R"({"last_sync_timestamp":"2021-04-25T12:16:40Z"})");
    EXPECT_THROW(CheckpointFile(dir / "missing_field.json").load(), store::StoreError);

    write_file("bad_time.json",
               R"({"last_sync_timestamp":"noon","last_sync_seq":1,)"
               R"("last_upload_timestamp":"2021-04-25T12:16:40Z","last_upload_id":""})");
    EXPECT_THROW(CheckpointFile(dir / "bad_time.json").load(), store::StoreError);

    write_file("bad_seq.json",
               R"({"last_sync_timestamp":"2021-04-25T12:16:40Z","last_sync_seq":"one",)"
               R"("last_upload_timestamp":"2021-04-25T12:16:40Z","last_upload_id":""})");
    EXPECT_THROW(CheckpointFile(dir / "bad_seq.json").load(), store::StoreError);
}

TEST_F(CheckpointTest, SyncLockCreatesLockFile) {
    const auto path = dir / "locks" / "sync.lock";
    {
        SyncLock lock(path);
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    // released on destruction, so it can be taken again
    EXPECT_NO_THROW(SyncLock again(path));
}
