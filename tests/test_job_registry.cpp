#include <gtest/gtest.h>
#include <managers/job_registry.hpp>
#include <thread>

static Job make_job(const std::string& id) {
    Job job;
    job.id = id;
    return job;
}

TEST(JobRegistry, InsertRejectsDuplicates) {
    JobRegistry reg;
    EXPECT_TRUE(reg.insert(make_job("a")));
    EXPECT_FALSE(reg.insert(make_job("a")));
    EXPECT_TRUE(reg.contains("a"));
    EXPECT_FALSE(reg.contains("b"));
}

TEST(JobRegistry, SnapshotsKeepInsertionOrder) {
    JobRegistry reg;
    reg.insert(make_job("zulu"));
    reg.insert(make_job("alpha"));
    reg.insert(make_job("mike"));

    auto all = reg.snapshot_all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "zulu");
    EXPECT_EQ(all[1].id, "alpha");
    EXPECT_EQ(all[2].id, "mike");
}

TEST(JobRegistry, SnapshotIsACopy) {
    JobRegistry reg;
    reg.insert(make_job("a"));
    auto before = reg.snapshot("a");
    reg.append_log("a", "later");
    ASSERT_TRUE(before.has_value());
    EXPECT_TRUE(before->log.empty());
    EXPECT_EQ(reg.snapshot("a")->log.size(), 1u);
}

TEST(JobRegistry, CursorReadsOnlyNewLines) {
    JobRegistry reg;
    reg.insert(make_job("a"));
    reg.append_log("a", "one");
    reg.append_log("a", "two");

    auto chunk = reg.read_since("a", 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->lines, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(chunk->next_cursor, 2u);

    reg.append_log("a", "three");
    chunk = reg.read_since("a", chunk->next_cursor);
    EXPECT_EQ(chunk->lines, (std::vector<std::string>{"three"}));
    EXPECT_EQ(chunk->next_cursor, 3u);

    chunk = reg.read_since("a", 3);
    EXPECT_TRUE(chunk->lines.empty());
    EXPECT_EQ(chunk->next_cursor, 3u);
}

TEST(JobRegistry, CursorPastEndYieldsNothing) {
    JobRegistry reg;
    reg.insert(make_job("a"));
    reg.append_log("a", "one");
    auto chunk = reg.read_since("a", 10);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk->lines.empty());
    EXPECT_EQ(chunk->next_cursor, 10u);
    EXPECT_FALSE(reg.read_since("missing", 0).has_value());
}

TEST(JobRegistry, StatusAndOutputsUpdate) {
    JobRegistry reg;
    reg.insert(make_job("a"));
    reg.set_status("a", JobStatus::Provisioning);
    reg.set_outputs("a", {{"k", "v"}});
    reg.set_subscription("a", "sub-1");

    auto job = reg.snapshot("a");
    EXPECT_EQ(job->status, JobStatus::Provisioning);
    EXPECT_EQ(job->outputs.at("k"), "v");
    EXPECT_EQ(job->parameters.subscription_id, "sub-1");
    EXPECT_FALSE(job->updated_at.empty());
    EXPECT_EQ(reg.read_since("a", 0)->status, JobStatus::Provisioning);
}

TEST(JobRegistry, RunGuardAdmitsOneRun) {
    JobRegistry reg;
    reg.insert(make_job("a"));
    EXPECT_TRUE(reg.try_begin_run("a"));
    EXPECT_TRUE(reg.run_active("a"));
    EXPECT_FALSE(reg.try_begin_run("a"));
    reg.end_run("a");
    EXPECT_FALSE(reg.run_active("a"));
    EXPECT_TRUE(reg.try_begin_run("a"));
}

TEST(JobRegistry, ConcurrentAppendsAreAllKept) {
    JobRegistry reg;
    reg.insert(make_job("a"));

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&reg, t] {
            for (int i = 0; i < 250; ++i) {
                reg.append_log("a", std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& w : writers) w.join();

    auto log = reg.snapshot("a")->log;
    ASSERT_EQ(log.size(), 1000u);

    // Each writer's lines stay in its own order
    for (int t = 0; t < 4; ++t) {
        int expected = 0;
        std::string prefix = std::to_string(t) + ":";
        for (const auto& line : log) {
            if (line.rfind(prefix, 0) != 0) continue;
            EXPECT_EQ(line, prefix + std::to_string(expected));
            ++expected;
        }
        EXPECT_EQ(expected, 250);
    }
}
