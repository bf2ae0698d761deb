/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// qmgr headers
#include "qmgr/codec.hpp"
#include "qmgr/registry.hpp"
#include "qmgr/state_machine.hpp"
#include "qmgr/supervisor.hpp"

// qmgr test helpers
#include "fakes/sample_jobs.hpp"
#include "fakes/temp_dir.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cmath>

namespace qmgr::test {

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::StartsWith;

constexpr auto kWait = std::chrono::milliseconds(10000);

class SupervisorTest : public ::testing::TestWithParam<Isolation> {
protected:
    SupervisorConfig baseConfig() const {
        SupervisorConfig config;
        config.registryPath = dir.file("registry.jsonl");
        config.maxConcurrentJobs = 2;
        config.isolation = GetParam();
        config.syncWrites = false;
        config.cleanupInterval = 0s;
        config.cancelGrace = 300ms;
        config.hookTimeout = 2000ms;
        config.shutdownTimeout = 3000ms;
        config.autoStart = true;
        return config;
    }

    Supervisor& startSupervisor(SupervisorConfig config) {
        supervisor = std::make_unique<Supervisor>(std::move(config));
        registerSampleJobs(*supervisor);
        OpResult started = supervisor->start();
        EXPECT_TRUE(started) << started.message;
        return *supervisor;
    }

    Supervisor& startSupervisor() { return startSupervisor(baseConfig()); }

    JobRecord finished(const JobId& id) {
        auto record = supervisor->waitFor(id, kWait);
        EXPECT_TRUE(record) << "job " << id << " did not finish";
        return record.value_or(JobRecord{});
    }

    bool reachesStatus(const JobId& id, Status status) {
        return eventually([&] {
            auto record = supervisor->getStatus(id);
            return record && record->status == status;
        }, kWait);
    }

    TempDir dir;
    std::unique_ptr<Supervisor> supervisor;
};

TEST_P(SupervisorTest, completedJobCarriesItsResult) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sum", "A", {{"n", 5}}));

    JobRecord a = finished("A");
    EXPECT_EQ(a.status, Status::Completed);
    ASSERT_TRUE(a.result);
    EXPECT_EQ((*a.result)["sum"], 15);
    EXPECT_FALSE(a.error);
    EXPECT_EQ(a.progress, 100);
    EXPECT_EQ(a.sizeBytes, a.result->dump().size());
    EXPECT_GE(a.updatedAt, a.createdAt);
}

TEST_P(SupervisorTest, throwingJobIsRecordedAsFailed) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("fail", "B"));

    JobRecord b = finished("B");
    EXPECT_EQ(b.status, Status::Failed);
    ASSERT_TRUE(b.error);
    EXPECT_EQ(b.error->message, "boom");
    EXPECT_EQ(b.error->kind, "std::runtime_error");
    EXPECT_FALSE(b.result);
    EXPECT_TRUE(s.isRunning());
}

TEST_P(SupervisorTest, cancelWhileQueuedNeverRuns) {
    SupervisorConfig config = baseConfig();
    config.maxConcurrentJobs = 1;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sleep", "blocker", {{"ms", 5000}}));
    ASSERT_TRUE(reachesStatus("blocker", Status::Running));
    ASSERT_TRUE(s.submit("sum", "C", {{"n", 3}}));
    EXPECT_EQ(s.getStatus("C")->status, Status::Queued);

    ASSERT_TRUE(s.cancel("C"));
    JobRecord c = finished("C");
    EXPECT_EQ(c.status, Status::Cancelled);
    EXPECT_FALSE(c.result);
    EXPECT_FALSE(c.error);

    ASSERT_TRUE(s.cancel("blocker"));
    EXPECT_EQ(finished("blocker").status, Status::Cancelled);
    EXPECT_EQ(s.getStatus("C")->status, Status::Cancelled);
}

TEST_P(SupervisorTest, cancelRunningJobCooperatively) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sleep", "slow", {{"ms", 10000}}));
    ASSERT_TRUE(reachesStatus("slow", Status::Running));

    OpResult r = s.cancel("slow");
    ASSERT_TRUE(r);
    JobRecord slow = finished("slow");
    EXPECT_EQ(slow.status, Status::Cancelled);
    EXPECT_FALSE(slow.result);
    EXPECT_FALSE(slow.error);
}

TEST_P(SupervisorTest, cancelRefusedAfterCompletion) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sum", "done", {{"n", 1}}));
    ASSERT_EQ(finished("done").status, Status::Completed);

    OpResult late = s.cancel("done");
    EXPECT_EQ(late.error, ErrorCode::InvalidTransition);
    EXPECT_EQ(late.message, "Cannot cancel job 'done' in state 'COMPLETED'");
    EXPECT_EQ(s.cancel("ghost").error, ErrorCode::NotFound);
}

TEST_P(SupervisorTest, createdJobWaitsForExplicitStart) {
    SupervisorConfig config = baseConfig();
    config.autoStart = false;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sum", "manual", {{"n", 4}}));
    EXPECT_EQ(s.getStatus("manual")->status, Status::Created);

    ASSERT_TRUE(s.start("manual"));
    JobRecord manual = finished("manual");
    EXPECT_EQ(manual.status, Status::Completed);
    EXPECT_EQ((*manual.result)["sum"], 10);

    EXPECT_EQ(s.start("manual").error, ErrorCode::InvalidTransition);
    EXPECT_EQ(s.start("ghost").error, ErrorCode::NotFound);
}

TEST_P(SupervisorTest, cancelCreatedJob) {
    SupervisorConfig config = baseConfig();
    config.autoStart = false;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sum", "never", {{"n", 4}}));
    ASSERT_TRUE(s.cancel("never"));
    EXPECT_EQ(s.getStatus("never")->status, Status::Cancelled);
    EXPECT_TRUE(s.cancel("never"));
    EXPECT_EQ(s.start("never").error, ErrorCode::InvalidTransition);
}

TEST_P(SupervisorTest, submitAloneNeverRunsTheJob) {
    SupervisorConfig config = baseConfig();
    config.autoStart = SupervisorConfig{}.autoStart;
    auto& s = startSupervisor(config);

    for (int i = 0; i < 200; ++i) {
        const JobId id = "q-" + std::to_string(i);
        ASSERT_TRUE(s.submit("sum", id, {{"n", i}}));
        auto record = s.getStatus(id);
        ASSERT_TRUE(record);
        EXPECT_TRUE(record->status == Status::Created || record->status == Status::Queued)
            << id << " was " << statusToString(record->status);
    }

    ASSERT_TRUE(s.start("q-10"));
    EXPECT_EQ((*finished("q-10").result)["sum"], 55);
    EXPECT_EQ(s.stats().count(Status::Created), 199u);
}

TEST_P(SupervisorTest, submitRejectsParamsThatWouldChangeOnDisk) {
    auto& s = startSupervisor();

    OpResult bytes = s.submit("sum", "P", {{"bytes", std::string("\xff\xfe")}});
    EXPECT_EQ(bytes.error, ErrorCode::InvalidArgument);
    OpResult nan = s.submit("sum", "P", {{"x", std::nan("")}});
    EXPECT_EQ(nan.error, ErrorCode::InvalidArgument);
    EXPECT_THAT(nan.message, HasSubstr("/x"));
    EXPECT_EQ(s.submit("sum", std::string("id-\xff"), {{"n", 1}}).error, ErrorCode::InvalidArgument);
    EXPECT_FALSE(s.getStatus("P"));

    const nlohmann::json params = {{"n", 2}, {"label", "h\xc3\xa9llo"}, {"weights", {0.25, 1e-3}}};
    ASSERT_TRUE(s.submit("sum", "P", params));
    finished("P");
    s.shutdown();
    supervisor.reset();

    Registry registry(baseConfig().registryPath, false);
    ASSERT_TRUE(registry.open());
    EXPECT_EQ(registry.get("P")->params, params);
}

TEST_P(SupervisorTest, perTypeLimitEvictsOldestFinishedJob) {
    SupervisorConfig config = baseConfig();
    config.capacity.perType = {{"sum", 2}};
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sum", "s1", {{"n", 1}}));
    finished("s1");
    ASSERT_TRUE(s.submit("sum", "s2", {{"n", 2}}));
    finished("s2");
    ASSERT_TRUE(s.submit("fail", "f1"));
    finished("f1");

    ASSERT_TRUE(s.submit("sum", "s3", {{"n", 3}}));
    EXPECT_FALSE(s.getStatus("s1"));
    EXPECT_TRUE(s.getStatus("s2"));
    EXPECT_TRUE(s.getStatus("f1"));
    EXPECT_EQ((*finished("s3").result)["sum"], 6);
    EXPECT_EQ(s.submit("sum", "s1", {{"n", 1}}).error, ErrorCode::DuplicateJobId);
}

TEST_P(SupervisorTest, capacityNeverEvictsActiveJobs) {
    SupervisorConfig config = baseConfig();
    config.autoStart = false;
    config.capacity.maxJobs = 2;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sum", "a", {{"n", 1}}));
    ASSERT_TRUE(s.submit("fail", "b"));

    OpResult full = s.submit("sum", "c", {{"n", 1}});
    EXPECT_EQ(full.error, ErrorCode::QueueFull);
    EXPECT_FALSE(s.getStatus("c"));
    EXPECT_EQ(s.list().size(), 2u);

    ASSERT_TRUE(s.cancel("b"));
    ASSERT_TRUE(s.submit("sum", "c", {{"n", 1}}));
    EXPECT_FALSE(s.getStatus("b"));
    EXPECT_EQ(s.getStatus("a")->status, Status::Created);
    EXPECT_EQ(s.getStatus("c")->status, Status::Created);
}

TEST_P(SupervisorTest, submitValidatesInput) {
    auto& s = startSupervisor();

    EXPECT_EQ(s.submit("sum", "").error, ErrorCode::InvalidArgument);
    EXPECT_EQ(s.submit("no-such-type", "x").error, ErrorCode::InvalidArgument);
    EXPECT_EQ(s.submit("sum", "x", nlohmann::json::array({1, 2})).error, ErrorCode::InvalidArgument);
    EXPECT_FALSE(s.getStatus("x"));
}

TEST_P(SupervisorTest, duplicateIdIsRejected) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sum", "dup", {{"n", 2}}));

    OpResult again = s.submit("sum", "dup", {{"n", 9}});
    EXPECT_EQ(again.error, ErrorCode::DuplicateJobId);
    EXPECT_EQ(again.message, "Job with ID 'dup' already exists");
    EXPECT_EQ((*finished("dup").result)["sum"], 3);
}

TEST_P(SupervisorTest, timeoutFailsTheJob) {
    SupervisorConfig config = baseConfig();
    config.jobTimeout = 200ms;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sleep", "cooperative", {{"ms", 10000}}));
    ASSERT_TRUE(s.submit("stubborn", "stubborn", {{"ms", 1500}}));

    JobRecord cooperative = finished("cooperative");
    EXPECT_EQ(cooperative.status, Status::Failed);
    ASSERT_TRUE(cooperative.error);
    EXPECT_EQ(cooperative.error->kind, "Timeout");

    JobRecord stubborn = finished("stubborn");
    EXPECT_EQ(stubborn.status, Status::Failed);
    ASSERT_TRUE(stubborn.error);
    EXPECT_EQ(stubborn.error->kind, "Timeout");
    EXPECT_FALSE(stubborn.result);
}

TEST_P(SupervisorTest, oversizedResultIsRejected) {
    SupervisorConfig config = baseConfig();
    config.resultWarnBytes = 512;
    config.resultMaxBytes = 1024;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("big", "small", {{"bytes", 600}}));
    JobRecord small = finished("small");
    EXPECT_EQ(small.status, Status::Completed);

    const auto before = s.stats().registry.bytes;
    ASSERT_TRUE(s.submit("big", "huge", {{"bytes", 64 * 1024}}));
    JobRecord huge = finished("huge");
    // Only the lifecycle lines of "huge" were written, never the payload
    EXPECT_LT(s.stats().registry.bytes - before, 4096u);

    EXPECT_EQ(huge.status, Status::Failed);
    ASSERT_TRUE(huge.error);
    EXPECT_EQ(huge.error->kind, "ResultRejected");
    EXPECT_THAT(huge.error->message, StartsWith("oversized"));
    EXPECT_FALSE(huge.result);
}

TEST_P(SupervisorTest, nonFiniteResultIsRejected) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("nan", "nan"));

    JobRecord nan = finished("nan");
    EXPECT_EQ(nan.status, Status::Failed);
    ASSERT_TRUE(nan.error);
    EXPECT_EQ(nan.error->kind, "ResultRejected");
    EXPECT_THAT(nan.error->message, StartsWith("non-serializable"));
}

TEST_P(SupervisorTest, progressIsVisibleWhileRunning) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sleep", "steps", {{"ms", 3000}}));

    EXPECT_TRUE(eventually([&] {
        auto record = s.getStatus("steps");
        return record && record->status == Status::Running && record->progress > 0;
    }, kWait));
    ASSERT_TRUE(s.cancel("steps"));
    EXPECT_EQ(finished("steps").status, Status::Cancelled);
}

TEST_P(SupervisorTest, hooksRunAfterCommit) {
    auto& s = startSupervisor();
    const std::string markers = dir.path().string();
    ASSERT_TRUE(s.submit("hooks", "ok", {{"marker_dir", markers}}));
    ASSERT_TRUE(s.submit("hooks", "bad", {{"marker_dir", markers}, {"fail", true}}));

    EXPECT_EQ(finished("ok").status, Status::Completed);
    EXPECT_EQ(finished("bad").status, Status::Failed);

    EXPECT_TRUE(eventually([&] { return std::filesystem::exists(dir.file("ok.end")); }));
    EXPECT_TRUE(eventually([&] { return std::filesystem::exists(dir.file("bad.error")); }));
    EXPECT_TRUE(std::filesystem::exists(dir.file("ok.start")));
    EXPECT_TRUE(std::filesystem::exists(dir.file("bad.end")));
    EXPECT_FALSE(std::filesystem::exists(dir.file("ok.error")));
    EXPECT_THAT(readFile(dir.file("bad.error")), HasSubstr("hook job failed"));
}

TEST_P(SupervisorTest, throwingHooksDoNotChangeTheOutcome) {
    auto& s = startSupervisor();
    const std::string markers = dir.path().string();
    ASSERT_TRUE(s.submit("hooks", "loud", {{"marker_dir", markers}, {"throw_in_hooks", true}}));

    JobRecord loud = finished("loud");
    EXPECT_EQ(loud.status, Status::Completed);
    EXPECT_TRUE(eventually([&] { return std::filesystem::exists(dir.file("loud.end")); }));

    ASSERT_TRUE(s.submit("sum", "next", {{"n", 2}}));
    EXPECT_EQ(finished("next").status, Status::Completed);
}

TEST_P(SupervisorTest, removeOnlyTerminalJobs) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sleep", "busy", {{"ms", 10000}}));
    ASSERT_TRUE(reachesStatus("busy", Status::Running));

    OpResult refused = s.remove("busy");
    EXPECT_EQ(refused.error, ErrorCode::JobNotTerminal);
    EXPECT_EQ(refused.message, "Cannot delete job 'busy' in state 'RUNNING'");

    ASSERT_TRUE(s.cancel("busy"));
    ASSERT_EQ(finished("busy").status, Status::Cancelled);
    ASSERT_TRUE(s.remove("busy"));
    EXPECT_FALSE(s.getStatus("busy"));
    EXPECT_EQ(s.remove("busy").error, ErrorCode::NotFound);
    EXPECT_EQ(s.submit("sum", "busy", {{"n", 1}}).error, ErrorCode::DuplicateJobId);
}

TEST_P(SupervisorTest, waitForGivesUpOnTimeoutAndUnknownIds) {
    auto& s = startSupervisor();
    EXPECT_FALSE(s.waitFor("ghost", 50ms));

    ASSERT_TRUE(s.submit("sleep", "long", {{"ms", 10000}}));
    const auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(s.waitFor("long", 200ms));
    EXPECT_GE(std::chrono::steady_clock::now() - before, 150ms);

    ASSERT_TRUE(s.cancel("long"));
    EXPECT_TRUE(s.waitFor("long", kWait));
}

TEST_P(SupervisorTest, listAndStatsReflectTheRegistry) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sum", "s1", {{"n", 1}}));
    ASSERT_TRUE(s.submit("sum", "s2", {{"n", 2}}));
    ASSERT_TRUE(s.submit("fail", "f1"));
    finished("s1");
    finished("s2");
    finished("f1");

    auto jobs = s.list();
    ASSERT_EQ(jobs.size(), 3u);

    SupervisorStats stats = s.stats();
    EXPECT_EQ(stats.count(Status::Completed), 2u);
    EXPECT_EQ(stats.count(Status::Failed), 1u);
    EXPECT_EQ(stats.total(), 3u);
    EXPECT_EQ(stats.workers, 2);
    EXPECT_EQ(stats.registry.records, 3u);
    EXPECT_TRUE(eventually([&] { return s.stats().running.empty(); }));
}

TEST_P(SupervisorTest, cleanupKeepsNewestTerminalRecords) {
    SupervisorConfig config = baseConfig();
    config.maxConcurrentJobs = 1;
    auto& s = startSupervisor(config);

    for (int i = 0; i < 4; ++i) {
        const JobId id = "old-" + std::to_string(i);
        ASSERT_TRUE(s.submit("sum", id, {{"n", i}}));
        finished(id);
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(s.submit("sum", "latest", {{"n", 1}}));
    finished("latest");

    RetentionPolicy keepTwo;
    keepTwo.maxTerminalRecords = 2;
    std::size_t removed = 0;
    ASSERT_TRUE(s.cleanup(keepTwo, &removed));
    EXPECT_EQ(removed, 3u);

    auto jobs = s.list();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].id, "old-3");
    EXPECT_EQ(jobs[1].id, "latest");
    EXPECT_EQ(s.submit("sum", "old-0").error, ErrorCode::DuplicateJobId);
}

TEST_P(SupervisorTest, cleanupNeverTouchesActiveJobs) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("sleep", "active", {{"ms", 10000}}));
    ASSERT_TRUE(s.submit("sum", "done", {{"n", 1}}));
    finished("done");

    RetentionPolicy everything;
    everything.maxTerminalRecords = 0;
    everything.maxAge = 1s;
    std::this_thread::sleep_for(1100ms);

    std::size_t removed = 0;
    ASSERT_TRUE(s.cleanup(everything, &removed));
    EXPECT_EQ(removed, 1u);
    EXPECT_TRUE(s.getStatus("active"));
    EXPECT_FALSE(s.getStatus("done"));
    ASSERT_TRUE(s.cancel("active"));
}

TEST_P(SupervisorTest, compactPreservesState) {
    auto& s = startSupervisor();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(s.submit("sum", "c" + std::to_string(i), {{"n", i}}));
    }
    for (int i = 0; i < 5; ++i) {
        finished("c" + std::to_string(i));
    }
    EXPECT_GT(s.stats().registry.supersededLines, 0u);

    ASSERT_TRUE(s.compact());
    RegistryStats after = s.stats().registry;
    EXPECT_EQ(after.supersededLines, 0u);
    EXPECT_EQ(after.lines, 5u);
    EXPECT_EQ((*s.getStatus("c4")->result)["sum"], 10);

    ASSERT_TRUE(s.submit("sum", "post", {{"n", 3}}));
    EXPECT_EQ(finished("post").status, Status::Completed);
}

TEST_P(SupervisorTest, operationsNeedARunningSupervisor) {
    Supervisor idle(baseConfig());
    ASSERT_TRUE(idle.registerJobType<SumJob>("sum"));
    EXPECT_EQ(idle.submit("sum", "x").error, ErrorCode::NotRunning);
    EXPECT_EQ(idle.cancel("x").error, ErrorCode::NotRunning);
    EXPECT_EQ(idle.remove("x").error, ErrorCode::NotRunning);
    EXPECT_FALSE(idle.isRunning());
}

TEST_P(SupervisorTest, registerJobTypeRejectsDuplicates) {
    Supervisor fresh(baseConfig());
    ASSERT_TRUE(fresh.registerJobType<SumJob>("sum"));
    EXPECT_EQ(fresh.registerJobType<FailJob>("sum").error, ErrorCode::InvalidArgument);
    EXPECT_EQ(fresh.registerJobType<FailJob>("").error, ErrorCode::InvalidArgument);
}

TEST_P(SupervisorTest, shutdownLeavesQueuedJobsForNextStart) {
    SupervisorConfig config = baseConfig();
    config.maxConcurrentJobs = 1;
    auto& s = startSupervisor(config);

    ASSERT_TRUE(s.submit("sleep", "running", {{"ms", 10000}}));
    ASSERT_TRUE(reachesStatus("running", Status::Running));
    ASSERT_TRUE(s.submit("sum", "waiting", {{"n", 6}}));

    s.shutdown();
    EXPECT_FALSE(s.isRunning());
    supervisor.reset();

    {
        Registry registry(config.registryPath, false);
        ASSERT_TRUE(registry.open());
        EXPECT_EQ(registry.get("running")->status, Status::Cancelled);
        EXPECT_EQ(registry.get("waiting")->status, Status::Queued);
    }

    auto& restarted = startSupervisor(config);
    JobRecord waiting = finished("waiting");
    EXPECT_EQ(waiting.status, Status::Completed);
    EXPECT_EQ((*waiting.result)["sum"], 21);
    EXPECT_EQ(restarted.getStatus("running")->status, Status::Cancelled);
}

TEST_P(SupervisorTest, shutdownHardStopsJobsThatIgnoreCancel) {
    auto& s = startSupervisor();
    ASSERT_TRUE(s.submit("stubborn", "deaf", {{"ms", 1500}}));
    ASSERT_TRUE(reachesStatus("deaf", Status::Running));

    s.shutdown(100ms);
    supervisor.reset();

    Registry registry(baseConfig().registryPath, false);
    ASSERT_TRUE(registry.open());
    auto deaf = registry.get("deaf");
    ASSERT_TRUE(deaf);
    EXPECT_EQ(deaf->status, Status::Failed);
    ASSERT_TRUE(deaf->error);
    EXPECT_EQ(deaf->error->kind, "Shutdown");
}

TEST_P(SupervisorTest, restartMarksInterruptedJobsFailed) {
    const auto path = baseConfig().registryPath;
    {
        Registry registry(path, false);
        ASSERT_TRUE(registry.open());

        JobRecord running;
        running.id = "was-running";
        running.type = "sum";
        running.params = {{"n", 2}};
        running.createdAt = 1000;
        running.updatedAt = 1000;
        ASSERT_TRUE(registry.append(running));
        for (Status to : {Status::Queued, Status::Running}) {
            ASSERT_TRUE(registry.update("was-running", [to](JobRecord& r) {
                return transition(r, to, r.updatedAt + 1);
            }));
        }

        JobRecord queued = running;
        queued.id = "was-queued";
        queued.params = {{"n", 4}};
        ASSERT_TRUE(registry.append(queued));
        ASSERT_TRUE(registry.update("was-queued", [](JobRecord& r) {
            return transition(r, Status::Queued, r.updatedAt + 1);
        }));

        JobRecord created = running;
        created.id = "was-created";
        ASSERT_TRUE(registry.append(created));
    }

    auto& s = startSupervisor();

    auto interrupted = s.getStatus("was-running");
    ASSERT_TRUE(interrupted);
    EXPECT_EQ(interrupted->status, Status::Failed);
    ASSERT_TRUE(interrupted->error);
    EXPECT_EQ(interrupted->error->kind, "Interrupted");

    EXPECT_EQ((*finished("was-queued").result)["sum"], 10);
    EXPECT_EQ(finished("was-created").status, Status::Completed);
}

TEST_P(SupervisorTest, restartSurvivesTornTrailingLine) {
    {
        auto& s = startSupervisor();
        ASSERT_TRUE(s.submit("sum", "before", {{"n", 5}}));
        finished("before");
        s.shutdown();
        supervisor.reset();
    }

    JobRecord torn;
    torn.id = "torn";
    torn.type = "sum";
    torn.createdAt = nowMillis();
    torn.updatedAt = torn.createdAt;
    std::string line = encode(torn);
    appendFile(baseConfig().registryPath, line.substr(0, line.size() - 5));

    auto& s = startSupervisor();
    EXPECT_EQ((*s.getStatus("before")->result)["sum"], 15);
    EXPECT_FALSE(s.getStatus("torn"));
    ASSERT_TRUE(s.submit("sum", "torn", {{"n", 1}}));
    EXPECT_EQ(finished("torn").status, Status::Completed);
}

TEST_P(SupervisorTest, startFailsOnCorruptRegistry) {
    writeFile(baseConfig().registryPath, "{not json\n{\"also\":\"not a record\"}\n");

    Supervisor broken(baseConfig());
    OpResult r = broken.start();
    EXPECT_FALSE(r);
    EXPECT_EQ(r.error, ErrorCode::DecodeError);
    EXPECT_FALSE(broken.isRunning());
}

INSTANTIATE_TEST_SUITE_P(Isolations, SupervisorTest,
                         ::testing::Values(Isolation::Thread, Isolation::Process),
                         [](const ::testing::TestParamInfo<Isolation>& info) {
                             return std::string(isolationToString(info.param));
                         });

// Only a separate process can die without taking the supervisor with it.
class ProcessIsolationTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(ProcessIsolationTest, crashingChildFailsOnlyItsJob) {
    SupervisorConfig config;
    config.registryPath = dir.file("registry.jsonl");
    config.isolation = Isolation::Process;
    config.syncWrites = false;
    config.cleanupInterval = 0s;
    config.autoStart = true;

    Supervisor s(config);
    registerSampleJobs(s);
    ASSERT_TRUE(s.start());

    ASSERT_TRUE(s.submit("crash", "crash"));
    auto crashed = s.waitFor("crash", kWait);
    ASSERT_TRUE(crashed);
    EXPECT_EQ(crashed->status, Status::Failed);
    ASSERT_TRUE(crashed->error);
    EXPECT_EQ(crashed->error->kind, "Crash");

    ASSERT_TRUE(s.submit("sum", "after", {{"n", 5}}));
    auto after = s.waitFor("after", kWait);
    ASSERT_TRUE(after);
    EXPECT_EQ((*after->result)["sum"], 15);
    s.shutdown();
}

}
