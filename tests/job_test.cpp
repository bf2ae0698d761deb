/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// qmgr headers
#include "qmgr/job.hpp"

// qmgr test helpers
#include "fakes/sample_jobs.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace qmgr::test {

using ::testing::ElementsAre;

namespace {
class FlagContext : public JobContext {
public:
    bool cancelled() const noexcept override { return cancel; }
    void reportProgress(int progress, const std::string&) noexcept override { last = progress; }

    bool cancel = false;
    int last = -1;
};

JobFactory factoryFor(const std::string& kind) {
    return [kind](const JobId& id, const nlohmann::json& params) -> std::unique_ptr<Job> {
        if (kind == "sum") return std::make_unique<SumJob>(id, params);
        if (kind == "null") return nullptr;
        return std::make_unique<FailJob>(id, params);
    };
}

struct NotAnException {};
}

TEST(job_types_tests, registersAndCreatesByName) {
    JobTypes types;
    ASSERT_TRUE(types.add("sum", factoryFor("sum")));
    ASSERT_TRUE(types.add("fail", factoryFor("fail")));

    EXPECT_TRUE(types.contains("sum"));
    EXPECT_FALSE(types.contains("other"));
    EXPECT_THAT(types.names(), ElementsAre("fail", "sum"));

    auto job = types.create("sum", "j1", {{"n", 3}});
    ASSERT_TRUE(job);
    EXPECT_EQ(job->id(), "j1");
    EXPECT_EQ(job->params()["n"], 3);

    FlagContext ctx;
    EXPECT_EQ(job->execute(ctx)["sum"], 6);
}

TEST(job_types_tests, rejectsBadRegistrations) {
    JobTypes types;
    ASSERT_TRUE(types.add("sum", factoryFor("sum")));
    EXPECT_EQ(types.add("sum", factoryFor("sum")).error, ErrorCode::InvalidArgument);
    EXPECT_EQ(types.add("", factoryFor("sum")).error, ErrorCode::InvalidArgument);
    EXPECT_EQ(types.add("empty", JobFactory{}).error, ErrorCode::InvalidArgument);
}

TEST(job_types_tests, createFailsLoudly) {
    JobTypes types;
    ASSERT_TRUE(types.add("null", factoryFor("null")));
    EXPECT_THROW((void)types.create("missing", "j", {}), std::invalid_argument);
    EXPECT_THROW((void)types.create("null", "j", {}), std::runtime_error);
}

TEST(job_tests, cancellationIsCooperative) {
    SumJob job("j", {{"n", 100}});
    FlagContext ctx;
    ctx.cancel = true;
    EXPECT_THROW(job.execute(ctx), JobCancelled);
}

TEST(fault_tests, describesStandardExceptions) {
    JobError e = describeFault(std::make_exception_ptr(std::runtime_error("boom")));
    EXPECT_EQ(e.kind, "std::runtime_error");
    EXPECT_EQ(e.message, "boom");

    JobError cancelled = describeFault(std::make_exception_ptr(JobCancelled()));
    EXPECT_EQ(cancelled.kind, "qmgr::JobCancelled");
}

TEST(fault_tests, describesForeignThrows) {
    EXPECT_EQ(describeFault(std::make_exception_ptr(42)).kind, "UnknownException");
    EXPECT_EQ(describeFault(std::make_exception_ptr(NotAnException{})).kind, "UnknownException");
    EXPECT_EQ(describeFault(nullptr).kind, "UnknownException");
}

}
