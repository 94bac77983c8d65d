#include <gtest/gtest.h>
#include <managers/job.hpp>
#include <thread>

TEST(JobTest, StartsQueued) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    auto s = job.snapshot();
    EXPECT_EQ(s.status, JobStatus::Queued);
    EXPECT_EQ(s.percent, 0);
    EXPECT_TRUE(s.step.empty());
    EXPECT_FALSE(s.done);
    EXPECT_FALSE(s.return_code.has_value());
    EXPECT_FALSE(s.created_at.empty());
}

TEST(JobTest, MarkRunning) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();
    auto s = job.snapshot();
    EXPECT_EQ(s.status, JobStatus::Running);
    EXPECT_EQ(s.step, "starting");
}

TEST(JobTest, ProgressClampsAndKeepsStepOnBlank) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();

    job.set_progress(150, "Loading");
    EXPECT_EQ(job.snapshot().percent, 100);
    EXPECT_EQ(job.snapshot().step, "Loading");

    job.set_progress(-5, "");
    EXPECT_EQ(job.snapshot().percent, 0);
    EXPECT_EQ(job.snapshot().step, "Loading");
}

TEST(JobTest, CompletedMarkerDoesNotFinish) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();
    job.mark_completed_marker();

    auto s = job.snapshot();
    EXPECT_EQ(s.percent, 100);
    EXPECT_EQ(s.step, "done");
    EXPECT_EQ(s.status, JobStatus::Running);
    EXPECT_FALSE(s.done);
}

TEST(JobTest, CleanExitForcesCompletion) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();
    job.finish(0);

    auto s = job.snapshot();
    EXPECT_EQ(s.status, JobStatus::Finished);
    EXPECT_EQ(s.percent, 100);
    EXPECT_EQ(s.step, "done");
    EXPECT_TRUE(s.done);
    ASSERT_TRUE(s.return_code.has_value());
    EXPECT_EQ(*s.return_code, 0);
    EXPECT_FALSE(s.finished_at.empty());
    EXPECT_TRUE(job.finished_time().has_value());
}

TEST(JobTest, CleanExitKeepsCustomStep) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();
    job.set_progress(30, "Cleaning up");
    job.finish(0);
    EXPECT_EQ(job.snapshot().step, "Cleaning up");
    EXPECT_EQ(job.snapshot().percent, 100);
}

TEST(JobTest, FailureKeepsLastProgress) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();
    job.set_progress(60, "Crunching");
    job.finish(3);

    auto s = job.snapshot();
    EXPECT_EQ(s.status, JobStatus::Error);
    EXPECT_EQ(s.percent, 60);
    EXPECT_EQ(s.step, "Crunching");
    EXPECT_TRUE(s.done);
    EXPECT_EQ(*s.return_code, 3);
}

TEST(JobTest, FailLaunchSkipsRunning) {
    Job job("id1", "notes.txt", "/tmp/id1.log");
    job.fail_launch(127);

    auto s = job.snapshot();
    EXPECT_EQ(s.status, JobStatus::Error);
    EXPECT_TRUE(s.done);
    EXPECT_EQ(*s.return_code, 127);
    EXPECT_TRUE(s.step.empty());
}

TEST(JobTest, TerminalStateIsFinal) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.mark_running();
    job.finish(2);

    job.set_progress(90, "late");
    job.mark_completed_marker();
    job.finish(0);
    job.mark_running();

    auto s = job.snapshot();
    EXPECT_EQ(s.status, JobStatus::Error);
    EXPECT_EQ(*s.return_code, 2);
    EXPECT_EQ(s.percent, 0);
}

TEST(JobTest, HistoryCapacityIsExact) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    for (int i = 0; i < 2500; ++i) job.append_line("line " + std::to_string(i));
    EXPECT_EQ(job.history().size(), 2500u);
    EXPECT_EQ(job.history().front(), "line 0");

    job.append_line("line 2500");
    auto h = job.history();
    EXPECT_EQ(h.size(), 2500u);
    EXPECT_EQ(h.front(), "line 1");
    EXPECT_EQ(h.back(), "line 2500");
    EXPECT_EQ(job.snapshot().total_lines, 2501u);
}

TEST(JobTest, ReadSinceAdvancesCursor) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    job.append_line("a");
    job.append_line("b");

    auto u1 = job.read_since(0);
    ASSERT_EQ(u1.lines.size(), 2u);
    EXPECT_EQ(u1.next_cursor, 2u);

    job.append_line("c");
    auto u2 = job.read_since(u1.next_cursor);
    ASSERT_EQ(u2.lines.size(), 1u);
    EXPECT_EQ(u2.lines[0], "c");

    auto u3 = job.read_since(u2.next_cursor);
    EXPECT_TRUE(u3.lines.empty());
    EXPECT_EQ(u3.next_cursor, 3u);
}

TEST(JobTest, StaleCursorResumesAtOldestRetained) {
    Job job("id1", "hello.py", "/tmp/id1.log", 3);
    for (int i = 0; i < 5; ++i) job.append_line(std::to_string(i));

    auto u = job.read_since(1);
    ASSERT_EQ(u.lines.size(), 3u);
    EXPECT_EQ(u.lines[0], "2");
    EXPECT_EQ(u.lines[2], "4");
    EXPECT_EQ(u.next_cursor, 5u);
}

TEST(JobTest, WaitForUpdateWakesOnAppend) {
    Job job("id1", "hello.py", "/tmp/id1.log");
    std::thread writer([&job] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        job.append_line("hello");
    });

    auto start = std::chrono::steady_clock::now();
    job.wait_for_update(0, std::chrono::seconds(5));
    auto waited = std::chrono::steady_clock::now() - start;
    writer.join();

    EXPECT_LT(waited, std::chrono::seconds(4));
    EXPECT_EQ(job.read_since(0).lines.size(), 1u);
}

TEST(JobTest, StatusNames) {
    EXPECT_STREQ(to_string(JobStatus::Queued), "queued");
    EXPECT_STREQ(to_string(JobStatus::Running), "running");
    EXPECT_STREQ(to_string(JobStatus::Finished), "finished");
    EXPECT_STREQ(to_string(JobStatus::Error), "error");
}
