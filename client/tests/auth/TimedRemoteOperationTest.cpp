#include "backend/auth/TimedRemoteOperation.h"
#include "TestSupport.h"
#include <QList>
#include <gtest/gtest.h>
#include <stdexcept>

namespace {
struct ResultCollector {
    QList<RemoteOperationResult> results;

    void attach(TimedRemoteOperation& op) {
        QObject::connect(&op, &TimedRemoteOperation::resolved, [this](const RemoteOperationResult& r) { results.append(r); });
    }
};

RemoteCall replyAfter(int delayMs, const RemoteCallOutcome& outcome) {
    return [delayMs, outcome](const RemoteCallCompletion& done) {
        QTimer::singleShot(delayMs, [done, outcome]() { done(outcome); });
    };
}
}

TEST(TimedRemoteOperationTest, SuccessBeforeTimeout) {
    TimedRemoteOperation op;
    op.setTimeoutMs(5000);
    ResultCollector collector;
    collector.attach(op);

    ASSERT_TRUE(op.start(replyAfter(20, RemoteCallOutcome::reply(true, "welcome"))));
    EXPECT_TRUE(op.isSubmitting());
    ASSERT_TRUE(waitUntil([&] { return !collector.results.isEmpty(); }));

    EXPECT_TRUE(collector.results.first().isSuccess());
    EXPECT_EQ(collector.results.first().message(), QString("welcome"));
    EXPECT_EQ(op.state(), TimedRemoteOperation::State::Succeeded);
}

TEST(TimedRemoteOperationTest, RejectionBeforeTimeout) {
    TimedRemoteOperation op;
    ResultCollector collector;
    collector.attach(op);

    op.start(replyAfter(0, RemoteCallOutcome::reply(false, "user exists")));
    ASSERT_TRUE(waitUntil([&] { return !collector.results.isEmpty(); }));

    EXPECT_TRUE(collector.results.first().isFailure());
    EXPECT_EQ(collector.results.first().message(), QString("user exists"));
    EXPECT_EQ(op.state(), TimedRemoteOperation::State::Failed);
}

TEST(TimedRemoteOperationTest, TimerWinsAndLateResultIsDropped) {
    TimedRemoteOperation op;
    op.setTimeoutMs(30);
    ResultCollector collector;
    collector.attach(op);

    op.start(replyAfter(200, RemoteCallOutcome::reply(true, "too late")));
    ASSERT_TRUE(waitUntil([&] { return !collector.results.isEmpty(); }));
    EXPECT_TRUE(collector.results.first().isTimeout());

    // Let the slow reply arrive; it must not produce a second result
    spinFor(300);
    EXPECT_EQ(collector.results.size(), 1);
    EXPECT_EQ(op.state(), TimedRemoteOperation::State::TimedOut);
}

TEST(TimedRemoteOperationTest, ErrorKindsAreKept) {
    TimedRemoteOperation op;
    ResultCollector collector;
    collector.attach(op);

    op.start(replyAfter(0, RemoteCallOutcome::failed(RemoteErrorKind::Transport, "refused")));
    ASSERT_TRUE(waitUntil([&] { return collector.results.size() == 1; }));
    EXPECT_TRUE(collector.results.last().isErrored());
    EXPECT_EQ(collector.results.last().errorKind(), RemoteErrorKind::Transport);

    op.start(replyAfter(0, RemoteCallOutcome::failed(RemoteErrorKind::Cancelled, "aborted")));
    ASSERT_TRUE(waitUntil([&] { return collector.results.size() == 2; }));
    EXPECT_EQ(collector.results.last().errorKind(), RemoteErrorKind::Cancelled);
}

TEST(TimedRemoteOperationTest, ThrowingCallResolvesAsUnexpected) {
    TimedRemoteOperation op;
    ResultCollector collector;
    collector.attach(op);

    op.start([](const RemoteCallCompletion&) { throw std::runtime_error("boom"); });

    ASSERT_EQ(collector.results.size(), 1);
    EXPECT_TRUE(collector.results.first().isErrored());
    EXPECT_EQ(collector.results.first().errorKind(), RemoteErrorKind::Unexpected);
    EXPECT_EQ(collector.results.first().message(), QString("boom"));
    EXPECT_FALSE(op.isSubmitting());
}

TEST(TimedRemoteOperationTest, OverlappingStartIsRejected) {
    TimedRemoteOperation op;
    op.setTimeoutMs(50);
    ResultCollector collector;
    collector.attach(op);

    int calls = 0;
    const RemoteCall never = [&calls](const RemoteCallCompletion&) { ++calls; };
    EXPECT_TRUE(op.start(never));
    EXPECT_FALSE(op.start(never));
    EXPECT_EQ(calls, 1);

    ASSERT_TRUE(waitUntil([&] { return !collector.results.isEmpty(); }));
    EXPECT_EQ(collector.results.size(), 1);
    EXPECT_TRUE(op.start(never));
}

TEST(TimedRemoteOperationTest, CompletionFromWorkerThreadLandsOnOwner) {
    TimedRemoteOperation op;
    QThread* resolvedOn = nullptr;
    QObject::connect(&op, &TimedRemoteOperation::resolved, [&resolvedOn](const RemoteOperationResult&) {
        resolvedOn = QThread::currentThread();
    });

    QThread* worker = nullptr;
    op.start([&worker](const RemoteCallCompletion& done) {
        worker = QThread::create([done]() { done(RemoteCallOutcome::reply(true, "from worker")); });
        worker->start();
    });

    ASSERT_TRUE(waitUntil([&] { return resolvedOn != nullptr; }));
    EXPECT_EQ(resolvedOn, QCoreApplication::instance()->thread());
    ASSERT_NE(worker, nullptr);
    worker->wait();
    delete worker;
}

TEST(TimedRemoteOperationTest, ResultOfEarlierSubmissionIgnored) {
    TimedRemoteOperation op;
    op.setTimeoutMs(20);
    ResultCollector collector;
    collector.attach(op);

    RemoteCallCompletion firstCompletion;
    op.start([&firstCompletion](const RemoteCallCompletion& done) { firstCompletion = done; });
    ASSERT_TRUE(waitUntil([&] { return collector.results.size() == 1; }));

    op.setTimeoutMs(5000);
    op.start([](const RemoteCallCompletion&) {});
    firstCompletion(RemoteCallOutcome::reply(true, "stale"));
    spinFor(50);

    EXPECT_EQ(collector.results.size(), 1);
    EXPECT_TRUE(op.isSubmitting());
}
