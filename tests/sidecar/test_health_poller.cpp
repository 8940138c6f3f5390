/*
Sandcastle - HealthPoller Tests
Role: Verify fixed-interval readiness polling against a real loopback HTTP endpoint
Testing Strategy: FakeHealthServer with scripted status codes → assert attempts, spacing, errors
Coverage: Immediate success, success after failures, redirects, exhaustion, connection refused
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QSignalSpy>
#include <QTest>
#include "sidecar/HealthPoller.hpp"
#include "sidecar/SidecarError.hpp"
#include "fixtures/FakeHealthServer.hpp"

namespace {

HealthPolicy fastPolicy(int maxAttempts, int retryIntervalMs) {
    HealthPolicy policy;
    policy.maxAttempts = maxAttempts;
    policy.retryIntervalMs = retryIntervalMs;
    policy.requestTimeoutMs = 1000;
    return policy;
}

bool waitFinished(const QFuture<int>& future, int timeoutMs = 10000) {
    return QTest::qWaitFor([&]{ return future.isFinished(); }, timeoutMs);
}

} // namespace

TEST(HealthPoller, SucceedsOnFirstHealthyResponse) {
    fixtures::FakeHealthServer server({200});
    ASSERT_TRUE(server.listen());

    HealthPoller poller(fastPolicy(50, 100));
    QSignalSpy ready(&poller, &HealthPoller::ready);
    QFuture<int> future = poller.poll(server.port());

    ASSERT_TRUE(waitFinished(future));
    EXPECT_EQ(future.result(), 1);
    EXPECT_EQ(server.requestCount(), 1);
    ASSERT_EQ(ready.count(), 1);
    EXPECT_EQ(ready.at(0).at(0).toInt(), 1);
}

TEST(HealthPoller, ProbesTheHealthPath) {
    fixtures::FakeHealthServer server({200});
    ASSERT_TRUE(server.listen());

    HealthPoller poller(fastPolicy(5, 10));
    QFuture<int> future = poller.poll(server.port());

    ASSERT_TRUE(waitFinished(future));
    ASSERT_EQ(server.paths().size(), 1);
    EXPECT_EQ(server.paths().first(), QStringLiteral("/api/health"));
}

TEST(HealthPoller, SucceedsOnFifthAttemptAfterFourSpacedFailures) {
    fixtures::FakeHealthServer server({503, 503, 503, 503, 200});
    ASSERT_TRUE(server.listen());

    HealthPoller poller(fastPolicy(50, 100));
    QSignalSpy failures(&poller, &HealthPoller::probeFailed);
    QFuture<int> future = poller.poll(server.port());

    ASSERT_TRUE(waitFinished(future));
    EXPECT_EQ(future.result(), 5);
    EXPECT_EQ(failures.count(), 4);
    ASSERT_EQ(server.requestCount(), 5);

    const auto& times = server.requestTimesMs();
    for (int i = 1; i < times.size(); ++i) {
        EXPECT_GE(times.at(i) - times.at(i - 1), 90) << "probe " << i;
    }
    EXPECT_EQ(failures.at(0).at(1).toString(), QStringLiteral("HTTP 503"));
}

TEST(HealthPoller, RedirectCountsAsFailedAttempt) {
    // Each 302 points back at /api/health; following it would reach the 200 early.
    fixtures::FakeHealthServer server({302, 302, 200});
    ASSERT_TRUE(server.listen());

    HealthPoller poller(fastPolicy(10, 20));
    QSignalSpy failures(&poller, &HealthPoller::probeFailed);
    QFuture<int> future = poller.poll(server.port());

    ASSERT_TRUE(waitFinished(future));
    EXPECT_EQ(future.result(), 3);
    ASSERT_EQ(failures.count(), 2);
    EXPECT_EQ(failures.at(0).at(1).toString(), QStringLiteral("HTTP 302"));
    EXPECT_EQ(server.requestCount(), 3);
}

TEST(HealthPoller, FailsWithBudgetAfterExhaustingAttempts) {
    fixtures::FakeHealthServer server({500});
    ASSERT_TRUE(server.listen());

    HealthPoller poller(fastPolicy(3, 10));
    QSignalSpy failures(&poller, &HealthPoller::probeFailed);
    QSignalSpy ready(&poller, &HealthPoller::ready);
    QFuture<int> future = poller.poll(server.port());

    ASSERT_TRUE(waitFinished(future));
    EXPECT_EQ(server.requestCount(), 3);
    EXPECT_EQ(failures.count(), 3);
    EXPECT_EQ(ready.count(), 0);

    try {
        future.result();
        FAIL() << "expected HealthCheckFailed";
    } catch (const SidecarError& e) {
        EXPECT_EQ(e.kind(), SidecarErrorKind::HealthCheckFailed);
        EXPECT_EQ(e.message(), QStringLiteral("Server failed to respond to health check within 30ms"));
    }
}

TEST(HealthPoller, RetriesWhenConnectionIsRefused) {
    HealthPoller poller(fastPolicy(2, 10));
    QSignalSpy failures(&poller, &HealthPoller::probeFailed);
    QFuture<int> future = poller.poll(fixtures::closedPort());

    ASSERT_TRUE(waitFinished(future));
    EXPECT_EQ(failures.count(), 2);
    EXPECT_THROW(future.result(), SidecarError);
}

TEST(HealthPoller, SecondPollReturnsRunningFuture) {
    fixtures::FakeHealthServer server({503, 200});
    ASSERT_TRUE(server.listen());

    HealthPoller poller(fastPolicy(5, 20));
    QFuture<int> first = poller.poll(server.port());
    QFuture<int> second = poller.poll(server.port());

    ASSERT_TRUE(waitFinished(second));
    EXPECT_TRUE(first.isFinished());
    EXPECT_EQ(first.result(), 2);
    EXPECT_EQ(server.requestCount(), 2);
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
