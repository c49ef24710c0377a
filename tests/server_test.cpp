#include <gtest/gtest.h>

#include <stdexcept>

#include "fastpass/server.hpp"

using namespace fastpass;

class ServerTest : public ::testing::Test {
protected:
    Customer make(CustomerId id, CustomerClass cls) {
        Customer c;
        c.id = id;
        c.cls = cls;
        c.arrivalTime = clock.now();
        return c;
    }

    EventClock clock;
    PriorityQueue queue;
    RandomVariateSource rng{2024};
    Server server{clock, queue, rng, 1.0};
};

TEST_F(ServerTest, IdleWithEmptyQueueDoesNothing) {
    EXPECT_FALSE(server.tryServe());
    EXPECT_FALSE(server.busy());
    EXPECT_FALSE(clock.departurePending());
}

TEST_F(ServerTest, TryServeStartsServiceAndSchedulesDeparture) {
    queue.enqueue(make(1, CustomerClass::Regular));
    ASSERT_TRUE(server.tryServe());

    EXPECT_TRUE(server.busy());
    ASSERT_TRUE(server.currentCustomer().has_value());
    EXPECT_EQ(server.currentCustomer()->id, 1u);
    EXPECT_DOUBLE_EQ(server.currentCustomer()->serviceStartTime, 0.0);
    EXPECT_TRUE(queue.empty());

    ASSERT_TRUE(clock.departurePending());
    EXPECT_EQ(clock.peek().customerId, 1u);
    EXPECT_GT(clock.peek().time, 0.0);
}

TEST_F(ServerTest, BusyServerDoesNotTakeAnother) {
    queue.enqueue(make(1, CustomerClass::Regular));
    ASSERT_TRUE(server.tryServe());
    queue.enqueue(make(2, CustomerClass::Priority));
    EXPECT_FALSE(server.tryServe());
    EXPECT_EQ(server.currentCustomer()->id, 1u);
    EXPECT_TRUE(queue.contains(2));
}

TEST_F(ServerTest, ReleaseStampsDepartureAndGoesIdle) {
    queue.enqueue(make(1, CustomerClass::Priority));
    ASSERT_TRUE(server.tryServe());

    Event dep = clock.advance();
    Customer done = server.release(dep);
    EXPECT_EQ(done.id, 1u);
    EXPECT_DOUBLE_EQ(done.departureTime, dep.time);
    EXPECT_LE(done.arrivalTime, done.serviceStartTime);
    EXPECT_LE(done.serviceStartTime, done.departureTime);
    EXPECT_FALSE(server.busy());
}

TEST_F(ServerTest, PriorityHeadServedNext) {
    queue.enqueue(make(1, CustomerClass::Regular));
    ASSERT_TRUE(server.tryServe());
    queue.enqueue(make(2, CustomerClass::Regular));
    queue.enqueue(make(3, CustomerClass::Priority));

    server.release(clock.advance());
    ASSERT_TRUE(server.tryServe());
    EXPECT_EQ(server.currentCustomer()->id, 3u);
}

TEST_F(ServerTest, MismatchedDepartureThrows) {
    queue.enqueue(make(1, CustomerClass::Regular));
    ASSERT_TRUE(server.tryServe());
    Event bogus{clock.peek().time, EventKind::Departure, 99, 7};
    EXPECT_THROW(server.release(bogus), std::logic_error);
    EXPECT_TRUE(server.busy());
}

TEST_F(ServerTest, DepartureWhileIdleThrows) {
    Event dep{1.0, EventKind::Departure, 0, 1};
    EXPECT_THROW(server.release(dep), std::logic_error);
}
