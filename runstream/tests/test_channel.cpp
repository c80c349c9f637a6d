#include <gtest/gtest.h>
#include <runstream/channel.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using runstream::Channel;
using runstream::StreamCancelled;
using runstream::VectorSource;

TEST(VectorSourceTest, YieldsInOrderThenEnds) {
    VectorSource<int> source(std::vector<int>{1, 2, 3});

    EXPECT_EQ(source.next(), 1);
    EXPECT_EQ(source.next(), 2);
    EXPECT_EQ(source.next(), 3);
    EXPECT_EQ(source.next(), std::nullopt);
    EXPECT_EQ(source.next(), std::nullopt);
    EXPECT_EQ(source.consumed(), 3u);
}

TEST(VectorSourceTest, CancelStopsIteration) {
    VectorSource<int> source(std::vector<int>{1, 2, 3});
    EXPECT_EQ(source.next(), 1);

    source.cancel();
    EXPECT_TRUE(source.is_cancelled());
    EXPECT_THROW(source.next(), StreamCancelled);
    EXPECT_EQ(source.consumed(), 1u);
}

TEST(ChannelTest, RejectsZeroCapacity) {
    EXPECT_THROW(Channel<int>(0), std::invalid_argument);
}

TEST(ChannelTest, DrainsBufferedItemsAfterClose) {
    Channel<int> channel(4);
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    channel.close();

    EXPECT_TRUE(channel.is_closed());
    EXPECT_EQ(channel.next(), 1);
    EXPECT_EQ(channel.next(), 2);
    EXPECT_EQ(channel.next(), std::nullopt);
}

TEST(ChannelTest, PushAfterCloseIsError) {
    Channel<int> channel(2);
    channel.close();
    EXPECT_THROW(channel.push(1), std::logic_error);
    EXPECT_FALSE(channel.try_push(1));
}

TEST(ChannelTest, TryPushRespectsCapacity) {
    Channel<int> channel(2);
    EXPECT_TRUE(channel.try_push(1));
    EXPECT_TRUE(channel.try_push(2));
    EXPECT_FALSE(channel.try_push(3));
    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.capacity(), 2u);
}

TEST(ChannelTest, ProducerBlocksWhileFull) {
    Channel<int> channel(1);
    std::atomic<int> pushed{0};

    std::thread producer([&]() {
        for (int i = 0; i < 3; ++i) {
            channel.push(i);
            pushed.fetch_add(1);
        }
        channel.close();
    });

    // Only the first item fits before the consumer pulls
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(pushed.load(), 1);

    std::vector<int> received;
    while (auto item = channel.next()) {
        received.push_back(*item);
    }
    producer.join();

    EXPECT_EQ(received, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(pushed.load(), 3);
}

TEST(ChannelTest, CancelReleasesBlockedProducer) {
    Channel<int> channel(1);
    std::atomic<bool> accepted{true};

    ASSERT_TRUE(channel.push(0));
    std::thread producer([&]() {
        accepted.store(channel.push(1));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.cancel();
    producer.join();

    EXPECT_FALSE(accepted.load());
    EXPECT_TRUE(channel.is_cancelled());
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_THROW(channel.next(), StreamCancelled);
    EXPECT_FALSE(channel.push(2));
}

TEST(ChannelTest, CancelWakesWaitingConsumer) {
    Channel<int> channel(1);
    std::atomic<bool> cancelled_seen{false};

    std::thread consumer([&]() {
        try {
            channel.next();
        } catch (const StreamCancelled&) {
            cancelled_seen.store(true);
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.cancel();
    consumer.join();

    EXPECT_TRUE(cancelled_seen.load());
}

TEST(ChannelTest, ManyProducers) {
    Channel<int> channel(8);
    const int per_producer = 100;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel, p, per_producer]() {
            for (int i = 0; i < per_producer; ++i) {
                channel.push(p * per_producer + i);
            }
        });
    }

    std::thread closer([&]() {
        for (auto& producer : producers) {
            producer.join();
        }
        channel.close();
    });

    long long sum = 0;
    int count = 0;
    while (auto item = channel.next()) {
        sum += *item;
        ++count;
    }
    closer.join();

    EXPECT_EQ(count, 4 * per_producer);
    EXPECT_EQ(sum, static_cast<long long>(4 * per_producer) * (4 * per_producer - 1) / 2);
}
