#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "CallBatcher.hpp"
#include "ConnectionPool.hpp"
#include "DefinitionCacher.hpp"
#include "ErrorHandler.hpp"
#include "FakeConnection.hpp"
#include "LoadBalancer.hpp"
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace mcpperf;
using namespace mcpperf::test;
using namespace std::chrono_literals;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        poolConfig_.max_connections = 3;
        poolConfig_.max_total_connections = 10;
        poolConfig_.acquire_timeout = 5000ms;
    }

    PoolConfig poolConfig_;
    FakeFactory factory_;
};

TEST_F(EndToEndTest, PooledCallsQueueBehindLimit) {
    factory_.callDelay = 20ms;
    ConnectionPool pool(factory_.factory(), poolConfig_);
    ConnectionOptions options{"http://server"};

    auto start = std::chrono::steady_clock::now();
    std::vector<std::future<ToolCallResult>> calls;
    for (int i = 0; i < 10; ++i) {
        calls.push_back(std::async(std::launch::async, [&pool, &options, i] {
            return pool.withConnection(options, [i](Connection& conn) {
                return conn.callTool("echo", Json{{"i", i}});
            });
        }));
    }
    for (auto& call : calls) {
        EXPECT_FALSE(call.get().isError);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Ten 20ms calls over three connections need four rounds
    EXPECT_LE(factory_.createdCount(), 3u);
    EXPECT_GE(elapsed, 80ms);
    EXPECT_LT(elapsed, 1000ms);
    for (const auto& conn : factory_.created()) {
        EXPECT_FALSE(conn->concurrentUse.load());
    }

    auto stats = pool.getStats();
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(stats.totalCreated + stats.totalReused, 10u);
}

TEST_F(EndToEndTest, BatcherRunsCallsOverPool) {
    factory_.callDelay = 10ms;
    ConnectionPool pool(factory_.factory(), poolConfig_);
    ConnectionOptions options{"http://server"};

    BatcherConfig batcherConfig;
    batcherConfig.max_batch_size = 6;
    batcherConfig.max_wait = 20ms;
    CallBatcher batcher(makeParallelExecutor([&](const ToolCall& call) {
        return pool.withConnection(options, [&](Connection& conn) {
            return conn.callTool(call.name, call.args);
        });
    }, 3), batcherConfig);

    std::vector<std::future<ToolCallResult>> results;
    for (int i = 0; i < 6; ++i) {
        results.push_back(batcher.call("echo", Json{{"i", i}}));
    }

    for (int i = 0; i < 6; ++i) {
        auto result = results[i].get();
        ASSERT_EQ(result.content.size(), 1u);
        EXPECT_EQ(*result.content[0].text, ("echo:" + Json{{"i", i}}.dump()));
    }

    EXPECT_EQ(batcher.getStats().totalBatches, 1u);
    EXPECT_EQ(batcher.getStats().callsSaved, 5u);
    EXPECT_LE(factory_.createdCount(), 3u);
}

TEST_F(EndToEndTest, CacherFetchesThroughBalancedPool) {
    ConnectionPool pool(factory_.factory(), poolConfig_);
    LoadBalancer balancer({"http://primary", "http://replica"});

    DefinitionCacher::Fetchers fetchers;
    fetchers.tools = [&] {
        return pool.withConnection(ConnectionOptions{balancer.next()},
                                   [](Connection& conn) { return conn.listTools(); });
    };
    fetchers.prompts = [&] {
        return pool.withConnection(ConnectionOptions{balancer.next()},
                                   [](Connection& conn) { return conn.listPrompts(); });
    };
    DefinitionCacher cacher(fetchers);

    cacher.preload();
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(cacher.getTool("echo").has_value());
        EXPECT_TRUE(cacher.getPrompt("summarize").has_value());
    }

    auto detailed = pool.getDetailedStats();
    EXPECT_EQ(detailed.byEndpoint.size(), 2u);
    EXPECT_EQ(detailed.totalCreated, 2u);
    EXPECT_EQ(cacher.getStats().misses, 2u);
    EXPECT_EQ(cacher.getStats().hits, 10u);
}

TEST_F(EndToEndTest, ShutdownFailsPendingWork) {
    poolConfig_.max_connections = 1;
    ConnectionPool pool(factory_.factory(), poolConfig_);
    auto held = pool.acquire("http://server");

    auto waiter = std::async(std::launch::async, [&pool] {
        return pool.acquire("http://server");
    });
    std::this_thread::sleep_for(30ms);
    pool.shutdown();

    EXPECT_THROW(waiter.get(), ShutdownError);
    EXPECT_THROW(pool.acquire("http://server"), ShutdownError);
    EXPECT_NO_THROW(pool.release(held));
}
