#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "DefinitionCacher.hpp"
#include "ErrorHandler.hpp"
#include "MemoryStorageAdapter.hpp"
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcpperf;
using namespace std::chrono_literals;

class DefinitionCacherTest : public ::testing::Test {
protected:
    DefinitionCacher::Fetchers countingFetchers() {
        DefinitionCacher::Fetchers fetchers;
        fetchers.tools = [this] {
            ++toolFetches_;
            if (fetchDelay_.count() > 0) {
                std::this_thread::sleep_for(fetchDelay_);
            }
            if (failFetches_) {
                throw std::runtime_error("server unavailable");
            }
            return std::vector<ToolDefinition>{
                ToolDefinition{"echo", std::string("Echo the input"), Json::object()},
                ToolDefinition{"search", std::nullopt, Json{{"type", "object"}}}
            };
        };
        fetchers.resources = [this] {
            ++resourceFetches_;
            return std::vector<ResourceDefinition>{
                ResourceDefinition{"file:///readme", "readme", std::nullopt, std::string("text/plain")}
            };
        };
        fetchers.prompts = [this] {
            ++promptFetches_;
            return std::vector<PromptDefinition>{
                PromptDefinition{"summarize", std::nullopt, {PromptArgument{"text", std::nullopt, true}}}
            };
        };
        return fetchers;
    }

    template<typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(2ms);
        }
        return pred();
    }

    std::atomic<int> toolFetches_{0};
    std::atomic<int> resourceFetches_{0};
    std::atomic<int> promptFetches_{0};
    std::atomic<bool> failFetches_{false};
    std::chrono::milliseconds fetchDelay_{0};
};

// Basic hit/miss behaviour
TEST_F(DefinitionCacherTest, SecondGetIsHit) {
    DefinitionCacher cacher(countingFetchers());

    auto first = cacher.getTools();
    auto second = cacher.getTools();

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(second[0].name, "echo");
    EXPECT_EQ(toolFetches_.load(), 1);

    auto stats = cacher.getStats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate, 0.5);
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_GT(stats.bytesUsed, 0u);
}

TEST_F(DefinitionCacherTest, KindsAreCachedSeparately) {
    DefinitionCacher cacher(countingFetchers());

    cacher.getTools();
    auto resources = cacher.getResources();
    auto prompts = cacher.getPrompts();

    EXPECT_EQ(resources[0].uri, "file:///readme");
    EXPECT_EQ(prompts[0].arguments[0].name, "text");
    EXPECT_TRUE(prompts[0].arguments[0].required);
    EXPECT_EQ(cacher.getStats().entries, 3u);
}

TEST_F(DefinitionCacherTest, ForceRefreshFetchesAgain) {
    DefinitionCacher cacher(countingFetchers());

    cacher.getTools();
    cacher.getTools({.forceRefresh = true});

    EXPECT_EQ(toolFetches_.load(), 2);
    EXPECT_EQ(cacher.getStats().misses, 2u);
}

TEST_F(DefinitionCacherTest, ExpiredEntryIsRefetched) {
    CacherConfig config;
    config.ttl = 20ms;
    DefinitionCacher cacher(countingFetchers(), config);

    cacher.getTools();
    EXPECT_TRUE(cacher.isValid(CacheKind::Tools));

    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(cacher.isValid(CacheKind::Tools));

    cacher.getTools();
    EXPECT_EQ(toolFetches_.load(), 2);
}

TEST_F(DefinitionCacherTest, MissingFetcherThrows) {
    DefinitionCacher cacher(DefinitionCacher::Fetchers{});

    EXPECT_THROW(cacher.getTools(), ConfigurationError);
    EXPECT_THROW(cacher.getPrompts(), ConfigurationError);
}

TEST_F(DefinitionCacherTest, FetchFailurePropagatesAndLeavesNoEntry) {
    DefinitionCacher cacher(countingFetchers());
    failFetches_ = true;

    try {
        cacher.getTools();
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("server unavailable"));
    }

    EXPECT_FALSE(cacher.isValid(CacheKind::Tools));
    EXPECT_EQ(cacher.getStats().entries, 0u);

    // A later call starts a new fetch
    failFetches_ = false;
    EXPECT_EQ(cacher.getTools().size(), 2u);
    EXPECT_EQ(toolFetches_.load(), 2);
}

// Single-flight
TEST_F(DefinitionCacherTest, ConcurrentMissesShareOneFetch) {
    fetchDelay_ = 50ms;
    DefinitionCacher cacher(countingFetchers());

    std::vector<std::thread> threads;
    std::atomic<int> results{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (cacher.getTools().size() == 2u) {
                ++results;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(results.load(), 8);
    EXPECT_EQ(toolFetches_.load(), 1);
}

TEST_F(DefinitionCacherTest, ConcurrentMissesShareOneFailure) {
    fetchDelay_ = 50ms;
    failFetches_ = true;
    DefinitionCacher cacher(countingFetchers());

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            try {
                cacher.getTools();
            } catch (const TransportError&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 4);
    EXPECT_EQ(toolFetches_.load(), 1);
}

// Stale-while-revalidate
TEST_F(DefinitionCacherTest, StaleWhileRevalidateServesStaleAndRefreshes) {
    CacherConfig config;
    config.ttl = 20ms;
    DefinitionCacher cacher(countingFetchers(), config);

    cacher.getTools();
    std::this_thread::sleep_for(40ms);

    fetchDelay_ = 30ms;
    auto start = std::chrono::steady_clock::now();
    auto stale = cacher.getTools({.staleWhileRevalidate = true});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(stale.size(), 2u);
    EXPECT_LT(elapsed, 25ms);
    EXPECT_EQ(cacher.getStats().hits, 1u);

    EXPECT_TRUE(waitFor([&] { return cacher.isValid(CacheKind::Tools); }));
    EXPECT_EQ(toolFetches_.load(), 2);
}

TEST_F(DefinitionCacherTest, StaleRefreshFailureIsNotSurfaced) {
    CacherConfig config;
    config.ttl = 20ms;
    DefinitionCacher cacher(countingFetchers(), config);

    cacher.getTools();
    std::this_thread::sleep_for(40ms);
    failFetches_ = true;

    EXPECT_NO_THROW(cacher.getTools({.staleWhileRevalidate = true}));
    EXPECT_TRUE(waitFor([&] { return toolFetches_.load() == 2; }));
    EXPECT_FALSE(cacher.isValid(CacheKind::Tools));
}

// Storage
TEST_F(DefinitionCacherTest, FetchIsMirroredToStorage) {
    auto storage = std::make_shared<MemoryStorageAdapter>();
    DefinitionCacher cacher(countingFetchers(), CacherConfig{}, storage);

    cacher.getTools();

    auto stored = storage->get("tools");
    ASSERT_TRUE(stored.has_value());
    auto entry = stored->get<CacheEntry>();
    EXPECT_EQ(entry.payload.size(), 2u);
    EXPECT_EQ(entry.size, entry.payload.dump().size() * 2);
}

TEST_F(DefinitionCacherTest, StorageEntryIsPromotedAsHit) {
    auto storage = std::make_shared<MemoryStorageAdapter>();
    {
        DefinitionCacher warm(countingFetchers(), CacherConfig{}, storage);
        warm.getTools();
    }

    DefinitionCacher cold(countingFetchers(), CacherConfig{}, storage);
    auto tools = cold.getTools();

    EXPECT_EQ(tools.size(), 2u);
    EXPECT_EQ(toolFetches_.load(), 1);
    EXPECT_EQ(cold.getStats().hits, 1u);
    EXPECT_EQ(cold.getStats().misses, 0u);
    EXPECT_TRUE(cold.isValid(CacheKind::Tools));
}

TEST_F(DefinitionCacherTest, StorageDirectoryUsesFileStore) {
    auto dir = std::filesystem::temp_directory_path() / "mcpperf_cacher_test";
    std::filesystem::remove_all(dir);

    CacherConfig config;
    config.storage_directory = dir.string();
    {
        DefinitionCacher warm(countingFetchers(), config);
        warm.getPrompts();
    }
    {
        DefinitionCacher cold(countingFetchers(), config);
        EXPECT_EQ(cold.getPrompts().size(), 1u);
    }

    EXPECT_EQ(promptFetches_.load(), 1);
    std::filesystem::remove_all(dir);
}

TEST_F(DefinitionCacherTest, InvalidateRemovesFromMemoryAndStorage) {
    auto storage = std::make_shared<MemoryStorageAdapter>();
    DefinitionCacher cacher(countingFetchers(), CacherConfig{}, storage);

    cacher.getTools();
    cacher.getResources();
    cacher.invalidate(CacheKind::Tools);

    EXPECT_FALSE(cacher.isValid(CacheKind::Tools));
    EXPECT_TRUE(cacher.isValid(CacheKind::Resources));
    EXPECT_FALSE(storage->get("tools").has_value());
    EXPECT_TRUE(storage->get("resources").has_value());

    cacher.invalidateAll();
    EXPECT_EQ(cacher.getStats().entries, 0u);
    EXPECT_EQ(storage->size(), 0u);
}

// Lookup helpers
TEST_F(DefinitionCacherTest, LookupByName) {
    DefinitionCacher cacher(countingFetchers());

    auto search = cacher.getTool("search");
    ASSERT_TRUE(search.has_value());
    EXPECT_EQ(search->inputSchema["type"], "object");
    EXPECT_FALSE(cacher.getTool("missing").has_value());

    EXPECT_TRUE(cacher.getResource("file:///readme").has_value());
    EXPECT_TRUE(cacher.getPrompt("summarize").has_value());
    EXPECT_EQ(toolFetches_.load(), 1);
}

TEST_F(DefinitionCacherTest, PreloadFetchesConfiguredKinds) {
    auto fetchers = countingFetchers();
    fetchers.resources = nullptr;
    DefinitionCacher cacher(fetchers);

    cacher.preload();

    EXPECT_TRUE(cacher.isValid(CacheKind::Tools));
    EXPECT_FALSE(cacher.isValid(CacheKind::Resources));
    EXPECT_TRUE(cacher.isValid(CacheKind::Prompts));
}

TEST_F(DefinitionCacherTest, ExpiryReported) {
    DefinitionCacher cacher(countingFetchers());
    EXPECT_FALSE(cacher.getExpiry(CacheKind::Tools).has_value());

    auto before = std::chrono::system_clock::now();
    cacher.getTools();

    auto expiry = cacher.getExpiry(CacheKind::Tools);
    ASSERT_TRUE(expiry.has_value());
    EXPECT_GE(*expiry, before + cacher.config().ttl);
}

TEST_F(DefinitionCacherTest, OnUpdateFiresAfterFetch) {
    DefinitionCacher cacher(countingFetchers());
    std::vector<CacheKind> updates;
    cacher.onUpdate([&](CacheKind kind) { updates.push_back(kind); });

    cacher.getTools();
    cacher.getTools();
    cacher.getPrompts();

    EXPECT_THAT(updates, ::testing::ElementsAre(CacheKind::Tools, CacheKind::Prompts));
}

TEST_F(DefinitionCacherTest, AutoRefreshBeforeExpiry) {
    CacherConfig config;
    config.ttl = 100ms;
    config.auto_refresh = true;
    config.auto_refresh_before_expiry = 60ms;
    DefinitionCacher cacher(countingFetchers(), config);

    cacher.getTools();

    EXPECT_TRUE(waitFor([&] { return toolFetches_.load() >= 2; }, 500ms));
}

TEST_F(DefinitionCacherTest, ResetStats) {
    DefinitionCacher cacher(countingFetchers());
    cacher.getTools();
    cacher.getTools();

    cacher.resetStats();

    auto stats = cacher.getStats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_DOUBLE_EQ(stats.hitRate, 0.0);
    EXPECT_EQ(stats.entries, 1u);
}

TEST_F(DefinitionCacherTest, DisposeClearsMemoryButNotStorage) {
    auto storage = std::make_shared<MemoryStorageAdapter>();
    DefinitionCacher cacher(countingFetchers(), CacherConfig{}, storage);

    cacher.getTools();
    cacher.dispose();
    cacher.dispose();

    EXPECT_EQ(cacher.getStats().entries, 0u);
    EXPECT_TRUE(storage->get("tools").has_value());
    EXPECT_THROW(cacher.getTools(), ShutdownError);
}

TEST_F(DefinitionCacherTest, CacheKeys) {
    EXPECT_STREQ(cacheKey(CacheKind::Tools), "tools");
    EXPECT_STREQ(cacheKey(CacheKind::Resources), "resources");
    EXPECT_STREQ(cacheKey(CacheKind::Prompts), "prompts");
}

TEST_F(DefinitionCacherTest, InvalidUtf8DefinitionDoesNotWedgeKind) {
    std::atomic<int> fetches{0};
    DefinitionCacher::Fetchers fetchers;
    fetchers.tools = [&] {
        std::string name = ++fetches == 1 ? std::string("bad\xff") : std::string("ok");
        return std::vector<ToolDefinition>{ToolDefinition{name, std::nullopt, Json::object()}};
    };
    auto storage = std::make_shared<MemoryStorageAdapter>();
    DefinitionCacher cacher(fetchers, CacherConfig{}, storage);

    auto first = cacher.getTools();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].name, "bad\xff");
    EXPECT_GT(cacher.getStats().bytesUsed, 0u);

    cacher.invalidate(CacheKind::Tools);
    auto second = cacher.getTools();

    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].name, "ok");
    EXPECT_EQ(fetches.load(), 2);
}

TEST_F(DefinitionCacherTest, InvalidUtf8DefinitionPersistsToFileStore) {
    auto dir = std::filesystem::temp_directory_path() / "mcpperf_cacher_utf8_test";
    std::filesystem::remove_all(dir);

    DefinitionCacher::Fetchers fetchers;
    fetchers.tools = [] {
        return std::vector<ToolDefinition>{ToolDefinition{"bad\xff", std::nullopt, Json::object()}};
    };
    CacherConfig config;
    config.storage_directory = dir.string();
    {
        DefinitionCacher cacher(fetchers, config);
        EXPECT_NO_THROW(cacher.getTools());
    }

    DefinitionCacher reopened(countingFetchers(), config);
    EXPECT_EQ(reopened.getTools().size(), 1u);
    EXPECT_EQ(toolFetches_.load(), 0);
    std::filesystem::remove_all(dir);
}

TEST_F(DefinitionCacherTest, ThrowingUpdateCallbackKeepsFetchUsable) {
    DefinitionCacher cacher(countingFetchers());
    cacher.onUpdate([](CacheKind) { throw 42; });

    EXPECT_EQ(cacher.getTools().size(), 2u);
    EXPECT_EQ(cacher.getTools({.forceRefresh = true}).size(), 2u);
    EXPECT_EQ(toolFetches_.load(), 2);
}

TEST_F(DefinitionCacherTest, BackToBackStaleReadsRefreshOnce) {
    CacherConfig config;
    config.ttl = 20ms;
    DefinitionCacher cacher(countingFetchers(), config);

    cacher.getTools();
    std::this_thread::sleep_for(40ms);

    cacher.getTools({.staleWhileRevalidate = true});
    cacher.getTools({.staleWhileRevalidate = true});

    EXPECT_TRUE(waitFor([&] { return cacher.isValid(CacheKind::Tools); }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(toolFetches_.load(), 2);
}
