#include "services/buffer_zone/index_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <latch>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ibis::services {
namespace {

std::shared_ptr<const MaskedDomain> makeDomain(size_t points) {
    auto domain = std::make_shared<MaskedDomain>();
    for (size_t p = 0; p < points; ++p) {
        domain->voxels.emplace_back(static_cast<int64_t>(p), 0, 0);
        domain->worldPoints.emplace_back(static_cast<double>(p), 0.0, 0.0);
    }
    domain->index = SpatialIndex::build(domain->worldPoints);
    return domain;
}

DomainKey key(const std::string& image, const std::string& mask) {
    return DomainKey{std::filesystem::path(image), std::filesystem::path(mask)};
}

TEST(DomainKeyTest, OrdersAndComparesByBothPaths) {
    EXPECT_EQ(key("a.nii", "m.nii"), key("a.nii", "m.nii"));
    EXPECT_NE(key("a.nii", "m.nii"), key("a.nii", "n.nii"));
    EXPECT_LT(key("a.nii", "m.nii"), key("b.nii", "a.nii"));

    DomainKey imageOnly{std::filesystem::path("a.nii"), std::nullopt};
    EXPECT_NE(imageOnly, key("a.nii", "m.nii"));
    EXPECT_NE(imageOnly.toString().find("<none>"), std::string::npos);
}

TEST(IndexCacheTest, BuildsOncePerKey) {
    IndexCache cache;
    int calls = 0;
    auto builder = [&calls](const DomainKey&) -> DomainResult {
        ++calls;
        return makeDomain(3);
    };

    auto first = cache.getOrBuild(key("a", "m"), builder);
    auto second = cache.getOrBuild(key("a", "m"), builder);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->get(), second->get());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.buildCount(), 1u);

    (void)cache.getOrBuild(key("b", "m"), builder);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(IndexCacheTest, FailedBuildIsCachedToo) {
    IndexCache cache;
    int calls = 0;
    auto builder = [&calls](const DomainKey&) -> DomainResult {
        ++calls;
        return std::unexpected(PipelineError{PipelineError::Code::VolumeReadFailed, "corrupt"});
    };

    auto first = cache.getOrBuild(key("bad", "m"), builder);
    auto second = cache.getOrBuild(key("bad", "m"), builder);
    ASSERT_FALSE(first.has_value());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, PipelineError::Code::VolumeReadFailed);
    EXPECT_EQ(calls, 1);
}

TEST(IndexCacheTest, BuilderExceptionBecomesInternalError) {
    IndexCache cache;
    auto result = cache.getOrBuild(key("x", "y"), [](const DomainKey&) -> DomainResult {
        throw std::runtime_error("boom");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, PipelineError::Code::InternalError);
    EXPECT_NE(result.error().message.find("boom"), std::string::npos);
}

TEST(IndexCacheTest, NonStandardThrowReachesEveryWaiter) {
    constexpr int kThreads = 4;
    IndexCache cache;
    std::atomic<int> calls{0};
    auto builder = [&calls](const DomainKey&) -> DomainResult {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        throw 42;
    };

    std::latch ready(kThreads);
    std::vector<PipelineError::Code> codes(kThreads, PipelineError::Code::Success);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            ready.arrive_and_wait();
            auto result = cache.getOrBuild(key("odd", "throw"), builder);
            if (!result) {
                codes[t] = result.error().code;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(calls.load(), 1);
    for (auto code : codes) {
        EXPECT_EQ(code, PipelineError::Code::InternalError);
    }

    auto again = cache.getOrBuild(key("odd", "throw"), builder);
    ASSERT_FALSE(again.has_value());
    EXPECT_NE(again.error().message.find("unknown exception"), std::string::npos);
}

TEST(IndexCacheTest, ReleaseDropsEntryButKeepsHeldDomainAlive) {
    IndexCache cache;
    auto builder = [](const DomainKey&) -> DomainResult { return makeDomain(5); };

    auto held = cache.getOrBuild(key("a", "m"), builder);
    ASSERT_TRUE(held.has_value());
    EXPECT_TRUE(cache.contains(key("a", "m")));

    cache.release(key("a", "m"));
    EXPECT_FALSE(cache.contains(key("a", "m")));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ((*held)->activeCount(), 5u);
    EXPECT_EQ((*held)->index->query(core::WorldCoordinate(2.0, 0.0, 0.0), 1.0).size(), 3u);

    // Asking again after release rebuilds
    (void)cache.getOrBuild(key("a", "m"), builder);
    EXPECT_EQ(cache.buildCount(), 2u);
}

TEST(IndexCacheTest, ConcurrentRequestsShareOneBuild) {
    constexpr int kThreads = 8;
    IndexCache cache;
    std::atomic<int> calls{0};
    auto builder = [&calls](const DomainKey&) -> DomainResult {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return makeDomain(10);
    };

    std::latch ready(kThreads);
    std::vector<const MaskedDomain*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            ready.arrive_and_wait();
            auto result = cache.getOrBuild(key("shared", "mask"), builder);
            if (result) {
                seen[t] = result->get();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(calls.load(), 1);
    for (const auto* domain : seen) {
        ASSERT_NE(domain, nullptr);
        EXPECT_EQ(domain, seen.front());
    }
}

}  // anonymous namespace
}  // namespace ibis::services
