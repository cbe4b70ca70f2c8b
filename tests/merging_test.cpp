#include "gtest/gtest.h"
#include "../src/merging/merging.hpp"
#include "../src/include/aggregation_error.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace {

struct Observation {
    std::string key;
    double value;
};

LocalAggregator make_local(const std::vector<Observation>& observations) {
    LocalAggregator local;
    for (const auto& o : observations) {
        local.observe(o.key, o.value);
    }
    return local;
}

} // namespace

TEST(StatisticsTest, UpdateAndMerge) {
    Statistics a(3.0);
    a.update(1.0);
    EXPECT_DOUBLE_EQ(a.min, 1.0);
    EXPECT_DOUBLE_EQ(a.max, 3.0);
    EXPECT_DOUBLE_EQ(a.count, 2.0);
    EXPECT_DOUBLE_EQ(a.mean(), 2.0);

    Statistics b(-4.5);
    b.merge(a);
    EXPECT_DOUBLE_EQ(b.min, -4.5);
    EXPECT_DOUBLE_EQ(b.max, 3.0);
    EXPECT_DOUBLE_EQ(b.count, 3.0);
    EXPECT_DOUBLE_EQ(b.sum, -0.5);
}

TEST(LocalAggregatorTest, TracksEveryKey) {
    LocalAggregator local = make_local({{"AA", 3.0}, {"BB", 4.0}, {"AA", 1.0}});
    ASSERT_EQ(local.size(), 2u);

    const Statistics& aa = local.entries().at("AA");
    EXPECT_DOUBLE_EQ(aa.min, 1.0);
    EXPECT_DOUBLE_EQ(aa.max, 3.0);
    EXPECT_DOUBLE_EQ(aa.count, 2.0);
    EXPECT_DOUBLE_EQ(aa.mean(), 2.0);

    const Statistics& bb = local.entries().at("BB");
    EXPECT_DOUBLE_EQ(bb.count, 1.0);
    EXPECT_DOUBLE_EQ(bb.mean(), 4.0);
}

TEST(LocalAggregatorTest, KeysSurviveBufferReuse) {
    LocalAggregator local;
    std::string buffer = "Hamburg;1.0";
    local.observe(std::string_view(buffer).substr(0, 7), 1.0);

    // the next chunk overwrites the read buffer
    buffer = "Abidjan;2.0";
    local.observe(std::string_view(buffer).substr(0, 7), 2.0);

    ASSERT_EQ(local.size(), 2u);
    EXPECT_EQ(local.entries().count("Hamburg"), 1u);
    EXPECT_EQ(local.entries().count("Abidjan"), 1u);
}

TEST(LocalAggregatorTest, IsMoveOnly) {
    static_assert(!std::is_copy_constructible_v<LocalAggregator>);
    static_assert(!std::is_copy_assignable_v<LocalAggregator>);
    static_assert(std::is_move_constructible_v<LocalAggregator>);
    static_assert(std::is_move_assignable_v<LocalAggregator>);
}

TEST(LocalAggregatorTest, KeysSurviveVectorGrowth) {
    // no reserve: every reallocation moves the aggregators already stored
    std::vector<LocalAggregator> locals;
    for (int i = 0; i < 40; ++i) {
        LocalAggregator local;
        std::string key = "station_with_a_long_name_" + std::to_string(i % 5);
        local.observe(key, static_cast<double>(i));
        key.assign(key.size(), '#');
        locals.push_back(std::move(local));
    }

    GlobalMerger merger;
    for (const auto& local : locals) {
        merger.merge_in(local);
    }

    GlobalMap result = merger.take();
    ASSERT_EQ(result.size(), 5u);
    for (int k = 0; k < 5; ++k) {
        const Statistics& stats = result.at("station_with_a_long_name_" + std::to_string(k));
        EXPECT_EQ(stats.count, 8.0);
        EXPECT_EQ(stats.min, static_cast<double>(k));
        EXPECT_EQ(stats.max, static_cast<double>(35 + k));
    }
}

TEST(GlobalMergerTest, MergesOverlappingKeys) {
    GlobalMerger merger;
    merger.merge_in(make_local({{"AA", 3.0}, {"BB", 4.0}}));
    merger.merge_in(make_local({{"AA", 1.0}, {"CC", -2.0}}));

    GlobalMap result = merger.take();
    ASSERT_EQ(result.size(), 3u);
    EXPECT_DOUBLE_EQ(result.at("AA").min, 1.0);
    EXPECT_DOUBLE_EQ(result.at("AA").max, 3.0);
    EXPECT_DOUBLE_EQ(result.at("AA").count, 2.0);
    EXPECT_DOUBLE_EQ(result.at("CC").sum, -2.0);
    EXPECT_EQ(merger.size(), 0u);
}

TEST(GlobalMergerTest, MergeOrderDoesNotMatter) {
    // Values are multiples of 0.5 so every sum is exact in any order
    std::vector<LocalAggregator> locals;
    locals.push_back(make_local({{"AA", 1.5}, {"BB", -3.0}, {"CC", 10.0}}));
    locals.push_back(make_local({{"AA", -7.5}, {"DD", 2.0}}));
    locals.push_back(make_local({{"BB", 99.5}, {"CC", 0.5}, {"DD", 2.0}}));
    locals.push_back(make_local({{"AA", 4.0}, {"EE", -0.5}}));

    std::vector<size_t> order(locals.size());
    std::iota(order.begin(), order.end(), 0);

    GlobalMap reference;
    bool first = true;
    do {
        GlobalMerger merger;
        for (size_t i : order) {
            merger.merge_in(locals[i]);
        }
        GlobalMap result = merger.take();
        if (first) {
            reference = result;
            first = false;
        } else {
            EXPECT_EQ(result, reference);
        }
    } while (std::next_permutation(order.begin(), order.end()));

    ASSERT_EQ(reference.size(), 5u);
    EXPECT_DOUBLE_EQ(reference.at("AA").min, -7.5);
    EXPECT_DOUBLE_EQ(reference.at("AA").max, 4.0);
    EXPECT_DOUBLE_EQ(reference.at("AA").count, 3.0);
    EXPECT_DOUBLE_EQ(reference.at("BB").max, 99.5);
}

TEST(GlobalMergerTest, ConcurrentMergesAreSerialized) {
    const int threads = 8;
    const int per_thread = 1000;

    std::vector<LocalAggregator> locals(threads);
    for (int t = 0; t < threads; ++t) {
        for (int i = 0; i < per_thread; ++i) {
            locals[t].observe("key" + std::to_string(i % 50), static_cast<double>(t));
        }
    }

    GlobalMerger merger;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&merger, &locals, t]() { merger.merge_in(locals[t]); });
    }
    for (auto& w : workers) w.join();

    GlobalMap result = merger.take();
    ASSERT_EQ(result.size(), 50u);
    for (const auto& [key, stats] : result) {
        EXPECT_DOUBLE_EQ(stats.count, threads * per_thread / 50.0) << key;
        EXPECT_DOUBLE_EQ(stats.min, 0.0);
        EXPECT_DOUBLE_EQ(stats.max, threads - 1.0);
    }
}

TEST(GlobalMergerTest, NonUtf8KeyIsAFormatError) {
    GlobalMerger merger;
    LocalAggregator local = make_local({{"ok", 1.0}, {"bad\xff", 2.0}});
    try {
        merger.merge_in(local);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Format);
        EXPECT_NE(std::string(e.what()).find("bad\\xFF"), std::string::npos);
    }
}

TEST(GlobalMergerTest, MergesOwnedPartialMaps) {
    GlobalMerger merger;
    merger.merge_in(make_local({{"AA", 1.0}}));

    GlobalMap partial;
    partial.emplace("AA", Statistics(5.0));
    partial.emplace("ZZ", Statistics(-1.0));
    merger.merge_in(std::move(partial));

    GlobalMap result = merger.take();
    ASSERT_EQ(result.size(), 2u);
    EXPECT_DOUBLE_EQ(result.at("AA").max, 5.0);
    EXPECT_DOUBLE_EQ(result.at("AA").count, 2.0);
}

TEST(GlobalMergerTest, OwnedPartialKeysAreMovedNotCopied) {
    const std::string key = "a key long enough to live on the heap";
    GlobalMap partial;
    partial.emplace(key, Statistics(1.0));
    const char* key_bytes = partial.find(key)->first.data();

    GlobalMerger merger;
    merger.merge_in(std::move(partial));
    EXPECT_TRUE(partial.empty());

    GlobalMap result = merger.take();
    auto it = result.find(key);
    ASSERT_NE(it, result.end());
    EXPECT_EQ(it->first.data(), key_bytes);
}

TEST(ResultSerializationTest, RestoresEveryEntry) {
    GlobalMap results;
    results.emplace("Z\xc3\xbcrich", Statistics(12.5));
    results.at("Z\xc3\xbcrich").update(-3.0);
    results.emplace("", Statistics(1.0));

    std::vector<char> bytes = serialize_results(results);
    EXPECT_EQ(deserialize_results(bytes.data(), bytes.size()), results);
}

TEST(ResultSerializationTest, TruncatedBufferThrows) {
    GlobalMap results;
    results.emplace("AA", Statistics(1.0));
    std::vector<char> bytes = serialize_results(results);

    EXPECT_THROW(deserialize_results(bytes.data(), bytes.size() - 1), std::runtime_error);
    EXPECT_TRUE(deserialize_results(nullptr, 0).empty());
}
