/**
 * @file key_generator_tests.cpp
 * @brief Per-invocation key prefix uniqueness and layout
 *
 * @date 2025
 */

#include "stratus/core/key_generator.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <set>

using namespace stratus::core;

namespace {

WallClock FrozenClock() {
    auto frozen = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    return [frozen] { return frozen; };
}

} // namespace

TEST(KeyGeneratorTest, PrefixLayout) {
    KeyGenerator keys("evals/", 42, FrozenClock());
    std::string prefix = keys.Prefix(Operation::EXEC);

    std::regex layout(R"(evals/exec/\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}-[A-Za-z0-9]{8}/)");
    EXPECT_TRUE(std::regex_match(prefix, layout)) << prefix;
}

TEST(KeyGeneratorTest, OperationNamesTheSegment) {
    KeyGenerator keys("", 1, FrozenClock());
    EXPECT_EQ(keys.Prefix(Operation::READ_FILE).rfind("read_file/", 0), 0u);
    EXPECT_EQ(keys.Prefix(Operation::WRITE_FILE).rfind("write_file/", 0), 0u);
    EXPECT_EQ(keys.Prefix(Operation::EXEC).rfind("exec/", 0), 0u);
}

TEST(KeyGeneratorTest, SameInstantStillYieldsDistinctPrefixes) {
    KeyGenerator keys("p/", 7, FrozenClock());

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        EXPECT_TRUE(seen.insert(keys.Prefix(Operation::EXEC)).second);
    }
}

TEST(KeyGeneratorTest, SeedMakesSuffixesReproducible) {
    KeyGenerator first("p/", 99, FrozenClock());
    KeyGenerator second("p/", 99, FrozenClock());

    EXPECT_EQ(first.Prefix(Operation::EXEC), second.Prefix(Operation::EXEC));
    EXPECT_EQ(first.Prefix(Operation::EXEC), second.Prefix(Operation::EXEC));
}

TEST(KeyGeneratorTest, TimestampHasMicroseconds) {
    auto time = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)) +
                std::chrono::microseconds(42);
    std::string stamp = KeyGenerator::FormatTimestamp(time);
    ASSERT_GE(stamp.size(), 7u);
    EXPECT_EQ(stamp.substr(stamp.size() - 7), ".000042");
}
