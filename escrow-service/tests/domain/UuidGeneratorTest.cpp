#include <gtest/gtest.h>
#include "utils/UuidGenerator.hpp"

#include <regex>
#include <set>

using escrow::utils::UuidGenerator;

TEST(UuidGeneratorTest, Version4Format) {
    static const std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    for (int i = 0; i < 100; ++i) {
        auto id = UuidGenerator::generate();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
    }
}

TEST(UuidGeneratorTest, NoCollisionsInSample) {
    std::set<std::string> ids;
    for (int i = 0; i < 10000; ++i) {
        ids.insert(UuidGenerator::generate());
    }

    EXPECT_EQ(ids.size(), 10000u);
}
