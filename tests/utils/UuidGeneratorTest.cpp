/**
 * @file UuidGeneratorTest.cpp
 * @brief Unit tests for record id generation
 */

#include <gtest/gtest.h>
#include "utils/UuidGenerator.hpp"
#include <cctype>
#include <set>

using finance::utils::UuidGenerator;

TEST(UuidGeneratorTest, Generate_LowercaseVersion4Layout) {
    const std::string id = UuidGenerator::generate();

    ASSERT_EQ(id.size(), UuidGenerator::LENGTH);
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            EXPECT_EQ(id[i], '-') << id;
        } else {
            EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(id[i]))) << id;
            EXPECT_FALSE(std::isupper(static_cast<unsigned char>(id[i]))) << id;
        }
    }
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos) << id;
}

TEST(UuidGeneratorTest, Generate_Unique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(UuidGenerator::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}
