#include <gtest/gtest.h>
#include "client/identity.hpp"
#include <regex>
#include <set>

using namespace peerdrop;

TEST(IdentityTest, GeneratedNicknameFormat) {
    std::regex pattern("^[a-z]+-[a-z]+-[0-9]{4}$");
    for (int i = 0; i < 20; ++i) {
        auto name = generate_nickname();
        EXPECT_TRUE(std::regex_match(name, pattern)) << name;
        EXPECT_TRUE(is_valid_nickname(name)) << name;
    }
}

TEST(IdentityTest, GeneratedNicknamesVary) {
    std::set<std::string> names;
    for (int i = 0; i < 20; ++i) {
        names.insert(generate_nickname());
    }
    EXPECT_GT(names.size(), 1u);
}

TEST(IdentityTest, Validation) {
    EXPECT_TRUE(is_valid_nickname("guest42"));
    EXPECT_TRUE(is_valid_nickname(FALLBACK_NICKNAME));
    EXPECT_FALSE(is_valid_nickname(""));
    EXPECT_FALSE(is_valid_nickname("two words"));
    EXPECT_FALSE(is_valid_nickname("tab\there"));
    EXPECT_FALSE(is_valid_nickname(std::string(65, 'a')));
}
