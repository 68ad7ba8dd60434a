#include "client/identity.hpp"
#include "common/crypto.hpp"
#include <sodium.h>
#include <array>
#include <cstdio>

namespace peerdrop {

namespace {

constexpr std::array<std::string_view, 32> ADJECTIVES = {
    "agile", "amber", "bold", "brave", "bright", "calm", "clever", "cosmic",
    "crisp", "daring", "eager", "fancy", "gentle", "golden", "happy", "humble",
    "jolly", "kind", "lively", "lucky", "mellow", "nimble", "plucky", "quick",
    "quiet", "rapid", "shiny", "silent", "steady", "swift", "tidy", "witty",
};

constexpr std::array<std::string_view, 32> NOUNS = {
    "badger", "beacon", "canyon", "comet", "crane", "falcon", "fern", "fjord",
    "forest", "fox", "glacier", "harbor", "heron", "island", "lagoon", "lynx",
    "maple", "meadow", "nebula", "otter", "owl", "pebble", "pine", "raven",
    "reef", "river", "sparrow", "summit", "thistle", "tiger", "valley", "willow",
};

} // anonymous namespace

std::string generate_nickname() {
    if (!crypto::init()) {
        return std::string(FALLBACK_NICKNAME);
    }

    auto adjective = ADJECTIVES[randombytes_uniform(ADJECTIVES.size())];
    auto noun = NOUNS[randombytes_uniform(NOUNS.size())];

    char number[8];
    std::snprintf(number, sizeof(number), "%04u", randombytes_uniform(10000));

    std::string name;
    name.reserve(adjective.size() + noun.size() + 6);
    name.append(adjective).append("-").append(noun).append("-").append(number);
    return name;
}

bool is_valid_nickname(std::string_view nickname) {
    if (nickname.empty() || nickname.size() > 64) {
        return false;
    }
    for (char c : nickname) {
        if (c <= ' ' || c > '~') {
            return false;
        }
    }
    return true;
}

} // namespace peerdrop
