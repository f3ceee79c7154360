#include <gtest/gtest.h>
#include <sstream>
#include <ai-ghostline/config.hpp>

using namespace ghostline;

TEST(Config, ParsesKnownKeys) {
    std::istringstream in(
        "# comment\n"
        "source = http\n"
        "model=gpt-test\n"
        "debug=on\n"
        "color=0\n"
        "candidates=5\n"
        "temperature=0.7\n"
        "unknown=whatever\n"
        "no equals sign\n");
    GhostlineConfig cfg;
    parse_config(in, cfg);
    EXPECT_EQ(cfg.source, "http");
    EXPECT_EQ(cfg.model, "gpt-test");
    EXPECT_TRUE(cfg.debug);
    EXPECT_FALSE(cfg.color);
    EXPECT_EQ(cfg.candidates, 5);
    EXPECT_DOUBLE_EQ(cfg.temperature, 0.7);
}

TEST(Config, BadNumbersKeepDefaults) {
    std::istringstream in("max_tokens=lots\ntimeout_seconds=99999999999999999999\ncandidates=2\n");
    GhostlineConfig cfg;
    parse_config(in, cfg);
    EXPECT_EQ(cfg.max_tokens, 128);
    EXPECT_EQ(cfg.timeout_seconds, 20);
    EXPECT_EQ(cfg.candidates, 2);
}

TEST(Config, MissingFileGivesDefaults) {
    auto cfg = load_config("__ghostline_no_such_rc");
    EXPECT_EQ(cfg.source, "stub");
    EXPECT_TRUE(cfg.color);
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(load_config("").candidates, 3);
}
