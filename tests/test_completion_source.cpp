#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <ai-ghostline/ai/completion_source.hpp>

using namespace ghostline;
using namespace ghostline::ai;

TEST(StubCandidates, HeadersCarryRanges) {
    auto c = parse_stub_candidates("@@ 0:1-0:3\nfoo\n@@ 2:0-2:0\nbar\nbaz\n", {0, 0});
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].text, "foo");
    EXPECT_EQ(c[0].range.start, (CursorPosition{0, 1}));
    EXPECT_EQ(c[0].range.end, (CursorPosition{0, 3}));
    EXPECT_EQ(c[0].uuid, "stub-1");
    EXPECT_EQ(c[1].text, "bar\nbaz");
    EXPECT_EQ(c[1].range.start, (CursorPosition{2, 0}));
    EXPECT_EQ(c[1].uuid, "stub-2");
}

TEST(StubCandidates, PlainDataIsOneCandidateAtCursor) {
    auto c = parse_stub_candidates("return 0;\n", {3, 4});
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].text, "return 0;\n");
    EXPECT_TRUE(c[0].range.empty());
    EXPECT_EQ(c[0].range.start, (CursorPosition{3, 4}));
    EXPECT_TRUE(parse_stub_candidates("", {0, 0}).empty());
}

TEST(StubSource, ReadsFileUnlessCancelled) {
    const char* path = "__ghostline_stub.txt";
    { std::ofstream(path) << "@@ 0:0-0:0\nhello\n"; }
    GhostlineConfig cfg;
    cfg.stub_file = path;
    StubCompletionSource src(cfg);
    auto snap = make_snapshot(std::string("x\n"));

    CancellationToken token;
    auto got = src.fetch(snap, token);
    ASSERT_TRUE(got);
    ASSERT_EQ(got->size(), 1u);
    EXPECT_EQ((*got)[0].text, "hello");

    CancellationToken copy = token;
    copy.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_FALSE(src.fetch(snap, token));
    std::remove(path);
}

TEST(StubSource, MissingFileYieldsNothing) {
    GhostlineConfig cfg;
    cfg.stub_file = "__ghostline_does_not_exist.txt";
    StubCompletionSource src(cfg);
    EXPECT_FALSE(src.fetch(make_snapshot(std::string("x")), CancellationToken()));
    cfg.stub_file.clear();
    EXPECT_FALSE(StubCompletionSource(cfg).fetch(make_snapshot(std::string("x")), CancellationToken()));
}

TEST(CompletionRequest, EscapesAndAsksForCandidates) {
    GhostlineConfig cfg;
    cfg.candidates = 3;
    std::string body = build_completion_request(cfg, "say \"hi\"\n", "\t}");
    EXPECT_NE(body.find("\"prompt\":\"say \\\"hi\\\"\\n\""), std::string::npos);
    EXPECT_NE(body.find("\"suffix\":\"\\t}\""), std::string::npos);
    EXPECT_NE(body.find("\"n\":3"), std::string::npos);
    EXPECT_NE(body.find("gpt-3.5-turbo-instruct"), std::string::npos);
    EXPECT_EQ(escape_json(std::string("\x01")), "\\u0001");
}

TEST(CompletionResponse, ExtractsEveryChoice) {
    std::string response = R"({"id":"x","choices":[{"text":"a\nb","index":0},{"text": "caf\u00e9 \"q\"","index":1}]})";
    auto texts = extract_choice_texts(response);
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0], "a\nb");
    EXPECT_EQ(texts[1], "caf\xC3\xA9 \"q\"");
    EXPECT_EQ(extract_choice_texts(R"({"choices":[{"text":"\ud83d\ude00"}]})")[0], "\xF0\x9F\x98\x80");
    EXPECT_TRUE(extract_choice_texts(R"({"error":"nope"})").empty());
}

TEST(CompletionSourceFactory, PicksBySourceKey) {
    GhostlineConfig cfg;
    EXPECT_NE(dynamic_cast<StubCompletionSource*>(make_completion_source(cfg).get()), nullptr);
    cfg.source = "http";
    EXPECT_NE(dynamic_cast<HttpCompletionSource*>(make_completion_source(cfg).get()), nullptr);
}

TEST(HttpSource, NoKeyMeansNoRequest) {
    GhostlineConfig cfg;
    cfg.source = "http";
    cfg.api_key_env = "GHOSTLINE_TEST_KEY_THAT_IS_NOT_SET";
    cfg.endpoint = "http://127.0.0.1:1/v1/completions";
    HttpCompletionSource src(cfg);
    EXPECT_FALSE(src.fetch(make_snapshot(std::string("int x")), CancellationToken()));
}
