#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../src/downloader.hpp"

class RetryTest : public ::testing::Test {
protected:
    fs::path dest;
    FakeHttpClient http;
    SilentProgressReporter progress;
    RecordingSleep sleeper;
    TransferOptions options;

    void SetUp() override {
        load_test_strings();
        dest = fs::absolute("tmp_retry_test");
        if (fs::exists(dest)) fs::remove_all(dest);
        fs::create_directories(dest);

        options.max_retries = 5;
        options.retry_delay = std::chrono::milliseconds(2500);
    }

    void TearDown() override {
        if (fs::exists(dest)) fs::remove_all(dest);
    }
};

TEST_F(RetryTest, StopsAfterMaxRetries) {
    http.responder = [](const HttpRequest&) {
        ScriptedResponse r;
        r.refuse = true;
        return r;
    };
    ManifestEntry entry{"d.bin", "https://example.org/d.bin", 100, ""};

    RetryResult result = download_with_retries(entry, dest, options, http, progress, sleeper.fn());

    EXPECT_FALSE(result.outcome.ok());
    EXPECT_EQ(result.outcome.status, AttemptStatus::NETWORK_ERROR);
    EXPECT_EQ(result.attempts, 5);
    EXPECT_EQ(http.requests.size(), 5u);
    // Pauses only between attempts.
    ASSERT_EQ(sleeper.calls.size(), 4u);
    for (auto d : sleeper.calls) {
        EXPECT_EQ(d, std::chrono::milliseconds(2500));
    }
}

TEST_F(RetryTest, FirstSuccessEndsLoop) {
    std::string content = make_content(400);
    http.responder = serve(content);
    ManifestEntry entry{"ok.bin", "https://example.org/ok.bin", 400, ""};

    RetryResult result = download_with_retries(entry, dest, options, http, progress, sleeper.fn());

    EXPECT_TRUE(result.outcome.ok());
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE(sleeper.calls.empty());
}

TEST_F(RetryTest, RetryResumesFromBytesOnDisk) {
    std::string content = make_content(1000);
    ScriptedResponse first;
    first.body = content;
    first.drop_after = 256;
    ScriptedResponse second;
    second.status = 206;
    second.body = content.substr(256, 300);
    second.content_length = 744;
    ScriptedResponse third;
    third.status = 206;
    third.body = content.substr(556);
    http.script = {first, second, third};

    ManifestEntry entry{"flaky.bin", "https://example.org/flaky.bin", 1000, ""};
    RetryResult result = download_with_retries(entry, dest, options, http, progress, sleeper.fn());

    EXPECT_TRUE(result.outcome.ok());
    EXPECT_EQ(result.attempts, 3);
    ASSERT_EQ(http.requests.size(), 3u);
    EXPECT_FALSE(http.requests[0].range_start.has_value());
    EXPECT_EQ(*http.requests[1].range_start, 256u);
    EXPECT_EQ(*http.requests[2].range_start, 556u);
    EXPECT_EQ(read_file(dest / "flaky.bin"), content);
    EXPECT_EQ(sleeper.calls.size(), 2u);
}

TEST_F(RetryTest, SizeMismatchIsRetried) {
    std::string content = make_content(500);
    ScriptedResponse truncated;
    truncated.body = content.substr(0, 200);
    http.script.push_back(truncated);
    ScriptedResponse rest;
    rest.status = 206;
    rest.body = content.substr(200);
    http.script.push_back(rest);

    ManifestEntry entry{"m.bin", "https://example.org/m.bin", 500, ""};
    RetryResult result = download_with_retries(entry, dest, options, http, progress, sleeper.fn());

    EXPECT_TRUE(result.outcome.ok());
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(read_file(dest / "m.bin"), content);
}

TEST_F(RetryTest, SingleAttemptNeverSleeps) {
    options.max_retries = 1;
    ScriptedResponse failure;
    failure.status = 503;
    http.script.push_back(failure);
    ManifestEntry entry{"x.bin", "https://example.org/x.bin", 10, ""};

    RetryResult result = download_with_retries(entry, dest, options, http, progress, sleeper.fn());

    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.outcome.status, AttemptStatus::NETWORK_ERROR);
    EXPECT_TRUE(sleeper.calls.empty());
}
