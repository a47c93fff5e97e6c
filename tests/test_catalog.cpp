#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../src/catalog.hpp"

namespace {
const char* kRecordJson = R"({
  "id": 1234567,
  "metadata": {"title": "Global Land/Ocean: Temperatures (v2.1)"},
  "files": [
    {"key": "GLOBAL_temp.nc", "size": 1048576, "checksum": "md5:0123456789abcdef0123456789abcdef",
     "links": {"self": "https://zenodo.org/api/records/1234567/files/GLOBAL_temp.nc/content"}},
    {"filename": "readme.txt", "filesize": 120,
     "links": {"content": "https://zenodo.org/records/1234567/files/readme.txt"}},
    {"key": "orphan.dat", "size": 5, "links": {}},
    {"links": {"self": "https://zenodo.org/api/files/abc"}}
  ]
})";
}

class CatalogTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        load_test_strings();
        work_dir = fs::absolute("tmp_catalog_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }
};

TEST_F(CatalogTest, ParseRecordId) {
    EXPECT_EQ(parse_record_id("1234567").value(), "1234567");
    EXPECT_EQ(parse_record_id("  42 \n").value(), "42");
    EXPECT_EQ(parse_record_id("https://zenodo.org/record/1234567").value(), "1234567");
    EXPECT_EQ(parse_record_id("https://zenodo.org/records/7654321?preview=1").value(), "7654321");
    EXPECT_FALSE(parse_record_id("").has_value());
    EXPECT_FALSE(parse_record_id("https://example.org/records/1").has_value());
    EXPECT_FALSE(parse_record_id("12ab").has_value());
}

TEST_F(CatalogTest, ApiUrl) {
    EXPECT_EQ(record_api_url("99"), "https://zenodo.org/api/records/99");
}

TEST_F(CatalogTest, NormalizesFieldNames) {
    CatalogRecord record = parse_record(kRecordJson);

    EXPECT_EQ(record.id, "1234567");
    EXPECT_EQ(record.title, "Global Land/Ocean: Temperatures (v2.1)");
    ASSERT_EQ(record.entries.size(), 4u);

    const auto& nc = record.entries[0];
    EXPECT_EQ(nc.name, "GLOBAL_temp.nc");
    EXPECT_EQ(nc.uri, "https://zenodo.org/api/records/1234567/files/GLOBAL_temp.nc/content");
    EXPECT_EQ(nc.expected_size.value(), 1048576u);
    EXPECT_EQ(nc.checksum, "md5:0123456789abcdef0123456789abcdef");

    const auto& readme = record.entries[1];
    EXPECT_EQ(readme.name, "readme.txt");
    EXPECT_EQ(readme.uri, "https://zenodo.org/records/1234567/files/readme.txt");
    EXPECT_EQ(readme.expected_size.value(), 120u);
    EXPECT_TRUE(readme.checksum.empty());

    // Incomplete entries are kept for the batch run to skip.
    EXPECT_TRUE(record.entries[2].uri.empty());
    EXPECT_FALSE(is_well_formed(record.entries[2]));
    EXPECT_TRUE(record.entries[3].name.empty());
    EXPECT_FALSE(is_well_formed(record.entries[3]));
}

TEST_F(CatalogTest, MissingSizeIsUnknown) {
    CatalogRecord record = parse_record(R"({"files": [{"key": "a", "links": {"self": "u"}}]})");
    ASSERT_EQ(record.entries.size(), 1u);
    EXPECT_FALSE(record.entries[0].expected_size.has_value());
}

TEST_F(CatalogTest, RecordWithoutFiles) {
    CatalogRecord record = parse_record(R"({"id": "abc", "metadata": {}})");
    EXPECT_EQ(record.id, "abc");
    EXPECT_TRUE(record.title.empty());
    EXPECT_TRUE(record.entries.empty());
}

TEST_F(CatalogTest, InvalidJsonThrows) {
    EXPECT_THROW(parse_record("{not json"), ZfetchException);
    EXPECT_THROW(parse_record("[1, 2]"), ZfetchException);
}

TEST_F(CatalogTest, FetchRecordUsesApi) {
    FakeHttpClient http;
    ScriptedResponse r;
    r.body = kRecordJson;
    http.script.push_back(r);

    CatalogRecord record = fetch_record(http, "1234567");

    ASSERT_EQ(http.requests.size(), 1u);
    EXPECT_EQ(http.requests[0].url, "https://zenodo.org/api/records/1234567");
    EXPECT_FALSE(http.requests[0].range_start.has_value());
    EXPECT_EQ(record.entries.size(), 4u);
}

TEST_F(CatalogTest, FetchRecordFailureThrows) {
    FakeHttpClient http;
    ScriptedResponse r;
    r.status = 410;
    http.script.push_back(r);

    EXPECT_THROW(fetch_record(http, "1"), NetworkError);
}

TEST_F(CatalogTest, LoadManifestFile) {
    fs::path p = work_dir / "record.json";
    write_file(p, kRecordJson);

    CatalogRecord record = load_manifest_file(p);
    EXPECT_EQ(record.entries.size(), 4u);

    EXPECT_THROW(load_manifest_file(work_dir / "absent.json"), ZfetchException);
}

TEST_F(CatalogTest, OutputDirName) {
    EXPECT_EQ(output_dir_name("1234567", "Global Land/Ocean: Temperatures (v2.1)"),
              "Zenodo_1234567_Global LandOcean Temperatures v21");
    EXPECT_EQ(output_dir_name("5", "  my_data-set  "), "Zenodo_5_my_data-set");
    EXPECT_EQ(output_dir_name("5", "???"), "Zenodo_5_Untitled_Dataset");
    EXPECT_EQ(output_dir_name("5", ""), "Zenodo_5_Untitled_Dataset");
}
