#include <gtest/gtest.h>
#include "download_policy.hpp"
#include "test_helpers.hpp"

namespace {

using namespace webscout;
using namespace webscout::testing;

nlohmann::json download_result(const std::string& filename, int64_t size) {
    return {
        {"url", "https://x.example/" + filename},
        {"filename", filename},
        {"path", "downloads/" + filename},
        {"size_bytes", size},
        {"success", true}
    };
}

TEST(DownloadKeyTest, FilenameIsCaseFoldedButUrlIsExact) {
    auto a = make_download_key({{"url", "https://x.example/A.pdf"}, {"filename", "Report.PDF"}});
    auto b = make_download_key({{"url", "https://x.example/A.pdf"}, {"filename", "report.pdf"}});
    auto c = make_download_key({{"url", "https://x.example/a.pdf"}, {"filename", "report.pdf"}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.second, "report.pdf");
}

TEST(DownloadKeyTest, MissingArgumentsBecomeEmpty) {
    auto k = make_download_key(nlohmann::json::object());
    EXPECT_EQ(k.first, "");
    EXPECT_EQ(k.second, "");
}

TEST(DispatchDownloadTest, OnlySuccessfulResultsAreCached) {
    FakeTools tools;
    auto reg = tools.registry();
    DownloadCache cache;
    nlohmann::json args = {{"url", "https://x.example/a.pdf"}, {"filename", "a.pdf"}};

    auto first = dispatch_download(reg, args, cache);
    auto second = dispatch_download(reg, args, cache);

    EXPECT_EQ(tools.downloads, 1);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(first.result.contains("deduplicated"));
    EXPECT_EQ(second.result["deduplicated"], true);
    EXPECT_EQ(second.result["size_bytes"], first.result["size_bytes"]);
    EXPECT_EQ(second.duration_ms, 0);
}

TEST(DispatchDownloadTest, FailedDownloadIsRetried) {
    FakeTools tools;
    tools.download_extra = {{"success", false}, {"error", "HTTP 404"}};
    auto reg = tools.registry();
    DownloadCache cache;
    nlohmann::json args = {{"url", "https://x.example/a.pdf"}, {"filename", "a.pdf"}};

    dispatch_download(reg, args, cache);
    dispatch_download(reg, args, cache);

    EXPECT_EQ(tools.downloads, 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(VerifyDownloadTest, SizeFloorsPerExtension) {
    EXPECT_FALSE(verify_download(download_result("a.pdf", 20000)));
    EXPECT_TRUE(verify_download(download_result("a.pdf", 19999)));
    EXPECT_FALSE(verify_download(download_result("a.xlsx", 5000)));
    EXPECT_TRUE(verify_download(download_result("a.XLSX", 4999)));
    EXPECT_TRUE(verify_download(download_result("a.xls", 10)));
    EXPECT_FALSE(verify_download(download_result("a.csv", 1)));
}

TEST(VerifyDownloadTest, XlsFloorDoesNotShadowXlsx) {
    auto w = verify_download(download_result("book.xlsx", 100));
    ASSERT_TRUE(w);
    EXPECT_NE(w->find(".XLSX file"), std::string::npos);
}

TEST(VerifyDownloadTest, CombinesSizeAndToolWarning) {
    auto r = download_result("a.pdf", 1234);
    r["warning"] = "File does not appear to be a valid PDF: invalid header";
    auto w = verify_download(r);
    ASSERT_TRUE(w);
    EXPECT_EQ(*w,
              "DOWNLOAD VERIFICATION WARNING:\n"
              "- File size (1,234 bytes) is suspiciously small for a .PDF file. "
              "Expected at least 20,000 bytes. The URL may have returned an error page.\n"
              "- File does not appear to be a valid PDF: invalid header");
}

TEST(VerifyDownloadTest, EmptyWarningIsIgnored) {
    auto r = download_result("a.pdf", 90000);
    r["warning"] = "";
    EXPECT_FALSE(verify_download(r));
}

TEST(ReviewDownloadTest, AnnouncesEachFilenameOnce) {
    EmittedFiles emitted;
    EXPECT_EQ(review_download(download_result("Q4.pdf", 90000), emitted).action, DownloadAction::announce);
    EXPECT_EQ(review_download(download_result("q4.PDF", 90000), emitted).action,
              DownloadAction::already_announced);
    EXPECT_EQ(review_download(download_result("q3.pdf", 90000), emitted).action, DownloadAction::announce);
}

TEST(ReviewDownloadTest, FailuresAndDuplicatesAreIgnored) {
    EmittedFiles emitted;
    auto failed = download_result("a.pdf", 90000);
    failed["success"] = false;
    EXPECT_EQ(review_download(failed, emitted).action, DownloadAction::ignored);

    auto dup = mark_deduplicated(download_result("a.pdf", 90000));
    EXPECT_EQ(review_download(dup, emitted).action, DownloadAction::ignored);

    // neither claimed the name
    EXPECT_TRUE(emitted.claim("a.pdf"));
}

TEST(ReviewDownloadTest, WarningDoesNotClaimFilename) {
    EmittedFiles emitted;
    auto out = review_download(download_result("a.pdf", 10), emitted);
    EXPECT_EQ(out.action, DownloadAction::warning);
    EXPECT_FALSE(out.warning.empty());
    EXPECT_TRUE(emitted.claim("A.PDF"));
}

TEST(ResultFlagTest, Truthiness) {
    nlohmann::json r = {{"t", true}, {"f", false}, {"s", "x"}, {"e", ""}, {"n", 0}, {"z", nullptr}};
    EXPECT_TRUE(result_flag(r, "t"));
    EXPECT_FALSE(result_flag(r, "f"));
    EXPECT_TRUE(result_flag(r, "s"));
    EXPECT_FALSE(result_flag(r, "e"));
    EXPECT_FALSE(result_flag(r, "n"));
    EXPECT_FALSE(result_flag(r, "z"));
    EXPECT_FALSE(result_flag(r, "missing"));
    EXPECT_FALSE(result_flag(nlohmann::json::array(), "t"));
}

} // namespace
