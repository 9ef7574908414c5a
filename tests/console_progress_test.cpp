#include "bulkdl/console_progress.hpp"
#include "bulkdl/detail/format_size.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>

TEST(FormatSize, PicksLargestUnit) {
    EXPECT_EQ(bulkdl::detail::formatSize(0), "0 B");
    EXPECT_EQ(bulkdl::detail::formatSize(1023), "1023 B");
    EXPECT_EQ(bulkdl::detail::formatSize(1536), "1.5 KB");
    EXPECT_EQ(bulkdl::detail::formatSize(5u * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(bulkdl::detail::formatSize(3ull * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ConsoleProgress, LineWithKnownTotalShowsPercentage) {
    bulkdl::Progress progress;
    progress.url = "http://host/report.pdf";
    progress.filename = "report.pdf";
    progress.total_bytes = 2048;
    progress.downloaded_bytes = 1024;

    const auto line = bulkdl::ConsoleProgress::formatTaskLine(progress);
    EXPECT_EQ(line.rfind("report.pdf", 0), 0u);
    EXPECT_NE(line.find(" 50%"), std::string::npos);
    EXPECT_NE(line.find("(1.0 KB/2.0 KB)"), std::string::npos);
}

TEST(ConsoleProgress, LineWithUnknownTotalShowsRawBytes) {
    bulkdl::Progress progress;
    progress.filename = "stream.bin";
    progress.downloaded_bytes = 300;

    const auto line = bulkdl::ConsoleProgress::formatTaskLine(progress);
    EXPECT_NE(line.find("300 B"), std::string::npos);
    EXPECT_EQ(line.find('%'), std::string::npos);
}

TEST(ConsoleProgress, LineBeforeResponseShowsConnecting) {
    bulkdl::Progress progress;
    progress.url = "http://host/a/b/c.zip";

    const auto line = bulkdl::ConsoleProgress::formatTaskLine(progress);
    EXPECT_EQ(line.rfind("c.zip", 0), 0u);
    EXPECT_NE(line.find("Connecting"), std::string::npos);
}

TEST(ConsoleProgress, PanelTracksActiveTasksAndOverallCount) {
    std::ostringstream out;
    bulkdl::ConsoleProgress progress(out, 10, std::chrono::milliseconds(5));

    progress.taskStarted(0, "http://host/one.bin");
    progress.taskResolved(0, "one.bin", 100);
    progress.bytesTransferred(0, 40);
    progress.taskStarted(1, "http://host/two.bin");
    progress.taskResolved(1, "two.bin", std::nullopt);
    progress.bytesTransferred(1, 7);

    auto panel = progress.buildPanel();
    EXPECT_NE(panel.find("one.bin"), std::string::npos);
    EXPECT_NE(panel.find(" 40%"), std::string::npos);
    EXPECT_NE(panel.find("two.bin"), std::string::npos);
    EXPECT_NE(panel.find("0 / 10"), std::string::npos);

    progress.taskFinished(0, true, {});
    progress.batchProgress(1, 10);
    progress.taskFinished(1, false, "boom");
    progress.batchProgress(2, 10);

    panel = progress.buildPanel();
    EXPECT_EQ(panel.find("one.bin"), std::string::npos);
    EXPECT_EQ(panel.find("two.bin"), std::string::npos);
    EXPECT_NE(panel.find("2 / 10"), std::string::npos);
    EXPECT_NE(panel.find(" 20%"), std::string::npos);

    progress.finish();
    EXPECT_NE(out.str().find("2 / 10"), std::string::npos);
}
