#include "bulkdl/cli.hpp"
#include "bulkdl/download_pool.hpp"
#include "bulkdl/errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace {

bulkdl::Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "bulkdl");
    return bulkdl::parseArguments(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(ParseArguments, TemplateWithDefaults) {
    const auto options = parse({"-u", "http://host/{}.jpg", "-e", "3"});

    EXPECT_EQ(options.url_template, "http://host/{}.jpg");
    EXPECT_EQ(options.start, 1);
    ASSERT_TRUE(options.end.has_value());
    EXPECT_EQ(*options.end, 3);
    EXPECT_EQ(options.output_dir, "./");
    EXPECT_EQ(options.connections, 2u);
    EXPECT_FALSE(options.quiet);
    EXPECT_FALSE(options.http.verbose);

    const bulkdl::TargetList expected{"http://host/1.jpg", "http://host/2.jpg", "http://host/3.jpg"};
    EXPECT_EQ(bulkdl::buildTargets(options), expected);
}

TEST(ParseArguments, LongOptions) {
    const auto options = parse({"--url", "http://h/{}", "--start", "5", "--end", "9", "--output", "dl",
                                "--connections", "8", "--connect-timeout", "3", "--low-speed-time", "0",
                                "--quiet", "--verbose"});

    EXPECT_EQ(options.start, 5);
    EXPECT_EQ(*options.end, 9);
    EXPECT_EQ(options.output_dir, "dl");
    EXPECT_EQ(options.connections, 8u);
    EXPECT_EQ(options.http.connect_timeout_secs, 3);
    EXPECT_EQ(options.http.low_speed_time_secs, 0);
    EXPECT_TRUE(options.quiet);
    EXPECT_TRUE(options.http.verbose);
}

TEST(ParseArguments, ListFile) {
    const auto options = parse({"-f", "urls.txt", "-c", "4"});
    EXPECT_EQ(options.list_file, "urls.txt");
    EXPECT_TRUE(options.url_template.empty());
}

TEST(ParseArguments, Help) {
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_TRUE(parse({"-u", "x{}", "--help"}).show_help);
}

TEST(ParseArguments, StartAfterEndFailsWhenBuildingTargets) {
    const auto options = parse({"-u", "http://host/{}.jpg", "-s", "5", "-e", "2"});
    EXPECT_THROW((void)bulkdl::buildTargets(options), bulkdl::ConfigurationError);
}

TEST(ParseArguments, RejectsInvalidInput) {
    EXPECT_THROW(parse({}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}"}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}", "-e", "3", "-f", "list"}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}", "-e", "3x"}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}", "-e", "3", "-c", "0"}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}", "-e", "3", "-c", "-2"}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}", "-e"}), bulkdl::ConfigurationError);
    EXPECT_THROW(parse({"-u", "http://h/{}", "-e", "3", "--bogus"}), bulkdl::ConfigurationError);
}

TEST(ParseArguments, ExcessiveConnectionsFallBackToDefault) {
    const auto options = parse({"-u", "http://h/{}", "-e", "3", "-c", "500"});
    EXPECT_EQ(options.connections, 500u);
    EXPECT_EQ(bulkdl::DownloadPool(options.connections).workerCount(), 2u);
}

TEST(PrintUsage, MentionsProgramAndOptions) {
    std::ostringstream out;
    bulkdl::printUsage(out, "bulkdl");
    EXPECT_NE(out.str().find("Usage: bulkdl"), std::string::npos);
    EXPECT_NE(out.str().find("--connections"), std::string::npos);
}
