#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "policylens_cli/cli_handler.hpp"

namespace policylens_cli {

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "policylens_cli");
    std::vector<char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  CliHandler handler_{"http://127.0.0.1:3030"};
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
  EXPECT_EQ(parse({"h"}).command, Command::Help);
}

TEST_F(CliHandlerTest, ParsesRetrieve) {
  auto options = parse({"retrieve", "--query", "Is metformin covered?", "--top-k", "3",
                        "--region", "NC", "--category", "formulary"});

  EXPECT_EQ(options.command, Command::Retrieve);
  EXPECT_EQ(options.query, "Is metformin covered?");
  EXPECT_EQ(options.top_k, 3);
  EXPECT_EQ(options.region, "NC");
  EXPECT_EQ(options.category, "formulary");
}

TEST_F(CliHandlerTest, RetrieveShortFormsAndDefaults) {
  auto options = parse({"r", "-q", "copay"});

  EXPECT_EQ(options.command, Command::Retrieve);
  EXPECT_EQ(options.query, "copay");
  EXPECT_EQ(options.top_k, 5);
  EXPECT_TRUE(options.region.empty());

  EXPECT_EQ(parse({"r", "-q", "copay", "-k", "9"}).top_k, 9);
}

TEST_F(CliHandlerTest, RetrieveErrors) {
  EXPECT_THROW(parse({"retrieve"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query", "x", "--top-k", "many"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query", "x", "--top-k", "0"}), CliError);
  EXPECT_THROW(parse({"retrieve", "--query", "x", "--verbose", "1"}), CliError);
}

TEST_F(CliHandlerTest, ParsesIngest) {
  auto options = parse({"ingest", "--pages", "pages.json"});
  EXPECT_EQ(options.command, Command::Ingest);
  EXPECT_EQ(options.pages_file, "pages.json");

  EXPECT_EQ(parse({"i", "-p", "other.json"}).pages_file, "other.json");
  EXPECT_THROW(parse({"ingest"}), CliError);
  EXPECT_THROW(parse({"ingest", "--file", "pages.json"}), CliError);
}

TEST_F(CliHandlerTest, ParsesStats) {
  EXPECT_EQ(parse({"stats"}).command, Command::Stats);
}

TEST_F(CliHandlerTest, UnknownCommandThrows) {
  EXPECT_THROW(parse({"search"}), CliError);
}

TEST_F(CliHandlerTest, KeepsBaseUrl) {
  EXPECT_EQ(handler_.get_api_base_url(), "http://127.0.0.1:3030");
}

}  // namespace policylens_cli
