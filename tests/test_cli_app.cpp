#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

#include "adapters/inbound/cli/CliApp.hpp"
#include "adapters/inbound/cli/Interrupt.hpp"

namespace cli = prowl::client::adapters::cli;
namespace fs = boost::filesystem;

static const std::string kKey = "0123456789abcdef0123456789abcdef01234567";

// Points PROWL_CONFIG at a private config whose store lives in a fresh temp dir.
struct CliAppTest : ::testing::Test
{
  fs::path dir;
  fs::path settings;

  void SetUp() override
  {
    dir = fs::temp_directory_path() /
          ("prowl-cli-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    settings = dir / "prowl.json";

    const auto cfg = dir / "prowl.toml";
    std::ofstream out(cfg.string());
    out << "[store]\npath = \"" << settings.string() << "\"\n";
    out.close();
    ::setenv("PROWL_CONFIG", cfg.string().c_str(), 1);
  }

  void TearDown() override { ::unsetenv("PROWL_CONFIG"); }

  int run(std::vector<const char*> args)
  {
    args.insert(args.begin(), "/usr/local/bin/prowl");
    err.str("");
    return cli::run(static_cast<int>(args.size()), args.data(), err);
  }

  std::string read_settings() const
  {
    std::ifstream in(settings.string(), std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  }

  std::ostringstream err;
};

TEST_F(CliAppTest, HelpExitsZero)
{
  EXPECT_EQ(run({"--help"}), 0);
  EXPECT_TRUE(err.str().empty());
}

TEST_F(CliAppTest, SetApiKeyExitsZeroAndPersists)
{
  EXPECT_EQ(run({"--set-api-key=" "0123456789abcdef0123456789abcdef01234567"}), 0);
  EXPECT_TRUE(err.str().empty());
  EXPECT_NE(read_settings().find(kKey), std::string::npos);
}

TEST_F(CliAppTest, ParseErrorExitsOne)
{
  EXPECT_EQ(run({"--bogus"}), 1);
  EXPECT_EQ(err.str().rfind("prowl: Error: ", 0), 0u) << err.str();
}

TEST_F(CliAppTest, ValidationErrorExitsOneWithProgramPrefix)
{
  EXPECT_EQ(run({"-p", "3", "hello"}), 1);
  EXPECT_EQ(err.str(), "prowl: Error: Invalid value for --priority: 3\n");
}

TEST_F(CliAppTest, ConflictingSetKeyWritesNothing)
{
  EXPECT_EQ(run({"--set-api-key=" "0123456789abcdef0123456789abcdef01234567", "--url=http://x"}),
            1);
  EXPECT_EQ(err.str(),
            "prowl: Error: Cannot use --set-api-key with any other arguments or options.\n");
  EXPECT_FALSE(fs::exists(settings));
}

TEST_F(CliAppTest, MissingDefaultKeyExitsOne)
{
  EXPECT_EQ(run({"hello"}), 1);
  EXPECT_EQ(err.str(),
            "prowl: Error: --api-key is mandatory because no default API key has been set.\n");
}

TEST_F(CliAppTest, StoreErrorExitsOne)
{
  {
    std::ofstream out(settings.string());
    out << "{ not json";
  }

  EXPECT_EQ(run({"--set-api-key=" "0123456789abcdef0123456789abcdef01234567"}), 1);
  EXPECT_EQ(err.str().rfind("prowl: Error: Malformed settings file ", 0), 0u) << err.str();
  EXPECT_EQ(read_settings(), "{ not json");
}

TEST(CliInterrupt, SigintExitsTwo)
{
  EXPECT_EXIT(
      {
        cli::install_interrupt_handler("prowl");
        std::raise(SIGINT);
      },
      ::testing::ExitedWithCode(cli::kExitInterrupted), "prowl: Operation interrupted\\.");
}

TEST(CliProgramName, UsesBasename)
{
  const char* argv[] = {"/opt/bin/prowl"};
  EXPECT_EQ(cli::program_name(1, argv), "prowl");
  EXPECT_EQ(cli::program_name(0, argv), "prowl");
}
