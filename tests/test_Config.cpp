#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Config.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;
using test_support::TempDir;

namespace {

    // argv-style view over owned strings
    class Args {
    public:
        Args() = default;
        Args(std::initializer_list<std::string> list) : values(list) {
            for (std::string& value : values) pointers.push_back(value.data());
        }
        int argc() const { return static_cast<int>(pointers.size()); }
        char** argv() { return pointers.data(); }

    private:
        std::vector<std::string> values;
        std::vector<char*> pointers;
    };

} // namespace


TEST(ConfigTest, ServerDefaults) {
    Args args;
    ServerConfig config;
    std::string error;
    ASSERT_TRUE(Config::parseServerArgs(args.argc(), args.argv(), config, error)) << error;

    EXPECT_EQ(config.port, DEFAULT_PORT);
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.idle_timeout, 0);
    EXPECT_TRUE(config.root.is_absolute());
}

TEST(ConfigTest, ServerPortRootAndOptions) {
    TempDir root;
    Args args{"5000", root.path().string(), "--bind", "127.0.0.1",
              "--log-file", "/tmp/sfmp.log", "--idle-timeout", "30"};
    ServerConfig config;
    std::string error;
    ASSERT_TRUE(Config::parseServerArgs(args.argc(), args.argv(), config, error)) << error;

    EXPECT_EQ(config.port, 5000);
    EXPECT_EQ(config.root, root.path().lexically_normal());
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.log_file, "/tmp/sfmp.log");
    EXPECT_EQ(config.idle_timeout, 30);
}

TEST(ConfigTest, ServerRejectsBadInput) {
    TempDir root;
    ServerConfig config;
    std::string error;

    Args bad_port{"80a"};
    EXPECT_FALSE(Config::parseServerArgs(bad_port.argc(), bad_port.argv(), config, error));
    EXPECT_NE(error.find("Invalid port"), std::string::npos);

    Args big_port{"70000"};
    EXPECT_FALSE(Config::parseServerArgs(big_port.argc(), big_port.argv(), config, error));

    Args missing_root{"5000", (root / "absent").string()};
    EXPECT_FALSE(Config::parseServerArgs(missing_root.argc(), missing_root.argv(), config, error));
    EXPECT_NE(error.find("does not exist"), std::string::npos);

    Args dangling{"5000", "--idle-timeout"};
    EXPECT_FALSE(Config::parseServerArgs(dangling.argc(), dangling.argv(), config, error));

    Args trailing{"5000", "--idle-timeout", "30abc"};
    EXPECT_FALSE(Config::parseServerArgs(trailing.argc(), trailing.argv(), config, error));
    EXPECT_NE(error.find("Invalid idle timeout"), std::string::npos);

    Args negative{"5000", "--idle-timeout", "-1"};
    EXPECT_FALSE(Config::parseServerArgs(negative.argc(), negative.argv(), config, error));

    Args unknown{"5000", "--verbose"};
    EXPECT_FALSE(Config::parseServerArgs(unknown.argc(), unknown.argv(), config, error));
    EXPECT_NE(error.find("Unknown option"), std::string::npos);

    Args extra{"5000", root.path().string(), "surplus"};
    EXPECT_FALSE(Config::parseServerArgs(extra.argc(), extra.argv(), config, error));
}

TEST(ConfigTest, ClientNeedsHostAndPort) {
    ClientConfig config;
    std::string error;

    Args good{"localhost", "57005"};
    ASSERT_TRUE(Config::parseClientArgs(good.argc(), good.argv(), config, error)) << error;
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 57005);

    Args missing{"localhost"};
    EXPECT_FALSE(Config::parseClientArgs(missing.argc(), missing.argv(), config, error));

    Args bad{"localhost", "port"};
    EXPECT_FALSE(Config::parseClientArgs(bad.argc(), bad.argv(), config, error));
}

TEST(ConfigTest, UsageNamesBothModes) {
    std::string text = Config::usage("sfmp");
    EXPECT_NE(text.find("sfmp server"), std::string::npos);
    EXPECT_NE(text.find("sfmp client <host> <port>"), std::string::npos);
}
