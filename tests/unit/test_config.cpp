#include <gtest/gtest.h>
#include "mcpfs/config.hpp"
#include "mcpfs/error.hpp"
#include "test_support.hpp"
#include <map>

using namespace mcpfs;
using mcpfs::testing::TempDir;

namespace {

EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

std::string config_error(const std::vector<std::string>& args, const EnvLookup& env,
                         const std::string& start_dir) {
    try {
        (void)parse_config(args, env, start_dir);
    } catch (const ConfigError& e) {
        return e.what();
    }
    ADD_FAILURE() << "expected ConfigError";
    return {};
}

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::string dir_a;
    std::string dir_b;

    void SetUp() override {
        dir_a = tmp.mkdir("a");
        dir_b = tmp.mkdir("b");
    }
};

TEST_F(ConfigTest, Defaults) {
    auto cfg = parse_config({dir_a}, env_of({}), tmp.path());
    EXPECT_EQ(cfg.allowed_dirs, std::vector<std::string>{dir_a});
    EXPECT_EQ(cfg.mode, ServerMode::Stdio);
    EXPECT_EQ(cfg.listen_addr, DEFAULT_LISTEN_ADDR);
    EXPECT_EQ(cfg.log_level, log::Level::Info);
    EXPECT_FALSE(cfg.show_help);
}

TEST_F(ConfigTest, RelativeRootsAndDuplicates) {
    auto cfg = parse_config({"a", "./b/", dir_a, "b/../a"}, env_of({}), tmp.path());
    EXPECT_EQ(cfg.allowed_dirs, (std::vector<std::string>{dir_a, dir_b}));
}

TEST_F(ConfigTest, FlagsOverrideEnvironment) {
    auto env = env_of({{"MCP_SERVER_MODE", "sse"}, {"MCP_LISTEN_ADDR", "127.0.0.1:9000"},
                       {"LOG_LEVEL", "warn"}});
    auto from_env = parse_config({dir_a}, env, tmp.path());
    EXPECT_EQ(from_env.mode, ServerMode::Sse);
    EXPECT_EQ(from_env.listen_addr, "127.0.0.1:9000");
    EXPECT_EQ(from_env.log_level, log::Level::Warn);

    auto flagged = parse_config({"--mode=stdio", "--listen=:7000", "--log-level=DEBUG", dir_a},
                                env, tmp.path());
    EXPECT_EQ(flagged.mode, ServerMode::Stdio);
    EXPECT_EQ(flagged.listen_addr, ":7000");
    EXPECT_EQ(flagged.log_level, log::Level::Debug);
}

TEST_F(ConfigTest, HelpSkipsValidation) {
    EXPECT_TRUE(parse_config({"--help"}, env_of({{"LOG_LEVEL", "bogus"}}), tmp.path()).show_help);
    EXPECT_TRUE(parse_config({"/does/not/exist", "-h"}, env_of({}), tmp.path()).show_help);
}

TEST_F(ConfigTest, DoubleDashEndsOptions) {
    std::string dashed = tmp.mkdir("-weird");
    auto cfg = parse_config({"--", "-weird"}, env_of({}), tmp.path());
    EXPECT_EQ(cfg.allowed_dirs, std::vector<std::string>{dashed});
}

TEST_F(ConfigTest, Errors) {
    EXPECT_EQ(config_error({}, env_of({}), tmp.path()), "at least one allowed directory is required");
    EXPECT_EQ(config_error({"--verbose", dir_a}, env_of({}), tmp.path()), "invalid flag: --verbose");
    EXPECT_NE(config_error({"--mode=http", dir_a}, env_of({}), tmp.path()).find("invalid server mode"),
              std::string::npos);
    EXPECT_NE(config_error({dir_a}, env_of({{"LOG_LEVEL", "loud"}}), tmp.path()).find("invalid log level"),
              std::string::npos);
    EXPECT_NE(config_error({tmp / "missing"}, env_of({}), tmp.path()).find("does not exist"),
              std::string::npos);
    std::string file = tmp.write("file.txt", "x");
    EXPECT_NE(config_error({file}, env_of({}), tmp.path()).find("not a directory"), std::string::npos);
}

TEST_F(ConfigTest, SseModeValidatesListenAddress) {
    EXPECT_NO_THROW((void)parse_config({"--listen=nonsense", dir_a}, env_of({}), tmp.path()));
    EXPECT_THROW((void)parse_config({"--mode=sse", "--listen=nonsense", dir_a}, env_of({}), tmp.path()),
                 ConfigError);
}

TEST(ListenAddress, Parses) {
    auto a = parse_listen_address("127.0.0.1:8080");
    EXPECT_EQ(a.host, "127.0.0.1");
    EXPECT_EQ(a.port, 8080);

    auto any = parse_listen_address(":38085");
    EXPECT_EQ(any.host, "0.0.0.0");
    EXPECT_EQ(any.port, 38085);

    auto v6 = parse_listen_address("[::1]:443");
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, 443);
}

TEST(ListenAddress, Rejects) {
    for (const char* bad : {"localhost", "host:", "host:http", "host:0", "host:65536", "host:-1"}) {
        EXPECT_THROW((void)parse_listen_address(bad), ConfigError) << bad;
    }
}

TEST(ServerModeNames, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_mode("SSE"), ServerMode::Sse);
    EXPECT_EQ(parse_mode("stdio"), ServerMode::Stdio);
    EXPECT_FALSE(parse_mode("tcp").has_value());
    EXPECT_EQ(mode_name(ServerMode::Sse), "sse");
}

TEST(Usage, MentionsFlagsAndVariables) {
    std::string text = usage_text();
    for (const char* needle : {"--mode=", "--listen=", "--log-level=", "MCP_SERVER_MODE",
                               "MCP_LISTEN_ADDR", "LOG_LEVEL", "<allowed-directory>"}) {
        EXPECT_NE(text.find(needle), std::string::npos) << needle;
    }
}
