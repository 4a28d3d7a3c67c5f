#include <csikit/config/config.hpp>

#include <fstream>

#include <boost/filesystem/operations.hpp>
#include <gtest/gtest.h>

CSIKIT_NAMESPACE_BEGIN

TEST(Config, Defaults) {
    const auto cfg = config::ParseConfigString("");
    EXPECT_EQ(cfg.plugin_name, "kubernetes.io/csi");
    EXPECT_EQ(cfg.plugins_dir, "/var/lib/kubelet/plugins");
    EXPECT_EQ(cfg.secrets_dir, "/var/run/secrets/csi");
    EXPECT_EQ(cfg.logging.level, logging::Level::kInfo);
    EXPECT_EQ(cfg.logging.message_max_size, 512);
    EXPECT_TRUE(cfg.logging.trim_secrets);
}

TEST(Config, Full) {
    const auto cfg = config::ParseConfigString(R"(
plugin-name: example.com/csi
plugins-dir: /tmp/plugins
secrets-dir: /tmp/secrets
logging:
  level: debug
  message-max-size: 0
  trim-secrets: false
)");
    EXPECT_EQ(cfg.plugin_name, "example.com/csi");
    EXPECT_EQ(cfg.plugins_dir, "/tmp/plugins");
    EXPECT_EQ(cfg.secrets_dir, "/tmp/secrets");
    EXPECT_EQ(cfg.logging.level, logging::Level::kDebug);
    EXPECT_EQ(cfg.logging.message_max_size, 0);
    EXPECT_FALSE(cfg.logging.trim_secrets);
}

TEST(Config, PartialLoggingSection) {
    const auto cfg = config::ParseConfigString("logging:\n  level: error\n");
    EXPECT_EQ(cfg.logging.level, logging::Level::kError);
    EXPECT_EQ(cfg.logging.message_max_size, 512);
}

TEST(Config, Invalid) {
    EXPECT_THROW(config::ParseConfigString("[1, 2]"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("plugin-name: ''"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("logging: 5"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("logging:\n  level: loud\n"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("logging:\n  message-max-size: -1\n"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("logging:\n  message-max-size: many\n"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("logging: {level: [debug]}"), config::ConfigError);
    EXPECT_THROW(config::ParseConfigString("plugin-name: [unterminated"), config::ConfigError);
}

TEST(Config, File) {
    const auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("csikit-%%%%-%%%%.yaml");
    {
        std::ofstream out{path.string()};
        out << "plugin-name: file.example.com\n";
    }
    const auto cfg = config::ParseConfigFile(path.string());
    boost::filesystem::remove(path);
    EXPECT_EQ(cfg.plugin_name, "file.example.com");

    EXPECT_THROW(config::ParseConfigFile(path.string()), config::ConfigError);
}

CSIKIT_NAMESPACE_END
