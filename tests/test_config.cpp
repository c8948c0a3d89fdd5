#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "logtap_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        const char* home = std::getenv("HOME");
        had_home = home != nullptr;
        if (home) saved_home = home;
    }

    void TearDown() override {
        if (had_home) setenv("HOME", saved_home.c_str(), 1);
        else unsetenv("HOME");
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.kubectl().path, "kubectl");
    EXPECT_EQ(config.stream().retry_limit, 5);
    EXPECT_EQ(config.stream().retry_delay_ms, 1000);
    EXPECT_FALSE(config.bastion().has_value());
    EXPECT_FALSE(config.log().verbose);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, LoadFullFile) {
    auto path = write_config(R"(
kubectl:
  path: /usr/local/bin/kubectl
  context: prod
  kubeconfig: /etc/kube/admin.conf
  timeout: 20
bastion:
  host: bastion.example.com
  port: 2222
  user: ops
  ssh_key_path: /home/ops/.ssh/id_ed25519
stream:
  retry_limit: 3
  retry_delay_ms: 250
  ready_timeout: 120
  ready_poll_ms: 500
log:
  path: "-"
  verbose: true
)");

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.kubectl().path, "/usr/local/bin/kubectl");
    EXPECT_EQ(c.kubectl().context, "prod");
    EXPECT_EQ(c.kubectl().kubeconfig, "/etc/kube/admin.conf");
    EXPECT_EQ(c.kubectl().timeout, 20);

    ASSERT_TRUE(c.bastion().has_value());
    EXPECT_EQ(c.bastion()->host, "bastion.example.com");
    EXPECT_EQ(c.bastion()->port, 2222);
    EXPECT_EQ(c.bastion()->user, "ops");
    EXPECT_FALSE(c.bastion()->password.has_value());
    EXPECT_EQ(c.bastion()->ssh_key_path.value_or(""), "/home/ops/.ssh/id_ed25519");

    EXPECT_EQ(c.stream().retry_limit, 3);
    EXPECT_EQ(c.stream().retry_delay_ms, 250);
    EXPECT_EQ(c.stream().ready_timeout, 120);
    EXPECT_EQ(c.stream().ready_poll_ms, 500);

    EXPECT_EQ(c.log().path, "-");
    EXPECT_TRUE(c.log().verbose);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    auto r = Config::load_file(write_config("stream:\n  retry_limit: 8\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stream().retry_limit, 8);
    EXPECT_EQ(r.value.stream().retry_delay_ms, 1000);
    EXPECT_EQ(r.value.kubectl().path, "kubectl");
}

TEST_F(ConfigTest, EmptyBastionMeansLocal) {
    auto r = Config::load_file(write_config("bastion:\n  host: \"\"\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.bastion().has_value());
}

TEST_F(ConfigTest, BastionNeedsUser) {
    auto r = Config::load_file(write_config("bastion:\n  host: jump\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("bastion requires both host and user"), std::string::npos);
}

TEST_F(ConfigTest, RejectsZeroRetryLimit) {
    auto r = Config::load_file(write_config("stream:\n  retry_limit: 0\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("stream.retry_limit must be at least 1 (got 0)"), std::string::npos);
}

TEST_F(ConfigTest, RejectsNegativeDelay) {
    auto r = Config::load_file(write_config("stream:\n  retry_delay_ms: -1\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("retry_delay_ms must not be negative"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    auto r = Config::load_file(write_config("stream: [unclosed\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.rfind("Failed to parse config", 0), 0u);
}

TEST_F(ConfigTest, ExplicitPathMustExist) {
    auto r = Config::load(test_dir / "missing.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.rfind("Config not found at", 0), 0u);
}

TEST_F(ConfigTest, DefaultLocationMissingGivesDefaults) {
    setenv("HOME", test_dir.c_str(), 1);
    EXPECT_EQ(get_global_config_path(), test_dir / ".logtap" / "config.yaml");

    auto r = Config::load();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stream().retry_limit, 5);
}

TEST_F(ConfigTest, DefaultLocationIsRead) {
    setenv("HOME", test_dir.c_str(), 1);
    fs::create_directories(test_dir / ".logtap");
    std::ofstream(test_dir / ".logtap" / "config.yaml") << "kubectl:\n  context: dev\n";

    auto r = Config::load_default();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kubectl().context, "dev");
}

TEST_F(ConfigTest, OverridesAreValidated) {
    Config config;
    config.set_context("kind-local");
    config.set_retry_delay_ms(10);
    config.set_verbose(true);
    EXPECT_EQ(config.kubectl().context, "kind-local");
    EXPECT_TRUE(config.validate().is_ok());

    config.set_retry_limit(0);
    EXPECT_TRUE(config.validate().is_err());
}
