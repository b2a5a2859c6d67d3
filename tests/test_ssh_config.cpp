#include <gtest/gtest.h>
#include <core/ssh_config.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* SSH_CONFIG = R"(
# defaults
Host *
    User fallback
    Port 2022

Host web web-alias
    HostName web.example.com
    User alice
    IdentityFile /home/alice/.ssh/id_ed25519

host db
    hostname db.internal
    port 5522

Host nohostname
    User bob
)";

TEST(SshConfig, ParsesBlocksAndSkipsWithoutHostName) {
    auto entries = parse_ssh_config_text(SSH_CONFIG);
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].alias, "web");
    EXPECT_EQ(entries[0].hostname, "web.example.com");
    EXPECT_EQ(entries[0].user.value_or(""), "alice");
    EXPECT_EQ(entries[0].port.value_or(0), 2022);
    EXPECT_EQ(entries[0].identity_file.value_or(""), "/home/alice/.ssh/id_ed25519");

    EXPECT_EQ(entries[1].alias, "db");
    EXPECT_EQ(entries[1].hostname, "db.internal");
    EXPECT_EQ(entries[1].port.value_or(0), 5522);
    EXPECT_EQ(entries[1].user.value_or(""), "fallback");
    EXPECT_FALSE(entries[1].identity_file.has_value());
}

TEST(SshConfig, EntriesWithoutUserAreDropped) {
    auto entries = parse_ssh_config_text(R"(
Host a
    HostName a.example.com
Host b
    HostName b.example.com
    User carol
)");
    ASSERT_EQ(entries.size(), 2u);

    AppConfig config = config_from_ssh_entries(entries);
    ASSERT_EQ(config.hosts().size(), 1u);
    EXPECT_EQ(config.hosts()[0].name, "b");
    EXPECT_EQ(config.hosts()[0].port, 22);
    EXPECT_TRUE(config.channels().empty());
}

TEST(SshConfig, AuthFromIdentityFile) {
    AppConfig config = config_from_ssh_entries(parse_ssh_config_text(SSH_CONFIG));
    ASSERT_EQ(config.hosts().size(), 2u);

    const auto& web = config.hosts()[0];
    EXPECT_EQ(web.auth.type, AuthConfig::Type::Key);
    EXPECT_EQ(web.auth.key_path, "/home/alice/.ssh/id_ed25519");

    const auto& db = config.hosts()[1];
    EXPECT_EQ(db.auth.type, AuthConfig::Type::Password);
    EXPECT_EQ(db.auth.password, PASSWORD_PLACEHOLDER);
}

TEST(SshConfig, MissingFileIsError) {
    auto r = parse_ssh_config_file(fs::temp_directory_path() / "chanhub_no_such_ssh_config");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(SshConfig, ReadsFile) {
    fs::path path = fs::temp_directory_path() / "chanhub_test_ssh_config";
    {
        std::ofstream f(path);
        f << SSH_CONFIG;
    }
    auto r = parse_ssh_config_file(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.size(), 2u);
}
