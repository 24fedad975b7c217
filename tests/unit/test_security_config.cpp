#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/security_config.hpp"
#include "core/config/session_id.hpp"

namespace {

using warden::core::config::load_security_config;
using warden::core::config::parse_security_config;
using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::core::logging::LogLevel;

TEST(SecurityConfigTest, EmptyObjectYieldsDefaults) {
    auto result = parse_security_config("{}", "/etc/warden");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_FALSE(config.blocklist_path.has_value());
    EXPECT_FALSE(config.audit_log_path.has_value());
    EXPECT_FALSE(config.working_directory.has_value());
    EXPECT_EQ(config.audit_retention_days, 30u);
    EXPECT_TRUE(config.guard_enabled);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(SecurityConfigTest, ParsesEveryField) {
    auto result = parse_security_config(R"({
        "blocklist_path": "/opt/warden/blocked.csv",
        "audit_log_path": "/var/log/warden/audit.log",
        "audit_retention_days": 7,
        "working_directory": "/srv/project",
        "guard_enabled": false,
        "log_level": "debug"
    })",
                                        "/etc/warden");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.blocklist_path.value(), std::filesystem::path("/opt/warden/blocked.csv"));
    EXPECT_EQ(config.audit_log_path.value(), std::filesystem::path("/var/log/warden/audit.log"));
    EXPECT_EQ(config.audit_retention_days, 7u);
    EXPECT_EQ(config.working_directory.value(), std::filesystem::path("/srv/project"));
    EXPECT_FALSE(config.guard_enabled);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(SecurityConfigTest, AnchorsRelativePathsAtBaseDirectory) {
    auto result = parse_security_config(
        R"({"blocklist_path": "rules/blocked.csv", "working_directory": "../project"})",
        "/etc/warden");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.blocklist_path.value(), std::filesystem::path("/etc/warden/rules/blocked.csv"));
    EXPECT_EQ(config.working_directory.value(), std::filesystem::path("/etc/project"));
}

TEST(SecurityConfigTest, NullPathMeansUnset) {
    auto result = parse_security_config(R"({"audit_log_path": null})", "/etc/warden");
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).audit_log_path.has_value());
}

TEST(SecurityConfigTest, RejectsMalformedJson) {
    auto result = parse_security_config("{\"guard_enabled\": ", "/etc/warden");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "config_parse_error");
}

TEST(SecurityConfigTest, RejectsNonObjectDocument) {
    auto result = parse_security_config("[1, 2]", "/etc/warden");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_error");
}

TEST(SecurityConfigTest, RejectsWrongFieldTypes) {
    EXPECT_EQ(get_error(parse_security_config(R"({"guard_enabled": "yes"})", "")).code,
              "config_invalid_field");
    EXPECT_EQ(get_error(parse_security_config(R"({"blocklist_path": 3})", "")).code,
              "config_invalid_field");
    EXPECT_EQ(get_error(parse_security_config(R"({"audit_log_path": ""})", "")).code,
              "config_invalid_field");
    EXPECT_EQ(get_error(parse_security_config(R"({"log_level": "chatty"})", "")).code,
              "config_invalid_field");
}

TEST(SecurityConfigTest, RejectsRetentionOutOfRange) {
    EXPECT_TRUE(is_error(parse_security_config(R"({"audit_retention_days": -1})", "")));
    EXPECT_TRUE(is_error(parse_security_config(R"({"audit_retention_days": 36501})", "")));
    EXPECT_TRUE(is_error(parse_security_config(R"({"audit_retention_days": 1.5})", "")));

    auto zero = parse_security_config(R"({"audit_retention_days": 0})", "");
    ASSERT_FALSE(is_error(zero));
    EXPECT_EQ(get_value(zero).audit_retention_days, 0u);
}

TEST(SecurityConfigTest, LoadReportsMissingFile) {
    auto result = load_security_config(std::filesystem::current_path() /
                                       "__definitely_missing_warden_config__.json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_not_found");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(SecurityConfigTest, LoadAnchorsPathsAtConfigFileDirectory) {
    const auto dir = std::filesystem::current_path() /
                     (".tmp_security_config_" + warden::core::config::generate_session_id());
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "warden.json");
        out << R"({"audit_log_path": "logs/audit.log", "audit_retention_days": 90})";
    }

    auto result = load_security_config(dir / "warden.json");
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).audit_log_path.value(), dir / "logs/audit.log");
    EXPECT_EQ(get_value(result).audit_retention_days, 90u);
}

}  // namespace
