#include <catch2/catch_test_macros.hpp>
#include <string>

#include "config/ArchiverConfig.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/temp_dir.hpp"

namespace
{

struct LoadResult
{
    bool ok = false;
    ArchiverConfig config;
};

LoadResult loadFrom(const test_utils::TempDir& dir, const std::string& toml)
{
    auto path = dir.write("config.toml", toml);
    LoadResult result;
    ConfigManager manager(path.string());
    REQUIRE(register_archiver_tables(manager, result.config));
    result.ok = manager.load();
    return result;
}

} // namespace

TEST_CASE("Missing config file keeps defaults", "[config]")
{
    test_utils::TempDir dir("config_missing");
    ArchiverConfig config;
    ConfigManager manager((dir.path() / "absent.toml").string());
    REQUIRE(register_archiver_tables(manager, config));
    REQUIRE_FALSE(manager.fileExists());
    REQUIRE(manager.load());

    REQUIRE(config.chunking.max_words == 490000);
    REQUIRE(config.chunking.max_bytes == 199229440);
    REQUIRE_FALSE(config.chunking.by_year);
    REQUIRE(config.paths.data_dir == "data");
    REQUIRE(config.paths.resolvedOutputDir() == "data");
    REQUIRE(config.processing_options.strip_disclaimer);
    REQUIRE(config.logging.level == 4);
    REQUIRE_FALSE(config.validate().has_value());
}

TEST_CASE("Config file values are applied per section", "[config]")
{
    test_utils::TempDir dir("config_values");
    auto result = loadFrom(dir, R"(
[chunking]
max_words = 1000
max_bytes = 4096
by_year = true

[paths]
data_dir = "transcripts"
output_dir = "out"

[processing]
strip_disclaimer = false
infer_date_from_body = false
unknown_key = 1

[logging]
level = 6
append = false
)");

    REQUIRE(result.ok);
    const auto& config = result.config;
    REQUIRE(config.chunking.max_words == 1000);
    REQUIRE(config.chunking.max_bytes == 4096);
    REQUIRE(config.chunking.by_year);
    REQUIRE(config.paths.resolvedOutputDir() == "out");
    REQUIRE_FALSE(config.processing_options.strip_disclaimer);
    REQUIRE(config.processing_options.strip_masthead);
    REQUIRE(config.logging.level == 6);
    REQUIRE_FALSE(config.logging.append);
    REQUIRE(config.logging.directory == "logs");

    auto parser = config.parserOptions();
    REQUIRE_FALSE(parser.infer_date_from_body);
    REQUIRE_FALSE(parser.pipeline.strip_disclaimer);
    REQUIRE(parser.pipeline.strip_masthead);
}

TEST_CASE("Unknown keys are queued as configuration warnings", "[config]")
{
    utils::ErrorReporter::ClearErrors();
    test_utils::TempDir dir("config_unknown");
    auto result = loadFrom(dir, "[processing]\nunknown_key = 1\n\n[logging]\nlevel = 3\nverbosity = 2\n");

    REQUIRE(result.ok);
    REQUIRE(result.config.logging.level == 3);

    auto pending = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 2);
    for (const auto& report : pending)
    {
        REQUIRE(report.category == utils::ErrorCategory::Configuration);
        REQUIRE(report.severity == utils::ErrorSeverity::Warning);
    }
    REQUIRE(pending[0].user_message.find("unknown_key") != std::string::npos);
    REQUIRE(pending[1].user_message.find("verbosity") != std::string::npos);
    REQUIRE(utils::ErrorReporter::CountAtLeast(utils::ErrorSeverity::Error) == 0);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Config type errors fail the load", "[config]")
{
    utils::ErrorReporter::ClearErrors();
    test_utils::TempDir dir("config_types");

    REQUIRE_FALSE(loadFrom(dir, "[chunking]\nmax_words = \"lots\"\n").ok);
    REQUIRE_FALSE(loadFrom(dir, "[chunking]\nby_year = 1\n").ok);
    REQUIRE_FALSE(loadFrom(dir, "[logging]\nlevel = 9\n").ok);
    REQUIRE_FALSE(loadFrom(dir, "[paths]\ndata_dir = [1, 2]\n").ok);
    REQUIRE(utils::ErrorReporter::CountAtLeast(utils::ErrorSeverity::Fatal) >= 4);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Malformed TOML fails the load", "[config]")
{
    utils::ErrorReporter::ClearErrors();
    test_utils::TempDir dir("config_syntax");
    REQUIRE_FALSE(loadFrom(dir, "[chunking\nmax_words = 1").ok);
    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Non-positive limits are rejected by validation", "[config]")
{
    test_utils::TempDir dir("config_limits");
    auto result = loadFrom(dir, "[chunking]\nmax_words = -5\n");
    REQUIRE(result.ok);
    REQUIRE(result.config.validate().has_value());

    ArchiverConfig config;
    config.paths.data_dir.clear();
    REQUIRE(config.validate().has_value());
}

TEST_CASE("ConfigManager refuses duplicate key ownership", "[config]")
{
    ConfigManager manager("unused.toml");
    TableCallbacks noop{ [](const toml::table&, std::string&) { return true; } };
    REQUIRE(manager.registerTable("chunking", noop, { "max_words" }));
    REQUIRE_FALSE(manager.registerTable("chunking", noop, { "max_words" }));
    REQUIRE(manager.registerTable("chunking", noop, { "max_bytes" }));
}
