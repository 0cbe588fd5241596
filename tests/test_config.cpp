#include "test_framework.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

namespace {

using chatfetch::testing::EnvGuard;

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    if (next.has_value()) {
      chatfetch::config::set_config_path_override(*next);
    } else {
      chatfetch::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() { chatfetch::config::clear_config_path_override(); }
};

/// Clears every variable load_config looks at.
struct CleanEnv {
  EnvGuard config_path{"CHATFETCH_CONFIG_PATH", std::nullopt};
  EnvGuard server{"SERVER_ADDRESS", std::nullopt};
  EnvGuard rest{"REST_API_ADDRESS", std::nullopt};
  EnvGuard observability{"CHATFETCH_OBSERVABILITY", std::nullopt};
  EnvGuard wait{"CHATFETCH_RECONNECT_WAIT_SECS", std::nullopt};
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("chatfetch-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

bool has_problem(const std::vector<std::string> &problems, const std::string &needle) {
  return std::any_of(problems.begin(), problems.end(), [&needle](const std::string &problem) {
    return problem.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<chatfetch::tests::TestCase> &tests) {
  using chatfetch::tests::require;
  namespace cfg = chatfetch::config;

  tests.push_back({"config_path_defaults_under_home", [] {
                     const CleanEnv env;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;

                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".chatfetch" / "config.toml",
                             "unexpected default path: " + path.value().string());
                     require(!cfg::config_exists(), "fresh home has no config");
                   }});

  tests.push_back({"config_path_override_and_env", [] {
                     const CleanEnv env;
                     const auto home = make_temp_home();
                     {
                       const ConfigOverrideGuard cfg_override(home / "custom.toml");
                       const auto path = cfg::config_path();
                       require(path.ok(), path.error());
                       require(path.value() == home / "custom.toml", "override file ignored");
                     }
                     {
                       const ConfigOverrideGuard cfg_override;
                       const EnvGuard env_path("CHATFETCH_CONFIG_PATH", home.string());
                       const auto path = cfg::config_path();
                       require(path.ok(), path.error());
                       require(path.value() == home / "config.toml",
                               "directory in env should resolve to config.toml inside it");
                     }
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const CleanEnv env;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.video_id.empty(), "no default video id");
                     require(config.stream.server_address == "https://youtube.googleapis.com",
                             "default server address");
                     require(config.reconnect.wait_secs == 5, "default wait is five seconds");
                     require(!config.reconnect.fail_fast, "fail fast is opt-in");
                     require(config.output.sync, "sync defaults on");
                     require(config.observability.backend == "log", "default backend is log");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const CleanEnv env;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());

                     write_file(path.value(), R"(
video_id = "dQw4w9WgXcQ"

[stream]
server_address = "localhost:8443/"
parts = ["snippet"]
max_results = 500
hl = "de"
profile_image_size = 88
idle_timeout_secs = 90

[reconnect]
wait_secs = 2
fail_fast = true

[output]
file = "~/chat/log.jsonl"
resume = true
sync = false

[auth]
api_key_path = "~/key.txt"

[observability]
backend = "none"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.video_id == "dQw4w9WgXcQ", "video id");
                     require(config.stream.server_address == "https://localhost:8443",
                             "server address should be normalized: " +
                                 config.stream.server_address);
                     require(config.stream.parts.size() == 1 &&
                                 config.stream.parts[0] == "snippet",
                             "parts");
                     require(config.stream.max_results == 500, "max_results");
                     require(config.stream.hl == "de", "hl");
                     require(config.stream.profile_image_size == 88, "profile_image_size");
                     require(config.stream.idle_timeout_secs == 90, "idle timeout");
                     require(config.reconnect.wait_secs == 2, "wait_secs");
                     require(config.reconnect.fail_fast, "fail_fast");
                     require(config.output.file == (home / "chat/log.jsonl").string(),
                             "output file should expand ~: " + config.output.file);
                     require(config.output.resume, "resume");
                     require(!config.output.sync, "sync");
                     require(config.auth.api_key_path == (home / "key.txt").string(),
                             "api key path should expand ~");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"load_config_reports_path_on_parse_error", [] {
                     const CleanEnv env;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "broken.toml");
                     write_file(home / "broken.toml", "[stream]\nnot a pair\n");

                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken config should fail");
                     require(loaded.error().find("broken.toml") != std::string::npos,
                             "error should name the file: " + loaded.error());
                   }});

  tests.push_back({"env_overrides_apply_after_file", [] {
                     const CleanEnv env;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml",
                                "[stream]\nserver_address = \"https://file.example\"\n");

                     const EnvGuard server("SERVER_ADDRESS", std::string("http://127.0.0.1:50051"));
                     const EnvGuard rest("REST_API_ADDRESS", std::string("rest.example/"));
                     const EnvGuard wait("CHATFETCH_RECONNECT_WAIT_SECS", std::string("9"));
                     const EnvGuard backend("CHATFETCH_OBSERVABILITY", std::string("none"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.stream.server_address == "http://127.0.0.1:50051",
                             "SERVER_ADDRESS wins over the file");
                     require(config.stream.rest_api_address == "https://rest.example",
                             "REST_API_ADDRESS normalized");
                     require(config.reconnect.wait_secs == 9, "wait override");
                     require(config.observability.backend == "none", "backend override");
                   }});

  tests.push_back({"env_override_ignores_non_numeric_wait", [] {
                     const CleanEnv env;
                     cfg::Config config;
                     const EnvGuard wait("CHATFETCH_RECONNECT_WAIT_SECS", std::string("-3"));
                     cfg::apply_env_overrides(config);
                     require(config.reconnect.wait_secs == 5, "invalid value must be ignored");
                   }});

  tests.push_back({"normalize_server_address_cases", [] {
                     require(cfg::normalize_server_address(" example.com ") ==
                                 "https://example.com",
                             "scheme added");
                     require(cfg::normalize_server_address("http://h:1//") == "http://h:1",
                             "trailing slashes dropped");
                     require(cfg::normalize_server_address("").empty(), "empty stays empty");
                   }});

  tests.push_back({"validate_config_accepts_minimal", [] {
                     cfg::Config config;
                     config.video_id = "abc";
                     const auto problems = cfg::validate_config(config);
                     require(problems.empty(), "minimal config should validate: " +
                                                   (problems.empty() ? "" : problems.front()));
                   }});

  tests.push_back({"validate_config_requires_video_or_resume", [] {
                     cfg::Config config;
                     require(has_problem(cfg::validate_config(config), "video id is required"),
                             "missing video id should be reported");

                     config.output.resume = true;
                     const auto problems = cfg::validate_config(config);
                     require(!has_problem(problems, "video id is required"),
                             "resume does not need a video id");
                     require(has_problem(problems, "resume requires an output file"),
                             "resume needs an output file");

                     config.output.file = "/tmp/chat.jsonl";
                     require(cfg::validate_config(config).empty(),
                             "resume with a file is valid");
                   }});

  tests.push_back({"validate_config_rejects_bad_values", [] {
                     cfg::Config config;
                     config.video_id = "abc";
                     config.auth.api_key_path = "/k";
                     config.auth.oauth_token_path = "/nonexistent/chatfetch/token.json";
                     config.reconnect.wait_secs = cfg::kMaxReconnectWaitSecs + 1;
                     config.stream.server_address = "  ";
                     config.observability.backend = "log,prometheus";

                     const auto problems = cfg::validate_config(config);
                     require(has_problem(problems, "mutually exclusive"), "auth conflict");
                     require(has_problem(problems, "OAuth token file not found"),
                             "missing token without client credentials");
                     require(has_problem(problems, "wait_secs must be at most"), "wait bound");
                     require(has_problem(problems, "server_address"), "empty server");
                     require(has_problem(problems, "Invalid observability.backend"),
                             "unknown backend");
                   }});

  tests.push_back({"validate_config_oauth_refreshable_without_file", [] {
                     cfg::Config config;
                     config.video_id = "abc";
                     config.auth.oauth_token_path = "/nonexistent/chatfetch/token.json";
                     config.auth.oauth_client_id = "id";
                     config.auth.oauth_client_secret = "secret";
                     require(!has_problem(cfg::validate_config(config), "OAuth token file"),
                             "client credentials make a missing token file acceptable");
                   }});
}
