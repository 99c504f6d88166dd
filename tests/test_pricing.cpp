#include <catch2/catch.hpp>
#include <tku/pricing.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace tku;
namespace fs = std::filesystem;

static const char* SAMPLE_PRICES = R"({
    "sample_spec": {"max_tokens": "set to max output tokens"},
    "claude-sonnet-4-5-20250929": {
        "input_cost_per_token": 3e-06,
        "output_cost_per_token": 1.5e-05,
        "cache_read_input_token_cost": 3e-07,
        "cache_creation_input_token_cost": 3.75e-06,
        "litellm_provider": "anthropic"
    },
    "us.anthropic.claude-3-5-haiku-20241022-v1:0": {
        "input_cost_per_token": 8e-07,
        "output_cost_per_token": 4e-06
    },
    "openai/gpt-5": {
        "input_cost_per_token": 2e-06,
        "output_cost_per_token": 9e-06
    },
    "gpt-5": {
        "input_cost_per_token": 1.25e-06,
        "output_cost_per_token": 1e-05
    },
    "text-embedding-3-small": {
        "input_cost_per_token": 2e-08
    }
})";

static std::string temp_dir() {
    static int counter = 0;
    auto dir = "/tmp/tku_test_pricing_" + std::to_string(getpid()) + "_" +
               std::to_string(counter++);
    fs::create_directories(dir);
    return dir;
}

TEST_CASE("parse_litellm_pricing reads rates", "[pricing]") {
    auto r = parse_litellm_pricing(SAMPLE_PRICES);
    REQUIRE(r.is_ok());
    const auto& table = r.value();

    const ModelPricing* p = table.get("claude-sonnet-4-5-20250929");
    REQUIRE(p != nullptr);
    REQUIRE(p->input_cost_per_token == Approx(3e-6));
    REQUIRE(p->output_cost_per_token == Approx(1.5e-5));
    REQUIRE(*p->cache_read_input_token_cost == Approx(3e-7));
    REQUIRE(*p->cache_creation_input_token_cost == Approx(3.75e-6));
}

TEST_CASE("parse_litellm_pricing skips entries without both base rates", "[pricing]") {
    auto table = parse_litellm_pricing(SAMPLE_PRICES).value();
    REQUIRE(table.get("sample_spec") == nullptr);
    REQUIRE(table.get("text-embedding-3-small") == nullptr);
}

TEST_CASE("parse_litellm_pricing registers normalized aliases", "[pricing]") {
    auto table = parse_litellm_pricing(SAMPLE_PRICES).value();
    REQUIRE(table.get("claude-3-5-haiku-20241022-v1:0") != nullptr);
    const ModelPricing* haiku = table.get("claude-3-5-haiku-20241022");
    REQUIRE(haiku != nullptr);
    REQUIRE(haiku->input_cost_per_token == Approx(8e-7));
    REQUIRE_FALSE(haiku->cache_read_input_token_cost.has_value());
}

TEST_CASE("aliases never shadow a real entry", "[pricing]") {
    auto table = parse_litellm_pricing(SAMPLE_PRICES).value();
    // "openai/gpt-5" normalizes to "gpt-5", which has its own rates
    REQUIRE(table.get("gpt-5")->input_cost_per_token == Approx(1.25e-6));
    REQUIRE(table.get("openai/gpt-5")->input_cost_per_token == Approx(2e-6));
}

TEST_CASE("parse_litellm_pricing rejects invalid documents", "[pricing]") {
    REQUIRE(parse_litellm_pricing("{not json").is_err());
    auto r = parse_litellm_pricing("[1, 2, 3]");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TkuError::Parse);
}

TEST_CASE("normalized_model_keys variants", "[pricing]") {
    REQUIRE(normalized_model_keys("claude-opus-4-1").empty());
    REQUIRE(normalized_model_keys("anthropic.claude-v2:1") ==
            std::vector<std::string>{"claude-v2:1"});
    REQUIRE(normalized_model_keys("bedrock/us-east-1/claude-3-opus-v1:0") ==
            std::vector<std::string>{"claude-3-opus-v1:0", "claude-3-opus"});
    REQUIRE(normalized_model_keys("bedrock/claude-instant-v1") ==
            std::vector<std::string>{"claude-instant-v1", "claude-instant"});
    REQUIRE(normalized_model_keys("claude-3-opus:0") ==
            std::vector<std::string>{"claude-3-opus"});
}

TEST_CASE("load_pricing reads the configured file and applies overrides", "[pricing]") {
    auto dir = temp_dir();
    std::string path = dir + "/prices.json";
    {
        std::ofstream f(path);
        f << SAMPLE_PRICES;
    }

    Config config;
    config.pricing_file = path;
    ModelPricing custom;
    custom.input_cost_per_token = 5e-6;
    custom.output_cost_per_token = 6e-6;
    config.pricing_overrides["gpt-5"] = custom;
    config.pricing_overrides["local-llama"] = ModelPricing{};

    auto r = load_pricing(config);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().get("gpt-5")->input_cost_per_token == Approx(5e-6));
    REQUIRE(r.value().get("local-llama") != nullptr);
    REQUIRE(r.value().get("claude-sonnet-4-5-20250929") != nullptr);
    fs::remove_all(dir);
}

TEST_CASE("load_pricing without a file leaves only overrides", "[pricing]") {
    Config config;
    config.pricing_file = "/nonexistent/tku/prices.json";
    config.pricing_overrides["m"] = ModelPricing{};

    auto r = load_pricing(config);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
}

TEST_CASE("load_pricing reports a corrupt file", "[pricing]") {
    auto dir = temp_dir();
    std::string path = dir + "/prices.json";
    {
        std::ofstream f(path);
        f << "{\"truncated\": ";
    }
    Config config;
    config.pricing_file = path;

    auto r = load_pricing(config);
    REQUIRE(r.is_err());
    REQUIRE(r.error().path == path);
    REQUIRE_FALSE(r.error().hint.empty());
    fs::remove_all(dir);
}
