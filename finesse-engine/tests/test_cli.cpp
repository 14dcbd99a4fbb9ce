#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using Catch::Approx;

namespace {

const std::string ENGINE = FINESSE_ENGINE_BINARY;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/finesse_test_stdout.txt";
    std::string stderr_file = "/tmp/finesse_test_stderr.txt";

    std::string full_cmd = "\"" + ENGINE + "\" " + args + " >" + stdout_file + " 2>" + stderr_file;
    result.exit_code = WEXITSTATUS(std::system(full_cmd.c_str()));
    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    return result;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
    REQUIRE(contains(result.stderr_output, "--calculator"));
    REQUIRE(contains(result.stderr_output, "--principal"));
    REQUIRE(contains(result.stderr_output, "--home-price"));
    REQUIRE(contains(result.stderr_output, "--initial"));
    REQUIRE(contains(result.stderr_output, "--extra-type"));
    REQUIRE(contains(result.stderr_output, "--convert-to"));
    REQUIRE(contains(result.stderr_output, "--format"));
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
}

TEST_CASE("CLI rejects bad arguments", "[cli]") {
    SECTION("Unknown option") {
        auto result = run_command("--frobnicate");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Unknown option or missing argument: --frobnicate"));
    }

    SECTION("Missing calculator") {
        auto result = run_command("--principal 1000 --rate 5 --years 2");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--calculator is required"));
    }

    SECTION("Malformed number") {
        auto result = run_command("--calculator loan --principal lots");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Invalid numeric argument"));
    }

    SECTION("Zero term") {
        auto result = run_command("--calculator loan --principal 1000 --rate 5 --years 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--years must be greater than 0"));
    }

    SECTION("Term above the maximum") {
        auto result = run_command("--calculator loan --principal 1000 --rate 5 --years 200000000");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--years must be at most 100"));
    }

    SECTION("Negative amount") {
        auto result = run_command("--calculator investment --initial -5 --rate 5 --years 2");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--initial must be non-negative"));
    }

    SECTION("Down payment above the price") {
        auto result = run_command("--calculator mortgage --home-price 100000 --down-payment 200000 "
                                  "--rate 5 --years 30");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--down-payment cannot exceed --home-price"));
    }

    SECTION("Unknown repayment type") {
        auto result = run_command("--calculator loan --principal 1000 --rate 5 --years 2 --repayment weekly");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Error:"));
    }

    SECTION("Parquet needs an output file") {
        auto result = run_command("--calculator loan --principal 1000 --rate 5 --years 2 --format parquet");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--output is required for parquet output"));
    }

    SECTION("Missing request file") {
        auto result = run_command("--request /nonexistent/request.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Request file not found"));
    }
}

TEST_CASE("CLI loan calculation", "[cli]") {
    SECTION("JSON on stdout") {
        auto result = run_command("--calculator loan --principal 25000 --rate 7.5 --years 5");
        REQUIRE(result.exit_code == 0);

        auto j = nlohmann::json::parse(result.stdout_output);
        REQUIRE(j["calculator"] == "loan");
        REQUIRE(j["result"]["monthly_payment"].get<double>() == Approx(500.95).margin(0.005));
        REQUIRE(j["schedule"].size() == 5);

        REQUIRE(contains(result.stderr_output, "calculation_complete"));
    }

    SECTION("Extra payments with a monthly schedule") {
        auto result = run_command("--calculator loan --principal 200000 --rate 6 --years 30 "
                                  "--extra-type extra_monthly --extra-monthly 200 --schedule monthly "
                                  "--log-level ERROR");
        REQUIRE(result.exit_code == 0);

        auto j = nlohmann::json::parse(result.stdout_output);
        REQUIRE(j["extra_payments"]["actual_months"] == 252);
        REQUIRE(j["schedule"].size() == 252);
        REQUIRE(result.stderr_output.empty());
    }

    SECTION("CSV on stdout") {
        auto result = run_command("--calculator loan --principal 25000 --rate 7.5 --years 5 "
                                  "--format csv --schedule none");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output.rfind("Loan Calculator Export", 0) == 0);
        REQUIRE(contains(result.stdout_output, "Monthly Payment,$501"));
        REQUIRE_FALSE(contains(result.stdout_output, "Amortization Schedule"));
    }
}

TEST_CASE("CLI mortgage and investment calculations", "[cli]") {
    SECTION("Mortgage") {
        auto result = run_command("--calculator mortgage --home-price 450000 --down-payment 90000 "
                                  "--rate 6.5 --years 30 --property-tax 6000 --insurance 1200 --hoa 50");
        REQUIRE(result.exit_code == 0);

        auto j = nlohmann::json::parse(result.stdout_output);
        REQUIRE(j["result"]["total_monthly"].get<double>() == Approx(2925.44).margin(0.01));
    }

    SECTION("Investment CSV to a file") {
        const std::string path = "/tmp/finesse_cli_investment.csv";
        std::filesystem::remove(path);

        auto result = run_command("--calculator investment --initial 10000 --monthly 500 --rate 8 "
                                  "--years 20 --format csv --output " + path);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output.empty());

        std::string csv = read_file(path);
        REQUIRE(contains(csv, "Investment Calculator Export"));
        REQUIRE(contains(csv, "Future Value,\"$343,778\""));
        std::filesystem::remove(path);
    }
}

TEST_CASE("CLI request files", "[cli]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "finesse_cli_request";
    fs::create_directories(dir);
    const fs::path request = dir / "loan.json";

    {
        std::ofstream out(request);
        out << R"({
            "request_id": "cli-request-test",
            "calculator": "loan",
            "loan": {"principal": 50000, "rate": 6, "years": 3, "repayment": "bullet"},
            "output": {"format": "json", "path": "loan-out.json"}
        })";
    }

    SECTION("Output path relative to the request") {
        auto result = run_command("--request " + request.string());
        REQUIRE(result.exit_code == 0);

        auto j = nlohmann::json::parse(read_file((dir / "loan-out.json").string()));
        REQUIRE(j["result"]["final_payment"].get<double>() == Approx(59834.03).margin(0.01));
        REQUIRE(contains(result.stderr_output, "cli-request-test"));
    }

    SECTION("Flags override the request") {
        auto result = run_command("--request " + request.string() + " --years 1 --log-level WARN");
        REQUIRE(result.exit_code == 0);

        auto j = nlohmann::json::parse(read_file((dir / "loan-out.json").string()));
        REQUIRE(j["inputs"]["years"] == 1);
        REQUIRE(j["result"]["final_payment"].get<double>() == Approx(53083.89).margin(0.01));
    }

    fs::remove_all(dir);
}

TEST_CASE("CLI currency conversion failure is reported", "[cli]") {
    auto result = run_command("--calculator loan --principal 1000 --rate 5 --years 2 "
                              "--convert-to EUR --rates-url http://127.0.0.1:1");
    REQUIRE(result.exit_code == 1);
    REQUIRE(contains(result.stderr_output, "Error:"));
    REQUIRE(contains(result.stderr_output, "USD-EUR"));
    REQUIRE(result.stdout_output.empty());
}

TEST_CASE("CLI home price override updates percent amounts", "[cli]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "finesse_cli_mortgage";
    fs::create_directories(dir);
    const fs::path request = dir / "mortgage.json";

    {
        std::ofstream out(request);
        out << R"({
            "calculator": "mortgage",
            "mortgage": {
                "home_price": 450000,
                "rate": 6.5,
                "years": 30,
                "down_payment": {"value": 20, "mode": "percent"}
            },
            "output": {"format": "json", "path": "mortgage-out.json"}
        })";
    }

    auto result = run_command("--request " + request.string() + " --home-price 500000 --log-level ERROR");
    REQUIRE(result.exit_code == 0);

    auto j = nlohmann::json::parse(read_file((dir / "mortgage-out.json").string()));
    REQUIRE(j["inputs"]["home_price"].get<double>() == Approx(500000.0));
    REQUIRE(j["inputs"]["down_payment"].get<double>() == Approx(100000.0));
    REQUIRE(j["result"]["loan_amount"].get<double>() == Approx(400000.0));

    fs::remove_all(dir);
}
