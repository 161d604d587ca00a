#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ext2vm;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("ext2vm_cli_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& contents) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }

    int run(const std::vector<std::string>& args) {
        out_.str("");
        err_.str("");
        return cli::run("ext2vm", args, out_, err_);
    }

    std::filesystem::path dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CliTest, ListPrintsProcedureTable) {
    EXPECT_EQ(run({"--list"}), 0);
    const std::string listing = out_.str();
    EXPECT_NE(listing.find("ext2::add  inputs=4 outputs=2"), std::string::npos);
    EXPECT_NE(listing.find("ext2::sub  inputs=4 outputs=2"), std::string::npos);
    EXPECT_NE(listing.find("ext2::mul  inputs=4 outputs=2"), std::string::npos);
    EXPECT_NE(listing.find("ext2::mul_base  inputs=3 outputs=2"), std::string::npos);
}

TEST_F(CliTest, RunsSingleStack) {
    auto input = write_file("mul.inputs", R"({"stack_init": ["5", "3", "2", "7", "11"]})");
    auto output = (dir_ / "mul.outputs").string();

    EXPECT_EQ(run({"ext2::mul", "--input", input, "--output", output}), 0);
    EXPECT_NE(out_.str().find("Output stack: [41, 1, 11]"), std::string::npos);

    std::ifstream in(output);
    auto json = nlohmann::json::parse(in);
    EXPECT_EQ(json["stack"], nlohmann::json({"41", "1", "11"}));
}

TEST_F(CliTest, BatchInputRunsEveryStack) {
    auto input = write_file("add.inputs", R"({"stacks": [["5", "3", "2", "7"], ["1", "1", "1", "1", "8"]]})");
    auto output = (dir_ / "add.outputs").string();

    EXPECT_EQ(run({"add", "--input", input, "--output", output}), 0);
    EXPECT_NE(out_.str().find("Processed 2 stacks with ext2::add"), std::string::npos);

    std::ifstream in(output);
    auto json = nlohmann::json::parse(in);
    ASSERT_EQ(json["stacks"].size(), 2u);
    EXPECT_EQ(json["stacks"][0], nlohmann::json({"7", "10"}));
    EXPECT_EQ(json["stacks"][1], nlohmann::json({"2", "2", "8"}));
}

TEST_F(CliTest, MissingDefaultInputsFails) {
    auto previous = std::filesystem::current_path();
    std::filesystem::current_path(dir_);
    int status = run({"mul"});
    std::filesystem::current_path(previous);

    EXPECT_EQ(status, 1);
    EXPECT_NE(err_.str().find("`mul.inputs` not found"), std::string::npos);
}

TEST_F(CliTest, UnknownProcedureReportsError) {
    auto input = write_file("div.inputs", R"({"stack_init": ["1", "2", "3", "4"]})");
    EXPECT_EQ(run({"div", "--input", input}), 1);
    EXPECT_EQ(err_.str().rfind("Error: Unknown procedure: div", 0), 0u);
}

TEST_F(CliTest, CrossTermOnlyForMul) {
    auto input = write_file("ops.inputs", R"({"stack_init": ["5", "3", "2", "7"]})");

    EXPECT_EQ(run({"add", "--input", input, "--cross-term", "legacy"}), 1);
    EXPECT_NE(err_.str().find("--cross-term applies only to ext2::mul"), std::string::npos);

    EXPECT_EQ(run({"mul", "--input", input, "--cross-term", "legacy"}), 0);
    EXPECT_NE(out_.str().find("Output stack: [51, 1]"), std::string::npos);

    EXPECT_EQ(run({"mul", "--input", input, "--cross-term", "fast"}), 1);
    EXPECT_NE(err_.str().find("Error: Unknown cross term 'fast'"), std::string::npos);
}

TEST_F(CliTest, UnderflowReportsError) {
    auto input = write_file("short.inputs", R"({"stack_init": ["4", "5"]})");
    EXPECT_EQ(run({"mul_base", "--input", input}), 1);
    EXPECT_NE(err_.str().find("Error: OpStack underflow: required 3, have 2"), std::string::npos);
}

TEST_F(CliTest, ArgumentErrors) {
    EXPECT_EQ(run({}), 1);
    EXPECT_NE(err_.str().find("Usage: ext2vm PROCEDURE"), std::string::npos);

    EXPECT_EQ(run({"mul", "--verbose"}), 1);
    EXPECT_NE(err_.str().find("Error: Unknown option: --verbose"), std::string::npos);

    EXPECT_EQ(run({"mul", "--input"}), 1);
    EXPECT_NE(err_.str().find("--input requires FILE argument"), std::string::npos);

    EXPECT_EQ(run({"mul", "add"}), 1);
    EXPECT_NE(err_.str().find("Unexpected argument: add"), std::string::npos);

    EXPECT_EQ(run({"--help"}), 0);
}
