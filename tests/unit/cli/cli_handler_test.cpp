#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_cli/cli_handler.hpp"

namespace docqa_tests {

using namespace docqa_cli;
using ::testing::HasSubstr;
using ::testing::Not;

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "docqa_cli");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  CliHandler handler_{"http://127.0.0.1:3030"};
};

TEST_F(CliHandlerTest, NoArguments_ShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(handler_.execute_command(parse({})), 0);
}

TEST_F(CliHandlerTest, Ask_ParsesAllOptions) {
  CliOptions options =
      parse({"ask", "--query", "How do I deploy?", "-k", "5", "--threshold", "0.4", "-v"});

  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.query, "How do I deploy?");
  EXPECT_EQ(options.top_k, 5);
  EXPECT_FLOAT_EQ(options.threshold, 0.4f);
  EXPECT_TRUE(options.verbose);
}

TEST_F(CliHandlerTest, Ask_RequiresQuestion) {
  EXPECT_THROW(parse({"ask"}), CliError);
  EXPECT_THROW(parse({"ask", "--top-k", "3"}), CliError);
}

TEST_F(CliHandlerTest, Ask_RejectsBadValues) {
  EXPECT_THROW(parse({"ask", "-q", "x", "--top-k", "many"}), CliError);
  EXPECT_THROW(parse({"ask", "-q", "x", "--top-k", "0"}), CliError);
  EXPECT_THROW(parse({"ask", "-q", "x", "--threshold", "2"}), CliError);
  EXPECT_THROW(parse({"ask", "-q", "x", "--bogus", "1"}), CliError);
  EXPECT_THROW(parse({"ask", "-q"}), CliError);
}

TEST_F(CliHandlerTest, Rebuild_ParsesCorpus) {
  CliOptions options = parse({"rebuild", "--corpus", "/srv/docs"});

  EXPECT_EQ(options.command, Command::Rebuild);
  EXPECT_EQ(options.corpus_path, "/srv/docs");
}

TEST_F(CliHandlerTest, CommandAliases) {
  EXPECT_EQ(parse({"i"}).command, Command::Info);
  EXPECT_EQ(parse({"r"}).command, Command::Rebuild);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, UnknownCommandThrows) {
  EXPECT_THROW(parse({"search"}), CliError);
}

TEST_F(CliHandlerTest, QueryRequest_OmitsServerDefaults) {
  CliOptions options;
  options.query = "What is JWT?";

  nlohmann::json request = CliHandler::build_query_request(options);
  EXPECT_EQ(request, (nlohmann::json{{"question", "What is JWT?"}}));

  options.top_k = 2;
  options.threshold = 0.5f;
  request = CliHandler::build_query_request(options);
  EXPECT_EQ(request["top_k"], 2);
  EXPECT_FLOAT_EQ(request["threshold"].get<float>(), 0.5f);
}

TEST_F(CliHandlerTest, RebuildRequest) {
  CliOptions options;
  EXPECT_TRUE(CliHandler::build_rebuild_request(options).empty());

  options.corpus_path = "docs";
  EXPECT_EQ(CliHandler::build_rebuild_request(options)["corpus_path"], "docs");
}

TEST_F(CliHandlerTest, FormatAnswer_ListsSources) {
  nlohmann::json response = {{"answer", "OAuth2 with JWT tokens."},
                             {"refused", false},
                             {"reason", "none"},
                             {"sources", nlohmann::json::array({"authentication.md", "security/tokens.md"})},
                             {"retrieved", nlohmann::json::array()},
                             {"context", "[authentication.md]\nOAuth2"}};

  std::string text = CliHandler::format_answer(response, false);

  EXPECT_THAT(text, HasSubstr("OAuth2 with JWT tokens.\n"));
  EXPECT_THAT(text, HasSubstr("Sources:\n  - authentication.md\n  - security/tokens.md\n"));
  EXPECT_THAT(text, Not(HasSubstr("Context:")));
}

TEST_F(CliHandlerTest, FormatAnswer_ShowsRefusalReason) {
  nlohmann::json response = {{"answer", "Not found in the documentation."},
                             {"refused", true},
                             {"reason", "generation_failed"},
                             {"sources", nlohmann::json::array()},
                             {"error", "model not loaded"}};

  std::string text = CliHandler::format_answer(response, false);

  EXPECT_THAT(text, HasSubstr("Not found in the documentation."));
  EXPECT_THAT(text, HasSubstr("(refused: generation_failed, model not loaded)"));
  EXPECT_THAT(text, Not(HasSubstr("Sources:")));
}

TEST_F(CliHandlerTest, FormatAnswer_VerboseShowsRetrievalAndContext) {
  nlohmann::json chunk = {{"chunk_id", "deployment.md#00000"}, {"score", 0.8124}};
  nlohmann::json response = {{"answer", "Use Docker."},
                             {"refused", false},
                             {"sources", nlohmann::json::array({"deployment.md"})},
                             {"retrieved", nlohmann::json::array({chunk})},
                             {"context", "[deployment.md]\nDocker"}};

  std::string text = CliHandler::format_answer(response, true);

  EXPECT_THAT(text, HasSubstr("0.812  deployment.md#00000"));
  EXPECT_THAT(text, HasSubstr("Context:\n[deployment.md]\nDocker"));
}

TEST_F(CliHandlerTest, ApiBaseUrl) {
  EXPECT_EQ(handler_.get_api_base_url(), "http://127.0.0.1:3030");
  handler_.set_api_base_url("http://docs.internal:8080");
  EXPECT_EQ(handler_.get_api_base_url(), "http://docs.internal:8080");
}

}  // namespace docqa_tests
