#include "core/batch.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "gmock/gmock.h"
#include "google/protobuf/util/json_util.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

using namespace core;

// Runs a job by echoing its source.
class EchoExecutor : public executor::Executor {
 public:
  std::string Id() const override { return "ECHO"; }

  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const runtime::RuntimeProfile& /*profile*/,
                                 const std::atomic<bool>& /*cancelled*/)
      override {
    proto::ExecutionResult result;
    result.set_status(proto::SUCCESS);
    result.set_stdout(request.source_code());
    result.set_exit_code(0);
    return result;
  }
};

runtime::RuntimeProfile BashProfile() {
  runtime::RuntimeProfile profile;
  profile.language = proto::BASH;
  profile.name = "bash";
  profile.source_name = "main.sh";
  profile.recipe =
      runtime::InterpretedRecipe{{"bash", runtime::kSourcePlaceholder}};
  return profile;
}

class BatchTest : public ::testing::Test {
 protected:
  BatchTest()
      : registry_(std::vector<runtime::RuntimeProfile>{BashProfile()}),
        scheduler_(&registry_, &executor_, Scheduler::Options()) {}

  // Runs the batch and parses every output line.
  std::vector<proto::SubmitResponse> Run(const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    int64_t written = RunBatch(&scheduler_, &in, &out);
    std::vector<proto::SubmitResponse> responses;
    for (absl::string_view line :
         absl::StrSplit(out.str(), '\n', absl::SkipEmpty())) {
      proto::SubmitResponse response;
      EXPECT_TRUE(google::protobuf::util::JsonStringToMessage(
                      std::string(line), &response)
                      .ok())
          << line;
      responses.push_back(response);
    }
    EXPECT_EQ(written, static_cast<int64_t>(responses.size()));
    return responses;
  }

  runtime::RuntimeRegistry registry_;
  EchoExecutor executor_;
  Scheduler scheduler_;
};

TEST_F(BatchTest, ResponsesAreInOrder) {
  std::vector<proto::SubmitResponse> responses = Run(
      "{\"language\": \"BASH\", \"source_code\": \"a\", \"caller_id\": \"x\"}\n"
      "\n"
      "{\"language\": \"BASH\", \"source_code\": \"b\", \"caller_id\": \"y\"}\n");
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0].result().status(), proto::SUCCESS);
  EXPECT_EQ(responses[0].result().stdout(), "a");
  EXPECT_EQ(responses[1].result().stdout(), "b");
}

TEST_F(BatchTest, InvalidLineIsReported) {
  std::vector<proto::SubmitResponse> responses = Run(
      "{\"language\": \"BASH\", \"source_code\": \"a\"}\n"
      "not json\n"
      "{\"language\": \"JAVA\", \"source_code\": \"b\"}\n");
  ASSERT_EQ(responses.size(), 3u);
  EXPECT_EQ(responses[0].result().stdout(), "a");
  ASSERT_TRUE(responses[1].has_admission_error());
  EXPECT_EQ(responses[1].admission_error().code(), proto::INVALID_REQUEST);
  EXPECT_THAT(responses[1].admission_error().message(),
              HasSubstr("Invalid request on line 2"));
  ASSERT_TRUE(responses[2].has_admission_error());
  EXPECT_EQ(responses[2].admission_error().code(),
            proto::UNSUPPORTED_LANGUAGE);
}

TEST_F(BatchTest, ToJsonPrintsDefaults) {
  proto::SubmitResponse response;
  response.mutable_result()->set_status(proto::SUCCESS);
  std::string json = ToJson(response);
  EXPECT_THAT(json, HasSubstr("\"status\":\"SUCCESS\""));
  EXPECT_THAT(json, HasSubstr("\"wall_time_ms\""));
  EXPECT_EQ(json.find('\n'), std::string::npos);
}

}  // namespace
