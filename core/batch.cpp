#include "core/batch.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/types/variant.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"

namespace core {

namespace {

proto::SubmitResponse AdmissionError(proto::AdmissionErrorCode code,
                                     const std::string& message) {
  proto::SubmitResponse response;
  response.mutable_admission_error()->set_code(code);
  response.mutable_admission_error()->set_message(message);
  return response;
}

}  // namespace

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << "Cannot serialize response: " << status.ToString();
  return json;
}

int64_t RunBatch(Scheduler* scheduler, std::istream* in, std::ostream* out) {
  // Either an admitted job, or the response to print in its place.
  using Pending =
      absl::variant<std::shared_ptr<Job>, proto::SubmitResponse>;
  std::vector<Pending> pending;
  std::string line;
  int64_t line_number = 0;
  while (std::getline(*in, line)) {
    line_number++;
    if (line.empty()) continue;
    proto::ExecutionRequest request;
    auto status = google::protobuf::util::JsonStringToMessage(line, &request);
    if (!status.ok()) {
      std::string message = absl::StrCat("Invalid request on line ",
                                         line_number, ": ", status.ToString());
      LOG(ERROR) << message;
      pending.emplace_back(AdmissionError(proto::INVALID_REQUEST, message));
      continue;
    }
    try {
      pending.emplace_back(scheduler->Submit(std::move(request)));
    } catch (const admission_error& exc) {
      pending.emplace_back(AdmissionError(exc.code(), exc.what()));
    }
  }
  for (const Pending& item : pending) {
    if (auto* job = absl::get_if<std::shared_ptr<Job>>(&item)) {
      proto::SubmitResponse response;
      *response.mutable_result() = (*job)->Wait();
      *out << ToJson(response) << std::endl;
    } else {
      *out << ToJson(absl::get<proto::SubmitResponse>(item)) << std::endl;
    }
  }
  return static_cast<int64_t>(pending.size());
}

}  // namespace core
