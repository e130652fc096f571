#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "core/batch.hpp"
#include "core/scheduler.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "runtime/registry.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(language, "", "Language of the program to run");
DEFINE_string(source, "", "File with the source code to run");
DEFINE_string(stdin, "", "File to use as the standard input of the program");
DEFINE_string(caller, "cli", "Identifier of the caller, for quota accounting");
DEFINE_bool(batch, false,
            "Read one JSON ExecutionRequest per line from the standard input "
            "and print one JSON SubmitResponse per line, in the same order");
DEFINE_bool(list_languages, false, "Print the supported languages and exit");
DEFINE_string(template, "",
              "Print a starter program and exit: <language>[:<name>], where "
              "the name defaults to basic");
DEFINE_bool(list_templates, false,
            "Print the starter programs as JSON, of --language if given, and "
            "exit");

namespace {

int RunSingle(core::Scheduler* scheduler) {
  if (FLAGS_source.empty()) {
    std::cerr << "--source is required" << std::endl;
    return 1;
  }
  proto::ExecutionRequest request;
  request.set_language(runtime::ParseLanguage(FLAGS_language));
  request.set_source_code(util::File::Read(FLAGS_source));
  if (!FLAGS_stdin.empty()) request.set_stdin(util::File::Read(FLAGS_stdin));
  request.set_caller_id(FLAGS_caller);
  std::cout << core::ToJson(scheduler->Run(std::move(request))) << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs untrusted programs in a sandbox.\n"
      "  runbox --language=python --source=main.py [--stdin=input.txt]\n"
      "  runbox --batch < requests.jsonl\n"
      "  runbox --template=python:class\n"
      "  runbox --list_templates [--language=java]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  try {
    runtime::RuntimeRegistry registry = runtime::RuntimeRegistry::FromFlags();

    if (FLAGS_list_languages) {
      for (proto::Language language : registry.Languages())
        std::cout << registry.Resolve(language).name << std::endl;
      return 0;
    }
    if (!FLAGS_template.empty()) {
      std::vector<std::string> parts =
          absl::StrSplit(FLAGS_template, absl::MaxSplits(':', 1));
      proto::Language language = runtime::ParseLanguage(parts[0]);
      if (!registry.Supports(language)) {
        std::cerr << "Unsupported language: " << parts[0] << std::endl;
        return 1;
      }
      std::cout << (parts.size() == 2 ? registry.Template(language, parts[1])
                                      : registry.Template(language));
      return 0;
    }
    if (FLAGS_list_templates) {
      proto::Language language = proto::INVALID_LANGUAGE;
      if (!FLAGS_language.empty()) {
        language = runtime::ParseLanguage(FLAGS_language);
        if (!registry.Supports(language)) {
          std::cerr << "Unsupported language: " << FLAGS_language << std::endl;
          return 1;
        }
      }
      std::cout << core::ToJson(registry.ListTemplates(language)) << std::endl;
      return 0;
    }

    executor::LocalExecutor executor(executor::LocalExecutor::OptionsFromFlags());
    core::Scheduler scheduler(&registry, &executor,
                              core::Scheduler::OptionsFromFlags());
    int ret = 0;
    if (FLAGS_batch) {
      core::RunBatch(&scheduler, &std::cin, &std::cout);
    } else {
      ret = RunSingle(&scheduler);
    }
    scheduler.Stop();
    return ret;
  } catch (const std::exception& exc) {
    LOG(ERROR) << exc.what();
    return 1;
  }
}
