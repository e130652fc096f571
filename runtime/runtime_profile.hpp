#ifndef RUNTIME_RUNTIME_PROFILE_HPP
#define RUNTIME_RUNTIME_PROFILE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/types/variant.h"
#include "proto/language.pb.h"

namespace runtime {

// Limits enforced on a single step (compilation or execution) of a job.
// A value of 0 means "no limit".
struct ResourceLimits {
  int64_t cpu_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_bytes = 0;
  int64_t output_bytes = 0;
  int64_t scratch_bytes = 0;
  int32_t max_processes = 0;
};

// Placeholders that may appear in command templates.
static const constexpr char* kSourcePlaceholder = "{source}";
static const constexpr char* kBinaryPlaceholder = "{binary}";

// Name of the template every language has.
static const constexpr char* kDefaultTemplate = "basic";

// The source file is run directly by an interpreter.
struct InterpretedRecipe {
  std::vector<std::string> command;
};

// The source file is compiled first; a failure of the compilation step
// short-circuits the execution.
struct CompiledRecipe {
  std::vector<std::string> compile_command;
  ResourceLimits compile_limits;
  std::vector<std::string> run_command;
};

using Recipe = absl::variant<InterpretedRecipe, CompiledRecipe>;

struct RuntimeProfile {
  proto::Language language = proto::INVALID_LANGUAGE;
  std::string name;
  std::string source_name;
  std::string binary_name;
  ResourceLimits limits;
  Recipe recipe;
  // Starter programs by name, each printing "Hello, World!". Always contains
  // kDefaultTemplate.
  std::map<std::string, std::string> templates;

  bool HasCompileStep() const {
    return absl::holds_alternative<CompiledRecipe>(recipe);
  }
  const std::vector<std::string>& RunCommand() const;
};

// Replaces {source} and {binary} in every argument of command.
std::vector<std::string> ExpandCommand(const std::vector<std::string>& command,
                                       const std::string& source,
                                       const std::string& binary);

}  // namespace runtime

#endif
