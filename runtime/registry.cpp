#include "runtime/registry.hpp"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace runtime {

namespace {

const constexpr int64_t kMiB = 1024 * 1024;

ResourceLimits RunLimits(const RuntimeRegistry::Defaults& defaults,
                         int64_t memory_bytes) {
  ResourceLimits limits;
  limits.cpu_time_millis = 5000;
  limits.wall_time_millis = 10000;
  limits.memory_bytes = memory_bytes;
  limits.output_bytes = defaults.output_bytes;
  limits.scratch_bytes = defaults.scratch_bytes;
  limits.max_processes = 128;
  return limits;
}

ResourceLimits CompileLimits(const RuntimeRegistry::Defaults& defaults) {
  ResourceLimits limits;
  limits.cpu_time_millis = 8000;
  limits.wall_time_millis = 8000;
  limits.memory_bytes = 1024 * kMiB;
  // Diagnostics are returned as stderr, so they obey the same ceiling.
  limits.output_bytes = defaults.output_bytes;
  limits.scratch_bytes = defaults.scratch_bytes;
  limits.max_processes = 128;
  return limits;
}

// Resolves the program of command on PATH. Returns false if it is missing.
bool ResolveProgram(std::vector<std::string>* command) {
  if (command->empty()) return false;
  std::string& program = command->front();
  if (program.compare(0, 2, "./") == 0) return true;
  std::string resolved = util::which(program);
  if (resolved.empty()) return false;
  program = resolved;
  return true;
}

bool ResolvePrograms(RuntimeProfile* profile) {
  if (profile->HasCompileStep()) {
    auto& recipe = absl::get<CompiledRecipe>(profile->recipe);
    return ResolveProgram(&recipe.compile_command) &&
           ResolveProgram(&recipe.run_command);
  }
  return ResolveProgram(&absl::get<InterpretedRecipe>(profile->recipe).command);
}

void ApplyOverride(const proto::LanguageOverride& o, RuntimeProfile* profile) {
  ResourceLimits& limits = profile->limits;
  if (o.has_cpu_time_limit_ms()) limits.cpu_time_millis = o.cpu_time_limit_ms();
  if (o.has_wall_clock_timeout_ms())
    limits.wall_time_millis = o.wall_clock_timeout_ms();
  if (o.has_memory_limit_bytes()) limits.memory_bytes = o.memory_limit_bytes();
  if (o.has_output_byte_limit()) limits.output_bytes = o.output_byte_limit();
  if (o.has_scratch_disk_limit_bytes())
    limits.scratch_bytes = o.scratch_disk_limit_bytes();
  if (profile->HasCompileStep()) {
    auto& compile = absl::get<CompiledRecipe>(profile->recipe).compile_limits;
    if (o.has_compile_timeout_ms()) {
      compile.cpu_time_millis = o.compile_timeout_ms();
      compile.wall_time_millis = o.compile_timeout_ms();
    }
    if (o.has_output_byte_limit()) compile.output_bytes = o.output_byte_limit();
    if (o.has_scratch_disk_limit_bytes())
      compile.scratch_bytes = o.scratch_disk_limit_bytes();
  }
}

}  // namespace

proto::Language ParseLanguage(const std::string& name) {
  proto::Language language = proto::INVALID_LANGUAGE;
  if (!proto::Language_Parse(absl::AsciiStrToUpper(name), &language)) {
    return proto::INVALID_LANGUAGE;
  }
  return language;
}

const std::vector<std::string>& RuntimeProfile::RunCommand() const {
  if (HasCompileStep()) return absl::get<CompiledRecipe>(recipe).run_command;
  return absl::get<InterpretedRecipe>(recipe).command;
}

std::vector<std::string> ExpandCommand(const std::vector<std::string>& command,
                                       const std::string& source,
                                       const std::string& binary) {
  std::vector<std::string> expanded;
  expanded.reserve(command.size());
  for (const std::string& arg : command) {
    expanded.push_back(absl::StrReplaceAll(
        arg, {{kSourcePlaceholder, source}, {kBinaryPlaceholder, binary}}));
  }
  return expanded;
}

// static
std::vector<RuntimeProfile> RuntimeRegistry::BuiltinProfiles(
    const Defaults& defaults) {
  std::vector<RuntimeProfile> profiles;

  RuntimeProfile c;
  c.language = proto::C;
  c.name = "c";
  c.source_name = "main.c";
  c.binary_name = "main";
  c.limits = RunLimits(defaults, 256 * kMiB);
  c.recipe = CompiledRecipe{{"cc", "-O2", "-std=c11", "-Wall", "-o", "{binary}",
                             "{source}", "-lm"},
                            CompileLimits(defaults),
                            {"./{binary}"}};
  c.templates = {
      {"basic",
       "#include <stdio.h>\n\nint main(void) {\n"
       "  printf(\"Hello, World!\\n\");\n  return 0;\n}\n"},
      {"function",
       "#include <stdio.h>\n\nvoid greet(const char* name) {\n"
       "  printf(\"Hello, %s!\\n\", name);\n}\n\n"
       "int main(void) {\n  greet(\"World\");\n  return 0;\n}\n"},
  };
  profiles.push_back(std::move(c));

  RuntimeProfile cpp;
  cpp.language = proto::CPP;
  cpp.name = "cpp";
  cpp.source_name = "main.cpp";
  cpp.binary_name = "main";
  cpp.limits = RunLimits(defaults, 256 * kMiB);
  cpp.recipe = CompiledRecipe{{"c++", "-O2", "-std=c++17", "-Wall", "-o",
                               "{binary}", "{source}"},
                              CompileLimits(defaults),
                              {"./{binary}"}};
  cpp.templates = {
      {"basic",
       "#include <iostream>\n\nint main() {\n"
       "  std::cout << \"Hello, World!\" << std::endl;\n  return 0;\n}\n"},
      {"function",
       "#include <iostream>\n#include <string>\n\n"
       "std::string Greet(const std::string& name) {\n"
       "  return \"Hello, \" + name + \"!\";\n}\n\n"
       "int main() {\n  std::cout << Greet(\"World\") << std::endl;\n"
       "  return 0;\n}\n"},
      {"class",
       "#include <iostream>\n#include <string>\n\n"
       "class Greeter {\n public:\n"
       "  explicit Greeter(const std::string& name) : name_(name) {}\n"
       "  void Greet() const { std::cout << \"Hello, \" << name_ << \"!\" "
       "<< std::endl; }\n\n private:\n  std::string name_;\n};\n\n"
       "int main() {\n  Greeter(\"World\").Greet();\n  return 0;\n}\n"},
  };
  profiles.push_back(std::move(cpp));

  RuntimeProfile python;
  python.language = proto::PYTHON;
  python.name = "python";
  python.source_name = "main.py";
  python.limits = RunLimits(defaults, 256 * kMiB);
  python.recipe = InterpretedRecipe{{"python3", "-S", "-B", "{source}"}};
  python.templates = {
      {"basic", "print(\"Hello, World!\")\n"},
      {"function",
       "def greet(name):\n    return f\"Hello, {name}!\"\n\n\n"
       "print(greet(\"World\"))\n"},
      {"class",
       "class Greeter:\n    def __init__(self, name):\n"
       "        self.name = name\n\n    def greet(self):\n"
       "        print(f\"Hello, {self.name}!\")\n\n\n"
       "Greeter(\"World\").greet()\n"},
  };
  profiles.push_back(std::move(python));

  RuntimeProfile javascript;
  javascript.language = proto::JAVASCRIPT;
  javascript.name = "javascript";
  javascript.source_name = "main.js";
  javascript.limits = RunLimits(defaults, 256 * kMiB);
  javascript.recipe = InterpretedRecipe{{"node", "{source}"}};
  javascript.templates = {
      {"basic", "console.log(\"Hello, World!\");\n"},
      {"function",
       "function greet(name) {\n  return `Hello, ${name}!`;\n}\n\n"
       "console.log(greet(\"World\"));\n"},
      {"async",
       "async function fetchGreeting(name) {\n"
       "  return new Promise((resolve) =>\n"
       "    setTimeout(() => resolve(`Hello, ${name}!`), 10));\n}\n\n"
       "fetchGreeting(\"World\").then((greeting) => console.log(greeting));\n"},
  };
  profiles.push_back(std::move(javascript));

  RuntimeProfile bash;
  bash.language = proto::BASH;
  bash.name = "bash";
  bash.source_name = "main.sh";
  bash.limits = RunLimits(defaults, 256 * kMiB);
  bash.recipe = InterpretedRecipe{{"bash", "{source}"}};
  bash.templates = {
      {"basic", "echo \"Hello, World!\"\n"},
      {"function",
       "greet() {\n  echo \"Hello, $1!\"\n}\n\ngreet \"World\"\n"},
  };
  profiles.push_back(std::move(bash));

  RuntimeProfile java;
  java.language = proto::JAVA;
  java.name = "java";
  java.source_name = "Main.java";
  java.binary_name = "Main";
  java.limits = RunLimits(defaults, 512 * kMiB);
  java.recipe =
      CompiledRecipe{{"javac", "-J-Xss8m", "-encoding", "UTF-8", "-d", ".",
                      "{source}"},
                     CompileLimits(defaults),
                     {"java", "-Xss8m", "-XX:+UseSerialGC", "-cp", ".",
                      "{binary}"}};
  java.templates = {
      {"basic",
       "public class Main {\n"
       "    public static void main(String[] args) {\n"
       "        System.out.println(\"Hello, World!\");\n    }\n}\n"},
      {"method",
       "public class Main {\n"
       "    static String greet(String name) {\n"
       "        return \"Hello, \" + name + \"!\";\n    }\n\n"
       "    public static void main(String[] args) {\n"
       "        System.out.println(greet(\"World\"));\n    }\n}\n"},
  };
  profiles.push_back(std::move(java));

  return profiles;
}

// static
RuntimeRegistry RuntimeRegistry::Create(
    const Defaults& defaults, const proto::RuntimeCatalog& overrides) {
  std::map<proto::Language, proto::LanguageOverride> by_language;
  for (const proto::LanguageOverride& o : overrides.language()) {
    if (o.language() == proto::INVALID_LANGUAGE) {
      throw std::invalid_argument("Runtime override without a language");
    }
    by_language[o.language()] = o;
  }

  std::vector<RuntimeProfile> available;
  for (RuntimeProfile& profile : BuiltinProfiles(defaults)) {
    auto o = by_language.find(profile.language);
    if (o != by_language.end()) {
      if (o->second.disabled()) {
        LOG(INFO) << "Language " << profile.name << " disabled by config";
        continue;
      }
      ApplyOverride(o->second, &profile);
    }
    if (!ResolvePrograms(&profile)) {
      LOG(WARNING) << "Toolchain for " << profile.name
                   << " not found, language disabled";
      continue;
    }
    available.push_back(std::move(profile));
  }
  return RuntimeRegistry(std::move(available));
}

// static
RuntimeRegistry RuntimeRegistry::FromFlags() {
  Defaults defaults;
  defaults.output_bytes = FLAGS_output_byte_limit;
  defaults.scratch_bytes = FLAGS_scratch_disk_limit_bytes;
  proto::RuntimeCatalog overrides;
  if (!FLAGS_runtimes_config.empty()) {
    std::string text = util::File::Read(FLAGS_runtimes_config);
    if (!google::protobuf::TextFormat::ParseFromString(text, &overrides)) {
      throw std::invalid_argument("Invalid runtimes config " +
                                  FLAGS_runtimes_config);
    }
  }
  return Create(defaults, overrides);
}

RuntimeRegistry::RuntimeRegistry(std::vector<RuntimeProfile> profiles) {
  for (RuntimeProfile& profile : profiles) {
    CHECK_NE(profile.language, proto::INVALID_LANGUAGE)
        << "Profile " << profile.name << " without a language";
    proto::Language language = profile.language;
    profiles_[language] = std::move(profile);
  }
}

const RuntimeProfile& RuntimeRegistry::Resolve(proto::Language language) const {
  auto it = profiles_.find(language);
  if (it == profiles_.end()) {
    throw unsupported_language("Unsupported language: " +
                               proto::Language_Name(language));
  }
  return it->second;
}

const std::string& RuntimeRegistry::Template(proto::Language language,
                                             const std::string& name) const {
  const RuntimeProfile& profile = Resolve(language);
  auto it = profile.templates.find(name);
  if (it == profile.templates.end()) {
    throw std::invalid_argument("No template " + name + " for " +
                                profile.name);
  }
  return it->second;
}

proto::TemplateCatalog RuntimeRegistry::ListTemplates(
    proto::Language language) const {
  proto::TemplateCatalog catalog;
  for (const auto& kv : profiles_) {
    if (language != proto::INVALID_LANGUAGE && kv.first != language) continue;
    proto::TemplateSet& set = (*catalog.mutable_languages())[kv.second.name];
    for (const auto& t : kv.second.templates)
      (*set.mutable_templates())[t.first] = t.second;
  }
  if (language != proto::INVALID_LANGUAGE && catalog.languages().empty()) {
    throw unsupported_language("Unsupported language: " +
                               proto::Language_Name(language));
  }
  return catalog;
}

std::vector<proto::Language> RuntimeRegistry::Languages() const {
  std::vector<proto::Language> languages;
  for (const auto& kv : profiles_) languages.push_back(kv.first);
  return languages;
}

}  // namespace runtime
