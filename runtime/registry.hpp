#ifndef RUNTIME_REGISTRY_HPP
#define RUNTIME_REGISTRY_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "proto/runtime.pb.h"
#include "runtime/runtime_profile.hpp"

namespace runtime {

// Parses a language name such as "python" or "CPP". Returns
// INVALID_LANGUAGE for unknown names.
proto::Language ParseLanguage(const std::string& name);

class unsupported_language : public std::domain_error {
 public:
  explicit unsupported_language(const std::string& msg)
      : std::domain_error(msg) {}
};

// Read-only catalogue of the languages this process can run. It is built
// once at startup and never mutated afterwards, so it can be shared by all
// the threads without synchronization.
class RuntimeRegistry {
 public:
  // Global defaults applied to every built-in profile before the per-language
  // overrides.
  struct Defaults {
    int64_t output_bytes = 64 * 1024;
    int64_t scratch_bytes = 10 * 1024 * 1024;
  };

  // The built-in recipes, with unresolved program names.
  static std::vector<RuntimeProfile> BuiltinProfiles(const Defaults& defaults);

  // Builds the registry from the built-in recipes, applying overrides.
  // Languages whose toolchain is not installed are skipped.
  static RuntimeRegistry Create(const Defaults& defaults,
                                const proto::RuntimeCatalog& overrides);

  // Builds the registry from the command line flags. Throws if the file named
  // by --runtimes_config cannot be read or parsed.
  static RuntimeRegistry FromFlags();

  // Registers exactly the given profiles. Programs are used as given.
  explicit RuntimeRegistry(std::vector<RuntimeProfile> profiles);

  // Returns the profile of the given language, or throws
  // unsupported_language.
  const RuntimeProfile& Resolve(proto::Language language) const;

  bool Supports(proto::Language language) const {
    return profiles_.count(language) != 0;
  }

  // Starter program of the given language. Throws unsupported_language, or
  // std::invalid_argument if the language has no template with that name.
  const std::string& Template(proto::Language language,
                              const std::string& name = kDefaultTemplate) const;

  const std::map<std::string, std::string>& Templates(
      proto::Language language) const {
    return Resolve(language).templates;
  }

  // Templates of the given language, or of every supported language if
  // INVALID_LANGUAGE.
  proto::TemplateCatalog ListTemplates(
      proto::Language language = proto::INVALID_LANGUAGE) const;

  std::vector<proto::Language> Languages() const;

 private:
  std::map<proto::Language, RuntimeProfile> profiles_;
};

}  // namespace runtime

#endif
