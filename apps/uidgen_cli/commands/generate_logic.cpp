#include "generate_logic.h"

#include "uidgen/core/unique_id_json.h"

#include <nlohmann/json.hpp>

#include <ostream>

namespace uidgen::cli {

int execute_generate(const long long count, const OutputFormat format,
                     core::UuidGenerator& generator, std::ostream& out) {
  if (format == OutputFormat::kText) {
    for (long long i = 0; i < count; ++i) {
      out << generator.generate() << "\n";
    }
    return 0;
  }

  nlohmann::json ids = nlohmann::json::array();
  for (long long i = 0; i < count; ++i) {
    const core::UniqueId id = generator.generate();
    nlohmann::json entry = core::unique_id_to_json(id);
    entry["unique_id"] = id.to_string();
    ids.push_back(std::move(entry));
  }
  out << ids.dump(2) << "\n";
  return 0;
}

}  // namespace uidgen::cli
