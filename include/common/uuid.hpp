#pragma once

#include <optional>
#include <string>
#include <vector>

namespace uuid {

// Canonical 8-4-4-4-12 hex form, nil UUID rejected.
bool isValid(const std::string& value);

// Fresh random (version 4) UUID in lower-case canonical form.
std::string generate();

// One UUID per disk, in ordinal order. Caller-supplied lists must have
// exactly diskCount valid entries; otherwise fresh UUIDs are generated.
std::vector<std::string> resolveDiskUUIDs(size_t diskCount,
                                          const std::optional<std::vector<std::string>>& supplied);

} // namespace uuid
