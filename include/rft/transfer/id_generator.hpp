#pragma once

#include <functional>
#include <string>

namespace rft::transfer {

/// Source of unique tokens for remote hash-file and local archive names.
using IdGenerator = std::function<std::string()>;

/// Random (version 4) UUID string.
std::string random_uuid();

inline IdGenerator default_id_generator() {
    return [] { return random_uuid(); };
}

} // namespace rft::transfer
