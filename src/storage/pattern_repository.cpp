// File: src/storage/pattern_repository.cpp
#include "storage/pattern_repository.hpp"

namespace recur {

const char* ToString(CommitResult result) {
    switch (result) {
        case CommitResult::COMMITTED: return "COMMITTED";
        case CommitResult::NOT_FOUND: return "NOT_FOUND";
        case CommitResult::CONFLICT: return "CONFLICT";
        default: return "UNKNOWN";
    }
}

} // namespace recur
