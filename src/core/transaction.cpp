// File: src/core/transaction.cpp
#include "core/transaction.hpp"
#include <cmath>

namespace recur {

bool Transaction::IsWellFormed() const {
    return !id.empty() && std::isfinite(amount);
}

} // namespace recur
