#include "dcm/core/id_generator.h"

#include <chrono>

namespace dcm::core {

namespace {

std::string scoped_id(std::string_view prefix, const std::string& scope,
                      const std::string& tail) {
  std::string id(prefix);
  id += '-';
  if (!scope.empty()) {
    id += scope;
    id += '-';
  }
  id += tail;
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return scoped_id(prefix, scope_, std::to_string(micros) + "-" + std::to_string(c));
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return scoped_id(prefix, scope_, std::to_string(c));
}

}  // namespace dcm::core
