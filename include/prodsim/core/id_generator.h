#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace prodsim::core {

// Abstract ID generator interface for run ids and audit event ids.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty, starts with prefix, and sorts after
  // every ID previously returned by the same generator for that prefix.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production generator: "<prefix>-<unix micros>-<counter>", both parts zero-padded
// so that lexicographic order of run ids is creation order across restarts.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// Deterministic generator: "<prefix>-000001", "<prefix>-000002", ...
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace prodsim::core
