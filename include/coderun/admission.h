#ifndef INCLUDE_CODERUN_ADMISSION_H_
#define INCLUDE_CODERUN_ADMISSION_H_

#include <chrono>
#include <mutex>
#include <optional>
#include <condition_variable>

#include "execution.h"

class AdmissionGate;

// One unit of sandbox capacity. Released exactly once: by Release() or on destruction.
class Permit {
  AdmissionGate* gate_;

  explicit Permit(AdmissionGate* gate) : gate_(gate) {}
  friend class AdmissionGate;
 public:
  Permit(Permit&& x) noexcept : gate_(x.gate_) { x.gate_ = nullptr; }
  Permit& operator=(Permit&& x) noexcept;
  Permit(const Permit&) = delete;
  Permit& operator=(const Permit&) = delete;
  ~Permit() { Release(); }

  // no-op if already released
  void Release();
  bool Held() const { return gate_ != nullptr; }
};

// Bounded pool of permits limiting simultaneous sandbox executions.
class AdmissionGate {
  const int capacity_;
  int held_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;

  void Release_();
  friend class Permit;
 public:
  explicit AdmissionGate(int capacity);
  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  // empty if no permit became available before the deadline
  std::optional<Permit> Acquire(Deadline);
  std::optional<Permit> Acquire(std::chrono::milliseconds max_wait) {
    return Acquire(Clock::now() + max_wait);
  }

  int Capacity() const { return capacity_; }
  int Held() const;
};

#endif  // INCLUDE_CODERUN_ADMISSION_H_
