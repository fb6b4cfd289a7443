#include <coderun/admission.h>

#include <stdexcept>

#include <spdlog/spdlog.h>

Permit& Permit::operator=(Permit&& x) noexcept {
  if (this != &x) {
    Release();
    gate_ = x.gate_;
    x.gate_ = nullptr;
  }
  return *this;
}

void Permit::Release() {
  if (!gate_) return;
  gate_->Release_();
  gate_ = nullptr;
}

AdmissionGate::AdmissionGate(int capacity) : capacity_(capacity), held_(0) {
  if (capacity_ <= 0) throw std::invalid_argument("AdmissionGate capacity must be positive");
}

std::optional<Permit> AdmissionGate::Acquire(Deadline deadline) {
  std::unique_lock lck(mtx_);
  if (!cv_.wait_until(lck, deadline, [&]() { return held_ < capacity_; })) {
    spdlog::info("No sandbox permit available: held={} capacity={}", held_, capacity_);
    return std::nullopt;
  }
  held_++;
  spdlog::debug("Permit acquired: held={}", held_);
  return Permit(this);
}

void AdmissionGate::Release_() {
  {
    std::lock_guard lck(mtx_);
    held_--;
    spdlog::debug("Permit released: held={}", held_);
  }
  cv_.notify_one();
}

int AdmissionGate::Held() const {
  std::lock_guard lck(mtx_);
  return held_;
}
