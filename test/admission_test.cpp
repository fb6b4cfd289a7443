#include <thread>
#include <vector>
#include <stdexcept>
#include <coderun/admission.h>

#include "utils.h"

using namespace std::chrono_literals;

TEST(AdmissionGate, AcquireUpToCapacity) {
  AdmissionGate gate(2);
  auto a = gate.Acquire(50ms);
  auto b = gate.Acquire(50ms);
  ASSERT_TRUE(a && b);
  EXPECT_EQ(gate.Held(), 2);
  EXPECT_FALSE(gate.Acquire(50ms));
  a->Release();
  EXPECT_EQ(gate.Held(), 1);
  EXPECT_TRUE(gate.Acquire(50ms));
}

TEST(AdmissionGate, BusyAfterWaiting) {
  AdmissionGate gate(1);
  auto a = gate.Acquire(0ms);
  ASSERT_TRUE(a);
  auto start = Clock::now();
  EXPECT_FALSE(gate.Acquire(100ms));
  EXPECT_GE(Clock::now() - start, 100ms);
}

TEST(AdmissionGate, ReleaseIsIdempotent) {
  AdmissionGate gate(2);
  auto a = gate.Acquire(0ms);
  auto b = gate.Acquire(0ms);
  a->Release();
  a->Release();
  EXPECT_FALSE(a->Held());
  EXPECT_EQ(gate.Held(), 1);
  a.reset();
  EXPECT_EQ(gate.Held(), 1);
}

TEST(AdmissionGate, ReleasedOnException) {
  AdmissionGate gate(1);
  try {
    auto a = gate.Acquire(0ms);
    ASSERT_TRUE(a);
    throw std::runtime_error("failure");
  } catch (const std::runtime_error&) {}
  EXPECT_EQ(gate.Held(), 0);
  EXPECT_TRUE(gate.Acquire(0ms));
}

TEST(AdmissionGate, MoveTransfersOwnership) {
  AdmissionGate gate(1);
  auto a = gate.Acquire(0ms);
  Permit p = std::move(a.value());
  EXPECT_FALSE(a->Held());
  EXPECT_TRUE(p.Held());
  a.reset();
  EXPECT_EQ(gate.Held(), 1);
  {
    Permit q = std::move(p);
    EXPECT_EQ(gate.Held(), 1);
  }
  EXPECT_EQ(gate.Held(), 0);
}

TEST(AdmissionGate, WaiterWokenOnRelease) {
  AdmissionGate gate(1);
  auto a = gate.Acquire(0ms);
  std::thread th([&]() {
    std::this_thread::sleep_for(100ms);
    a->Release();
  });
  EXPECT_TRUE(gate.Acquire(5s));
  th.join();
}

TEST(AdmissionGate, ConcurrentHoldersBounded) {
  constexpr int kCapacity = 3;
  AdmissionGate gate(kCapacity);
  std::atomic_int current{0}, peak{0}, acquired{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; i++) {
    threads.emplace_back([&]() {
      for (int j = 0; j < 20; j++) {
        auto permit = gate.Acquire(10s);
        if (!permit) continue;
        ++acquired;
        int now = ++current;
        int prev = peak;
        while (prev < now && !peak.compare_exchange_weak(prev, now));
        std::this_thread::sleep_for(1ms);
        --current;
      }
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(acquired.load(), 16 * 20);
  EXPECT_LE(peak.load(), kCapacity);
  EXPECT_EQ(gate.Held(), 0);
}

TEST(AdmissionGate, ObservableThroughConstReference) {
  AdmissionGate gate(3);
  const AdmissionGate& view = gate;
  auto a = gate.Acquire(0ms);
  EXPECT_EQ(view.Held(), 1);
  EXPECT_EQ(view.Capacity(), 3);
}

TEST(AdmissionGate, InvalidCapacity) {
  EXPECT_THROW(AdmissionGate(0), std::invalid_argument);
  EXPECT_THROW(AdmissionGate(-1), std::invalid_argument);
}
