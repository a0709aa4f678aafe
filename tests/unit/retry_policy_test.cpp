#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/model/error_record.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"

namespace {

using speechmaker::retry::RetryPolicy;

void TestDelayDoublesUntilCap() {
  RetryPolicy policy;
  const long  expected[] = {1000, 2000, 4000, 8000, 10000, 10000};
  for (std::uint32_t n = 0; n < 6; ++n) {
    assert(policy.Delay(n).count() == expected[n]);
  }
  assert(policy.Delay(40).count() == 10000);
}

void TestAttemptsAreCountedPerKey() {
  RetryPolicy policy;
  assert(policy.NextAttempt("a") == 1);
  assert(policy.NextAttempt("a") == 2);
  assert(policy.NextAttempt("b") == 1);
  assert(policy.Attempts("a") == 2);
  assert(policy.HasAttemptsLeft("a"));

  assert(policy.NextAttempt("a") == 3);
  assert(!policy.HasAttemptsLeft("a"));

  bool threw = false;
  try {
    (void)policy.NextAttempt("a");
  } catch (const speechmaker::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
  assert(policy.Attempts("a") == 3);

  policy.Reset("a");
  assert(policy.Attempts("a") == 0);
  assert(policy.Attempts("b") == 1);

  policy.ResetAll();
  assert(policy.Attempts("b") == 0);
}

void TestTryNextAttemptStopsAtLimit() {
  RetryPolicy policy(RetryPolicy::Options{1, 4, 2});
  assert(policy.TryNextAttempt("k") == 1u);
  assert(policy.TryNextAttempt("k") == 2u);
  assert(!policy.TryNextAttempt("k").has_value());
  assert(policy.Attempts("k") == 2);
}

void TestShouldRetryFollowsRecord() {
  RetryPolicy                     policy;
  speechmaker::model::ErrorRecord record;
  record.can_retry = true;
  assert(policy.ShouldRetry(record));
  record.can_retry = false;
  assert(!policy.ShouldRetry(record));
}

void TestWaitRecordsDelayAndHonoursCancel() {
  RetryPolicy policy(RetryPolicy::Options{5, 20, 3});

  speechmaker::util::CancellationToken token;
  assert(policy.WaitBeforeRetry("k", 1, token));
  assert(policy.LastDelayMs("k") == 10);

  token.Cancel();
  const auto start = std::chrono::steady_clock::now();
  RetryPolicy slow(RetryPolicy::Options{60000, 60000, 3});
  assert(!slow.WaitBeforeRetry("k", 0, token));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

void TestInvalidOptionsAreRejected() {
  bool threw = false;
  try {
    RetryPolicy policy(RetryPolicy::Options{1000, 10000, 0});
  } catch (const speechmaker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    RetryPolicy policy(RetryPolicy::Options{1000, 500, 3});
  } catch (const speechmaker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDelayDoublesUntilCap();
  TestAttemptsAreCountedPerKey();
  TestTryNextAttemptStopsAtLimit();
  TestShouldRetryFollowsRecord();
  TestWaitRecordsDelayAndHonoursCancel();
  TestInvalidOptionsAreRejected();

  std::cout << "speechmaker_unit_retry_policy: pass\n";
  return 0;
}
