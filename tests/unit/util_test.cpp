#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using songqueue::util::NewId;
using songqueue::util::NowMillis;

void TestNewIdIsCanonicalV4() {
  std::set<std::string> seen;
  for (int i = 0; i < 256; ++i) {
    const auto id = NewId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    assert(seen.insert(id).second);
  }
}

void TestNowMillisNeverRepeats() {
  constexpr int kThreads   = 4;
  constexpr int kPerThread = 500;

  std::vector<std::vector<uint64_t>> stamps(kThreads);
  std::vector<std::thread>           workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) stamps[t].push_back(NowMillis());
    });
  }
  for (auto& w : workers) w.join();

  std::set<uint64_t> all;
  for (const auto& per_thread : stamps) {
    for (std::size_t i = 1; i < per_thread.size(); ++i) assert(per_thread[i] > per_thread[i - 1]);
    all.insert(per_thread.begin(), per_thread.end());
  }
  assert(all.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

} // namespace

int main() {
  TestNewIdIsCanonicalV4();
  TestNowMillisNeverRepeats();

  std::cout << "songqueue_unit_util: pass\n";
  return 0;
}
