// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// Copyright 2005-2016 Brian Roark and Google, Inc.
// Classes choosing which recorded suffix a generator emits next. A selector
// is called with the number of suffixes of the current prefix and returns a
// position in [0, num_suffixes).

#ifndef MARKOV_MARKOV_SELECTOR_H_
#define MARKOV_MARKOV_SELECTOR_H_

#include <sys/types.h>
#include <time.h>
#include <unistd.h>
#include <random>

namespace markov {

// Picks every recorded suffix with equal probability, so a word observed k
// times after a prefix is k times as likely as a word observed once.
class UniformSuffixSelector {
 public:
  explicit UniformSuffixSelector(int seed = time(0) + getpid())
      : seed_(seed), rng_(static_cast<std::mt19937::result_type>(seed)) {}

  size_t operator()(size_t num_suffixes) {
    std::uniform_int_distribution<size_t> dist(0, num_suffixes - 1);
    return dist(rng_);
  }

  int Seed() const { return seed_; }

 private:
  int seed_;
  std::mt19937 rng_;
};

// Always picks the first suffix recorded for the prefix.
class FirstSuffixSelector {
 public:
  size_t operator()(size_t /* num_suffixes */) { return 0; }
};

}  // namespace markov

#endif  // MARKOV_MARKOV_SELECTOR_H_
