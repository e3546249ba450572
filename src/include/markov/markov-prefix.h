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
// Sliding word window used as the lookup key of a Markov chain.

#ifndef MARKOV_MARKOV_PREFIX_H_
#define MARKOV_MARKOV_PREFIX_H_

#include <algorithm>
#include <string>
#include <vector>

#include <fst/arc.h>
#include <fst/symbol-table.h>

namespace markov {

// The 'order' most recent words, oldest first, held as symbol labels.
// Label 0 (epsilon) is the empty word that fills the window before any
// word has been seen; a new prefix holds only empty words.
class MarkovPrefix {
 public:
  typedef fst::StdArc::Label Label;

  explicit MarkovPrefix(size_t order) : labels_(order, 0) {}

  // Drops the oldest word and appends 'label'.
  void Shift(Label label) {
    if (labels_.empty()) return;
    std::copy(labels_.begin() + 1, labels_.end(), labels_.begin());
    labels_.back() = label;
  }

  size_t Order() const { return labels_.size(); }

  const std::vector<Label> &Labels() const { return labels_; }

  // Returns the words joined by single spaces, e.g. "the cat". Empty words
  // contribute nothing but still get a separator, so the initial prefix of
  // order 2 prints as " ".
  std::string ToString(const fst::SymbolTable &syms) const;

  bool operator==(const MarkovPrefix &other) const {
    return labels_ == other.labels_;
  }

  bool operator!=(const MarkovPrefix &other) const {
    return labels_ != other.labels_;
  }

 private:
  std::vector<Label> labels_;
};

}  // namespace markov

#endif  // MARKOV_MARKOV_PREFIX_H_
