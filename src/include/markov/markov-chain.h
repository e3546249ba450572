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
// Markov chain of word prefixes and their observed suffixes.

#ifndef MARKOV_MARKOV_CHAIN_H_
#define MARKOV_MARKOV_CHAIN_H_

#include <map>
#include <string>
#include <vector>

#include <fst/fst.h>
#include <fst/symbol-table.h>
#include <fst/vector-fst.h>
#include <markov/markov-prefix.h>
#include <markov/util.h>

namespace markov {

using fst::ArcIterator;
using fst::kNoLabel;
using fst::kNoStateId;
using fst::StdArc;
using fst::StdVectorFst;
using fst::SymbolTable;

// The chain is kept as an automaton in the manner of an n-gram model: each
// state is a prefix and each arc leaving it is one observation of a suffix,
// labelled with the suffix word and leading to the shifted prefix. Repeated
// observations are repeated arcs, so the arcs of a state are the suffix
// collection in the order the words were seen. States created only as arc
// destinations have no arcs and are not prefixes of the chain.
class MarkovChain {
 public:
  typedef StdArc Arc;
  typedef Arc::StateId StateId;
  typedef Arc::Label Label;
  typedef Arc::Weight Weight;

  // Constructs an empty chain whose prefixes hold 'order' words.
  explicit MarkovChain(int order);

  int Order() const { return order_; }

  // A prefix of this chain's order holding only empty words.
  MarkovPrefix InitialPrefix() const {
    return MarkovPrefix(order_ > 0 ? order_ : 0);
  }

  // Appends 'word' to the suffixes of 'prefix'. Returns the label of
  // 'word', or kNoLabel on error.
  Label AddSuffix(const MarkovPrefix &prefix, const std::string &word);

  // Returns the state of 'prefix', or kNoStateId if it was never seen.
  StateId FindState(const MarkovPrefix &prefix) const {
    auto iter = states_.find(prefix.Labels());
    return iter == states_.end() ? kNoStateId : iter->second;
  }

  size_t NumSuffixes(StateId s) const { return fst_.NumArcs(s); }

  // Label of the suffix recorded at position 'pos' of state 's'.
  Label Suffix(StateId s, size_t pos) const {
    ArcIterator<StdVectorFst> aiter(fst_, s);
    aiter.Seek(pos);
    return aiter.Value().ilabel;
  }

  // Suffix words of 'prefix' in the order they were observed; empty if the
  // prefix was never seen.
  std::vector<std::string> Suffixes(const MarkovPrefix &prefix) const;

  // Keys of all prefixes with at least one suffix, in no particular order.
  std::vector<std::string> Prefixes() const;

  size_t NumPrefixes() const;

  // Number of suffix observations, i.e. words read while building.
  size_t NumTokens() const { return num_tokens_; }

  const SymbolTable &Symbols() const { return syms_; }

  const StdVectorFst &GetFst() const { return fst_; }

  bool Error() const { return error_; }

  void SetError() { error_ = true; }

 private:
  StateId FindOrAddState(const MarkovPrefix &prefix);

  int order_;
  StdVectorFst fst_;
  SymbolTable syms_;
  std::map<std::vector<Label>, StateId> states_;
  std::vector<MarkovPrefix> prefixes_;  // indexed by state
  size_t num_tokens_;
  bool error_;

  MarkovChain(const MarkovChain &) = delete;
  MarkovChain &operator=(const MarkovChain &) = delete;
};

}  // namespace markov

#endif  // MARKOV_MARKOV_CHAIN_H_
