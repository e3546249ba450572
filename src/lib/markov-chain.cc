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
#include <markov/markov-chain.h>

namespace markov {

MarkovChain::MarkovChain(int order)
    : order_(order), syms_("MarkovSymbols"), num_tokens_(0), error_(false) {
  syms_.AddSymbol("");  // make the empty word epsilon 0
  if (order < 1) {
    MARKOVERROR() << "MarkovChain: order must be greater than 0: " << order;
    SetError();
    return;
  }
  fst_.SetStart(FindOrAddState(InitialPrefix()));
}

MarkovChain::Label MarkovChain::AddSuffix(const MarkovPrefix &prefix,
                                          const std::string &word) {
  if (Error()) return kNoLabel;
  if (prefix.Order() != static_cast<size_t>(order_)) {
    MARKOVERROR() << "MarkovChain::AddSuffix: prefix order " << prefix.Order()
                  << " does not match chain order " << order_;
    SetError();
    return kNoLabel;
  }
  if (word.empty()) {
    MARKOVERROR() << "MarkovChain::AddSuffix: empty word";
    SetError();
    return kNoLabel;
  }
  Label label = syms_.AddSymbol(word);
  StateId s = FindOrAddState(prefix);
  MarkovPrefix next(prefix);
  next.Shift(label);
  StateId nextstate = FindOrAddState(next);
  fst_.AddArc(s, Arc(label, label, Weight::One(), nextstate));
  ++num_tokens_;
  return label;
}

std::vector<std::string> MarkovChain::Suffixes(
    const MarkovPrefix &prefix) const {
  std::vector<std::string> words;
  StateId s = FindState(prefix);
  if (s == kNoStateId) return words;
  words.reserve(fst_.NumArcs(s));
  for (ArcIterator<StdVectorFst> aiter(fst_, s); !aiter.Done(); aiter.Next())
    words.push_back(syms_.Find(aiter.Value().ilabel));
  return words;
}

std::vector<std::string> MarkovChain::Prefixes() const {
  std::vector<std::string> keys;
  for (StateId s = 0; s < fst_.NumStates(); ++s) {
    if (fst_.NumArcs(s) > 0) keys.push_back(prefixes_[s].ToString(syms_));
  }
  return keys;
}

size_t MarkovChain::NumPrefixes() const {
  size_t num_prefixes = 0;
  for (StateId s = 0; s < fst_.NumStates(); ++s) {
    if (fst_.NumArcs(s) > 0) ++num_prefixes;
  }
  return num_prefixes;
}

MarkovChain::StateId MarkovChain::FindOrAddState(const MarkovPrefix &prefix) {
  auto iter = states_.find(prefix.Labels());
  if (iter != states_.end()) return iter->second;
  StateId s = fst_.AddState();
  states_[prefix.Labels()] = s;
  prefixes_.push_back(prefix);
  return s;
}

}  // namespace markov
