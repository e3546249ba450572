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
// Generates random text by walking a Markov chain.

#ifndef MARKOV_MARKOV_GENERATE_H_
#define MARKOV_MARKOV_GENERATE_H_

#include <ostream>
#include <string>
#include <vector>

#include <fst/types.h>
#include <markov/markov-chain.h>
#include <markov/markov-prefix.h>
#include <markov/util.h>

namespace markov {

// Emits words from a built chain. Starting from the initial prefix, each
// step looks up the suffixes of the current prefix, lets the selector S pick
// one, emits it and shifts it into the prefix. A run ends when the word
// limit is reached or the current prefix has no suffixes. The chain is only
// read; every run starts from a fresh prefix.
template <class S>
class MarkovGenerator {
 public:
  typedef MarkovChain::StateId StateId;
  typedef MarkovChain::Label Label;

  // How the last run ended.
  enum Termination {
    kRunning,       // no run finished yet
    kExhausted,     // current prefix had no suffixes
    kLimitReached,  // max_words words emitted
    kWriteError     // output stream failed
  };

  // The chain and selector must outlive the generator.
  MarkovGenerator(const MarkovChain &chain, S *selector)
      : chain_(chain),
        selector_(selector),
        termination_(kRunning),
        num_generated_(0) {}

  // Writes at most 'max_words' words to 'ostrm', each followed by a space.
  // Returns false if writing fails.
  bool Generate(int64 max_words, std::ostream &ostrm) {
    return Run(max_words, &ostrm, nullptr);
  }

  // Stores at most 'max_words' words in 'words'.
  bool Generate(int64 max_words, std::vector<std::string> *words) {
    words->clear();
    return Run(max_words, nullptr, words);
  }

  Termination GetTermination() const { return termination_; }

  // Number of words emitted by the last run.
  int64 NumGenerated() const { return num_generated_; }

 private:
  bool Run(int64 max_words, std::ostream *ostrm,
           std::vector<std::string> *words);

  const MarkovChain &chain_;
  S *selector_;
  Termination termination_;
  int64 num_generated_;
};

template <class S>
bool MarkovGenerator<S>::Run(int64 max_words, std::ostream *ostrm,
                             std::vector<std::string> *words) {
  termination_ = kRunning;
  num_generated_ = 0;
  if (chain_.Error()) {
    MARKOVERROR() << "MarkovGenerator: chain is bad";
    return false;
  }
  MarkovPrefix prefix = chain_.InitialPrefix();
  while (termination_ == kRunning) {
    if (num_generated_ >= max_words) {
      termination_ = kLimitReached;
      break;
    }
    StateId s = chain_.FindState(prefix);
    if (s == kNoStateId || chain_.NumSuffixes(s) == 0) {
      termination_ = kExhausted;
      break;
    }
    Label label = chain_.Suffix(s, (*selector_)(chain_.NumSuffixes(s)));
    std::string word = chain_.Symbols().Find(label);
    if (ostrm) {
      *ostrm << word << ' ';
      if (!*ostrm) termination_ = kWriteError;
    } else {
      words->push_back(word);
    }
    if (termination_ == kRunning) {
      ++num_generated_;
      prefix.Shift(label);
    }
  }
  if (ostrm && termination_ != kWriteError && !ostrm->flush())
    termination_ = kWriteError;
  if (termination_ == kWriteError) {
    MARKOVERROR() << "MarkovGenerator: write failed after " << num_generated_
                  << " words";
    return false;
  }
  if (termination_ == kExhausted) {
    VLOG(2) << "MarkovGenerator: " << num_generated_
            << " words, no suffixes for prefix \""
            << prefix.ToString(chain_.Symbols()) << "\"";
  } else {
    VLOG(2) << "MarkovGenerator: " << num_generated_
            << " words, word limit reached";
  }
  return true;
}

}  // namespace markov

#endif  // MARKOV_MARKOV_GENERATE_H_
