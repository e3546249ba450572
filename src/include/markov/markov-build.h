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
// Builds a Markov chain from whitespace-separated text.

#ifndef MARKOV_MARKOV_BUILD_H_
#define MARKOV_MARKOV_BUILD_H_

#include <istream>
#include <string>

#include <markov/markov-chain.h>
#include <markov/markov-prefix.h>
#include <markov/util.h>

namespace markov {

class MarkovChainBuilder {
 public:
  // Fills 'chain', which must outlive the builder. The sliding prefix
  // starts out holding only empty words.
  explicit MarkovChainBuilder(MarkovChain *chain)
      : chain_(chain), prefix_(chain->InitialPrefix()) {}

  // Reads words from 'istrm' until end of stream, recording each as a
  // suffix of the words preceding it. Successive calls continue the same
  // prefix. Returns false if the stream fails for a reason other than end
  // of input.
  bool Build(std::istream &istrm);

  // Records a single word and shifts the prefix.
  bool AddWord(const std::string &word);

  const MarkovPrefix &Prefix() const { return prefix_; }

 private:
  MarkovChain *chain_;
  MarkovPrefix prefix_;
};

}  // namespace markov

#endif  // MARKOV_MARKOV_BUILD_H_
