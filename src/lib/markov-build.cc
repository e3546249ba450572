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
#include <markov/markov-build.h>

namespace markov {

bool MarkovChainBuilder::Build(std::istream &istrm) {
  if (chain_->Error()) return false;
  std::string word;
  while (istrm >> word) {
    if (!AddWord(word)) return false;
  }
  // Extraction stops with eofbit at end of input; badbit means the
  // underlying read failed.
  if (istrm.bad()) {
    MARKOVERROR() << "MarkovChainBuilder::Build: read failed after "
                  << chain_->NumTokens() << " words";
    chain_->SetError();
    return false;
  }
  VLOG(1) << "MarkovChainBuilder::Build: " << chain_->NumTokens()
          << " words, " << chain_->NumPrefixes() << " prefixes";
  return true;
}

bool MarkovChainBuilder::AddWord(const std::string &word) {
  MarkovChain::Label label = chain_->AddSuffix(prefix_, word);
  if (label == kNoLabel) return false;
  prefix_.Shift(label);
  return true;
}

}  // namespace markov
