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
#include <markov/markov-prefix.h>

namespace markov {

std::string MarkovPrefix::ToString(const fst::SymbolTable &syms) const {
  std::string key;
  for (size_t i = 0; i < labels_.size(); ++i) {
    if (i > 0) key += " ";
    if (labels_[i] != 0) key += syms.Find(labels_[i]);
  }
  return key;
}

}  // namespace markov
