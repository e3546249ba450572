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
// Tests random text generation from a Markov chain.

#include <algorithm>
#include <new>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include <fst/compat.h>
#include <fst/flags.h>
#include <fst/log.h>
#include <markov/markov-build.h>
#include <markov/markov-chain.h>
#include <markov/markov-generate.h>
#include <markov/markov-selector.h>

DEFINE_int32(seed, 1403, "Randomization seed");

DECLARE_bool(markov_error_fatal);

namespace {

using markov::FirstSuffixSelector;
using markov::MarkovChain;
using markov::MarkovChainBuilder;
using markov::MarkovGenerator;
using markov::MarkovPrefix;
using markov::UniformSuffixSelector;

// Returns the given positions in turn, then the first suffix.
class ScriptedSuffixSelector {
 public:
  explicit ScriptedSuffixSelector(const std::vector<size_t> &positions)
      : positions_(positions), next_(0) {}

  size_t operator()(size_t num_suffixes) {
    if (next_ >= positions_.size()) return 0;
    return std::min(positions_[next_++], num_suffixes - 1);
  }

 private:
  std::vector<size_t> positions_;
  size_t next_;
};

// Accepts 'capacity' characters, then fails every write.
class FailingOutBuf : public std::streambuf {
 public:
  explicit FailingOutBuf(size_t capacity) : capacity_(capacity) {}

  const std::string &Written() const { return written_; }

 protected:
  int_type overflow(int_type c) override {
    if (traits_type::eq_int_type(c, traits_type::eof()))
      return traits_type::not_eof(c);
    if (written_.size() >= capacity_) return traits_type::eof();
    written_ += traits_type::to_char_type(c);
    return c;
  }

 private:
  size_t capacity_;
  std::string written_;
};

bool Expect(bool condition, const std::string &what) {
  if (!condition) LOG(ERROR) << "FAILED: " << what;
  return condition;
}

std::string Join(const std::vector<std::string> &words) {
  std::string joined;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) joined += " ";
    joined += words[i];
  }
  return joined;
}

bool BuildFromString(const std::string &text, MarkovChain *chain) {
  std::istringstream istrm(text);
  MarkovChainBuilder builder(chain);
  return builder.Build(istrm);
}

// Checks each word is a recorded suffix of the prefix it followed.
bool AllWordsObserved(const MarkovChain &chain,
                      const std::vector<std::string> &words) {
  MarkovPrefix prefix = chain.InitialPrefix();
  for (size_t i = 0; i < words.size(); ++i) {
    std::vector<std::string> suffixes = chain.Suffixes(prefix);
    if (std::find(suffixes.begin(), suffixes.end(), words[i]) ==
        suffixes.end()) {
      LOG(ERROR) << "word " << i << " \"" << words[i]
                 << "\" never followed \""
                 << prefix.ToString(chain.Symbols()) << "\"";
      return false;
    }
    prefix.Shift(chain.Symbols().Find(words[i]));
  }
  return true;
}

bool TestFirstChoice() {
  MarkovChain chain(2);
  bool ok = BuildFromString("the cat sat the cat ran", &chain);
  FirstSuffixSelector selector;
  MarkovGenerator<FirstSuffixSelector> generator(chain, &selector);
  std::vector<std::string> words;
  ok &= generator.Generate(8, &words);
  ok &= Expect(Join(words) == "the cat sat the cat sat the cat",
               "first choice repeats the first continuation, got " +
                   Join(words));
  ok &= Expect(generator.GetTermination() ==
                   MarkovGenerator<FirstSuffixSelector>::kLimitReached,
               "first choice run ends at the word limit");
  return ok;
}

bool TestReproduceInput() {
  MarkovChain chain(2);
  bool ok = BuildFromString("the cat sat the cat ran", &chain);
  // "the cat" is seen twice; take its second suffix on the second visit.
  ScriptedSuffixSelector selector({0, 0, 0, 0, 0, 1});
  MarkovGenerator<ScriptedSuffixSelector> generator(chain, &selector);
  std::vector<std::string> words;
  ok &= generator.Generate(100, &words);
  ok &= Expect(Join(words) == "the cat sat the cat ran",
               "input reproduced, got " + Join(words));
  ok &= Expect(generator.GetTermination() ==
                   MarkovGenerator<ScriptedSuffixSelector>::kExhausted,
               "run ends at the final prefix");
  ok &= Expect(generator.NumGenerated() == 6, "six words generated");
  return ok;
}

bool TestStreamOutput() {
  MarkovChain chain(2);
  bool ok = BuildFromString("the cat sat the cat ran", &chain);
  FirstSuffixSelector selector;
  MarkovGenerator<FirstSuffixSelector> generator(chain, &selector);
  std::ostringstream ostrm;
  ok &= generator.Generate(3, ostrm);
  ok &= Expect(ostrm.str() == "the cat sat ",
               "words written with trailing separators, got \"" +
                   ostrm.str() + "\"");
  return ok;
}

bool TestWordLimit() {
  MarkovChain chain(1);
  bool ok = BuildFromString("a a a a", &chain);
  UniformSuffixSelector selector(FLAGS_seed);
  MarkovGenerator<UniformSuffixSelector> generator(chain, &selector);
  std::vector<std::string> words;
  ok &= generator.Generate(1000, &words);
  ok &= Expect(words.size() == 1000, "cycle is cut at the word limit");
  ok &= Expect(std::count(words.begin(), words.end(), "a") == 1000,
               "only the observed word is emitted");
  ok &= Expect(generator.GetTermination() ==
                   MarkovGenerator<UniformSuffixSelector>::kLimitReached,
               "cycle ends at the word limit");
  ok &= generator.Generate(0, &words);
  ok &= Expect(words.empty(), "zero limit emits nothing");
  ok &= generator.Generate(-3, &words);
  ok &= Expect(words.empty(), "negative limit emits nothing");
  return ok;
}

bool TestEmptyChain() {
  MarkovChain chain(2);
  FirstSuffixSelector selector;
  MarkovGenerator<FirstSuffixSelector> generator(chain, &selector);
  std::ostringstream ostrm;
  bool ok = generator.Generate(10, ostrm);
  ok &= Expect(ostrm.str().empty(), "empty chain writes nothing");
  ok &= Expect(generator.NumGenerated() == 0, "empty chain emits no words");
  ok &= Expect(generator.GetTermination() ==
                   MarkovGenerator<FirstSuffixSelector>::kExhausted,
               "empty chain is exhausted at once");
  return ok;
}

bool TestNoFabrication() {
  MarkovChain chain(2);
  bool ok = BuildFromString(
      "I do not like them in a house. I do not like them with a mouse.\n"
      "I do not like them here or there. I do not like them anywhere.\n"
      "I do not like green eggs and ham. I do not like them, Sam-I-am.",
      &chain);
  UniformSuffixSelector selector(FLAGS_seed);
  MarkovGenerator<UniformSuffixSelector> generator(chain, &selector);
  for (int run = 0; run < 50; ++run) {
    std::vector<std::string> words;
    ok &= generator.Generate(200, &words);
    ok &= Expect(words.size() <= 200, "never more than the limit");
    ok &= AllWordsObserved(chain, words);
  }
  return ok;
}

bool TestFrequencyWeighting() {
  MarkovChain chain(1);
  bool ok = BuildFromString("x a x a x a x b", &chain);
  UniformSuffixSelector selector(FLAGS_seed);
  MarkovGenerator<UniformSuffixSelector> generator(chain, &selector);
  const int kRuns = 4000;
  int num_a = 0;
  for (int run = 0; run < kRuns; ++run) {
    std::vector<std::string> words;
    ok &= generator.Generate(2, &words);
    if (words.size() == 2 && words[1] == "a") ++num_a;
  }
  double fraction = static_cast<double>(num_a) / kRuns;
  ok &= Expect(fraction > 0.7 && fraction < 0.8,
               "word seen 3 of 4 times chosen about 3/4 of the time");
  return ok;
}

bool TestRepeatedRuns() {
  MarkovChain chain(2);
  bool ok = BuildFromString("the cat sat the cat ran", &chain);
  FirstSuffixSelector selector;
  MarkovGenerator<FirstSuffixSelector> generator(chain, &selector);
  std::vector<std::string> first, second;
  ok &= generator.Generate(5, &first) && generator.Generate(5, &second);
  ok &= Expect(first == second, "each run starts from the initial prefix");
  ok &= Expect(chain.NumTokens() == 6 && chain.NumPrefixes() == 5,
               "generation leaves the chain unchanged");
  return ok;
}

bool TestWriteFailure() {
  MarkovChain chain(1);
  bool ok = BuildFromString("a a a a", &chain);
  FailingOutBuf buf(5);
  std::ostream ostrm(&buf);
  FirstSuffixSelector selector;
  MarkovGenerator<FirstSuffixSelector> generator(chain, &selector);
  ok &= Expect(!generator.Generate(100, ostrm), "write failure fails the run");
  ok &= Expect(generator.GetTermination() ==
                   MarkovGenerator<FirstSuffixSelector>::kWriteError,
               "write failure ends the run");
  ok &= Expect(generator.NumGenerated() < 100, "run stops at the failure");
  ok &= Expect(buf.Written() == "a a a", "output up to the failure");
  return ok;
}

}  // namespace

int main(int argc, char **argv) {
  std::string usage = "Tests Markov chain text generation.\n\n  Usage: ";
  usage += argv[0];
  usage += " [--options]\n";
  std::set_new_handler(FailedNewHandler);
  SET_FLAGS(usage.c_str(), &argc, &argv, true);
  FLAGS_markov_error_fatal = false;

  bool ok = TestFirstChoice();
  ok &= TestReproduceInput();
  ok &= TestStreamOutput();
  ok &= TestWordLimit();
  ok &= TestEmptyChain();
  ok &= TestNoFabrication();
  ok &= TestFrequencyWeighting();
  ok &= TestRepeatedRuns();
  ok &= TestWriteFailure();
  return ok ? 0 : 1;
}
