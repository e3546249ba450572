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
// Builds a Markov chain from input text and generates random text from it.

#include <sys/types.h>
#include <unistd.h>
#include <cstring>
#include <fstream>
#include <iostream>
#include <new>
#include <string>

#include <fst/compat.h>
#include <fst/flags.h>
#include <fst/log.h>
#include <markov/markov-build.h>
#include <markov/markov-chain.h>
#include <markov/markov-generate.h>
#include <markov/markov-selector.h>

DEFINE_int64(words, 100, "Maximum number of words to print");
DEFINE_int32(prefix, 2, "Prefix length in words");
DEFINE_int32(seed, time(0) + getpid(), "Randomization seed");

int main(int argc, char **argv) {
  std::string usage =
      "Generates random text from a Markov chain of the input text.\n\n"
      "  Usage: ";
  usage += argv[0];
  usage += " [--options] [in.txt [out.txt]]\n";
  std::set_new_handler(FailedNewHandler);
  SET_FLAGS(usage.c_str(), &argc, &argv, true);

  if (argc > 3) {
    ShowUsage();
    return 1;
  }
  if (FLAGS_prefix < 1) {
    LOG(ERROR) << argv[0] << ": --prefix must be at least 1: "
               << FLAGS_prefix;
    return 1;
  }
  if (FLAGS_words < 0) {
    LOG(ERROR) << argv[0] << ": --words must not be negative: "
               << FLAGS_words;
    return 1;
  }

  VLOG(1) << argv[0] << ": Seed = " << FLAGS_seed;

  std::string in_name =
      (argc > 1 && (strcmp(argv[1], "-") != 0)) ? argv[1] : "";
  std::string out_name =
      (argc > 2 && (strcmp(argv[2], "-") != 0)) ? argv[2] : "";

  std::ifstream ifstrm;
  if (!in_name.empty()) {
    ifstrm.open(in_name);
    if (!ifstrm) {
      LOG(ERROR) << argv[0] << ": Open failed, file = " << in_name;
      return 1;
    }
  }
  std::istream &istrm = ifstrm.is_open() ? ifstrm : std::cin;

  markov::MarkovChain chain(FLAGS_prefix);
  markov::MarkovChainBuilder builder(&chain);
  if (!builder.Build(istrm)) return 1;
  VLOG(1) << argv[0] << ": " << chain.NumTokens() << " words, "
          << chain.NumPrefixes() << " prefixes, "
          << chain.Symbols().NumSymbols() - 1 << " distinct words";

  std::ofstream ofstrm;
  if (!out_name.empty()) {
    ofstrm.open(out_name);
    if (!ofstrm) {
      LOG(ERROR) << argv[0] << ": Open failed, file = " << out_name;
      return 1;
    }
  }
  std::ostream &ostrm = ofstrm.is_open() ? ofstrm : std::cout;

  markov::UniformSuffixSelector selector(FLAGS_seed);
  markov::MarkovGenerator<markov::UniformSuffixSelector> generator(chain,
                                                                   &selector);
  if (!generator.Generate(FLAGS_words, ostrm)) return 1;
  ostrm << std::endl;
  if (!ostrm) {
    LOG(ERROR) << argv[0] << ": write failed";
    return 1;
  }
  return 0;
}
