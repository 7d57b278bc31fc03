// ttsegsbin/compute-alignment-prior.cc

// Copyright 2021  ttsegs contributors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include "base/kaldi-common.h"
#include "util/common-utils.h"
#include "ttsegs/alignment-prior.h"

int main(int argc, char *argv[]) {
  try {
    using namespace kaldi;
    using namespace ttsegs;
    typedef kaldi::int32 int32;

    const char *usage =
        "Compute the beta-binomial alignment prior for a text length and a\n"
        "mel length.  The output matrix has one row per mel frame and one\n"
        "column per text position.\n"
        "Usage:  compute-alignment-prior [options] <text-length> <mel-length> "
        "<prior-wxfilename>\n"
        "e.g.:\n"
        " compute-alignment-prior --use-prior-interpolator=false 40 300 "
        "prior.mat\n";

    ParseOptions po(usage);
    AlignmentPriorOptions prior_opts;
    bool binary = true;
    po.Register("binary", &binary, "Write output in binary mode");
    prior_opts.Register(&po);

    po.Read(argc, argv);

    if (po.NumArgs() != 3) {
      po.PrintUsage();
      exit(1);
    }

    int32 text_len, mel_len;
    if (!ConvertStringToInteger(po.GetArg(1), &text_len) || text_len <= 0)
      KALDI_ERR << "Invalid text length " << po.GetArg(1);
    if (!ConvertStringToInteger(po.GetArg(2), &mel_len) || mel_len <= 0)
      KALDI_ERR << "Invalid mel length " << po.GetArg(2);
    std::string prior_wxfilename = po.GetArg(3);

    prior_opts.Check();
    Matrix<BaseFloat> prior;
    if (prior_opts.use_interpolator) {
      BetaBinomialInterpolator interpolator(prior_opts.round_mel_len_to,
                                            prior_opts.round_text_len_to,
                                            prior_opts.scaling);
      interpolator.Interpolate(mel_len, text_len, &prior);
    } else {
      ComputeBetaBinomialPrior(text_len, mel_len, prior_opts.scaling, &prior);
    }

    WriteKaldiObject(prior, prior_wxfilename, binary);
    KALDI_LOG << "Wrote " << prior.NumRows() << " by " << prior.NumCols()
              << " alignment prior to " << prior_wxfilename;
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
