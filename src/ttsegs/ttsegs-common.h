// ttsegs/ttsegs-common.h

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

#ifndef TTSEGS_TTSEGS_TTSEGS_COMMON_H_
#define TTSEGS_TTSEGS_TTSEGS_COMMON_H_

#include <string>
#include <vector>

#include "base/kaldi-common.h"
#include "matrix/kaldi-matrix.h"
#include "matrix/kaldi-vector.h"
#include "util/common-utils.h"

namespace ttsegs {

using kaldi::int32;
using kaldi::int64;
using kaldi::BaseFloat;
using kaldi::Matrix;
using kaldi::MatrixBase;
using kaldi::SubMatrix;
using kaldi::Vector;
using kaldi::VectorBase;
using kaldi::SubVector;
using kaldi::OptionsItf;

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_TTSEGS_COMMON_H_
