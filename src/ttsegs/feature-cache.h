// ttsegs/feature-cache.h

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

#ifndef TTSEGS_TTSEGS_FEATURE_CACHE_H_
#define TTSEGS_TTSEGS_FEATURE_CACHE_H_

#include <string>

#include "ttsegs/ttsegs-common.h"

namespace ttsegs {

/// @addtogroup ttsegs
/// @{

/// Extension of cached feature matrices (Kaldi binary matrix format).
extern const char *kFeatureCacheExtension;

/// Replaces the extension of the last path component of "path" by
/// "extension" (which includes the dot), or appends it if there is none.
std::string ReplaceExtension(const std::string &path,
                             const std::string &extension);

/// Returns "audio_path" relative to "dataset_path".  A relative audio path is
/// returned unchanged; an absolute path outside dataset_path is an error.
std::string RelativeToDataset(const std::string &dataset_path,
                              const std::string &audio_path);

/// Location of the cache file of an utterance:
///  <cache_dir>/<audio path relative to dataset_path, extension replaced>
std::string CachePathForAudio(const std::string &cache_dir,
                              const std::string &dataset_path,
                              const std::string &audio_path,
                              const std::string &extension =
                              kFeatureCacheExtension);

/// True if "path" names an existing regular file.
bool CacheFileExists(const std::string &path);

/// Creates every missing directory on the way to "path" (not "path" itself).
void CreateParentDirectories(const std::string &path);

/// Reads a matrix written by WriteMatrixAtomic (or any Kaldi matrix file).
/// Returns false if the file does not exist; throws if it cannot be parsed.
bool ReadCachedMatrix(const std::string &path, Matrix<BaseFloat> *mat);

/// Reads a Kaldi matrix or vector object from "rxfilename" (which may carry
/// an archive offset, e.g. "feats.ark:1234").  A vector of dimension T is
/// returned as a 1 by T matrix and *was_vector (if not NULL) is set.
void ReadFeatureMatrix(const std::string &rxfilename, Matrix<BaseFloat> *mat,
                       bool *was_vector = NULL);

/// Writes "mat" in binary form to a unique temporary file next to "path" and
/// renames it into place, creating parent directories as needed.  Readers
/// never observe a partially written file; with concurrent writers of the
/// same content the last rename wins.
void WriteMatrixAtomic(const std::string &path, const MatrixBase<BaseFloat> &mat);

/// @} end of "addtogroup ttsegs"

}  // namespace ttsegs

#endif  // TTSEGS_TTSEGS_FEATURE_CACHE_H_
