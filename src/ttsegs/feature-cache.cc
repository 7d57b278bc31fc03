// ttsegs/feature-cache.cc

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

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "ttsegs/feature-cache.h"

namespace ttsegs {

const char *kFeatureCacheExtension = ".mat";

std::string ReplaceExtension(const std::string &path,
                             const std::string &extension) {
  size_t slash = path.find_last_of('/');
  size_t base_start = (slash == std::string::npos ? 0 : slash + 1);
  size_t dot = path.find_last_of('.');
  // a leading dot (hidden file) is not an extension
  if (dot == std::string::npos || dot <= base_start)
    return path + extension;
  return path.substr(0, dot) + extension;
}

static std::string StripTrailingSlashes(const std::string &path) {
  std::string ans(path);
  while (ans.size() > 1 && ans[ans.size() - 1] == '/')
    ans.resize(ans.size() - 1);
  return ans;
}

std::string RelativeToDataset(const std::string &dataset_path,
                              const std::string &audio_path) {
  if (dataset_path.empty())
    return audio_path;
  std::string root = StripTrailingSlashes(dataset_path);
  if (audio_path.compare(0, root.size(), root) == 0 &&
      audio_path.size() > root.size() && audio_path[root.size()] == '/') {
    size_t start = root.size();
    while (start < audio_path.size() && audio_path[start] == '/') start++;
    return audio_path.substr(start);
  }
  if (!audio_path.empty() && audio_path[0] == '/')
    KALDI_ERR << "Audio path " << audio_path << " is not inside the dataset "
              << "directory " << dataset_path;
  return audio_path;
}

std::string CachePathForAudio(const std::string &cache_dir,
                              const std::string &dataset_path,
                              const std::string &audio_path,
                              const std::string &extension) {
  KALDI_ASSERT(!cache_dir.empty());
  std::string rel = ReplaceExtension(RelativeToDataset(dataset_path,
                                                       audio_path),
                                     extension);
  return StripTrailingSlashes(cache_dir) + "/" + rel;
}

bool CacheFileExists(const std::string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0)
    return false;
  return S_ISREG(st.st_mode);
}

static void MakeDirectory(const std::string &dir) {
  if (mkdir(dir.c_str(), 0777) == 0)
    return;
  if (errno == EEXIST) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
      return;
    KALDI_ERR << "Cannot create directory " << dir
              << ": a file with that name exists";
  }
  KALDI_ERR << "Cannot create directory " << dir << ": " << strerror(errno);
}

void CreateParentDirectories(const std::string &path) {
  size_t pos = 0;
  while ((pos = path.find('/', pos + 1)) != std::string::npos) {
    std::string dir = path.substr(0, pos);
    if (dir.empty() || dir == "." || dir == "..") continue;
    MakeDirectory(dir);
  }
}

bool ReadCachedMatrix(const std::string &path, Matrix<BaseFloat> *mat) {
  if (!CacheFileExists(path))
    return false;
  bool binary;
  kaldi::Input ki(path, &binary);
  mat->Read(ki.Stream(), binary);
  return true;
}

// Looks ahead in "is" to tell a Kaldi vector from a matrix, restoring the
// read position.  Streams that cannot seek are assumed to hold a matrix.
static bool PeekIsVector(std::istream &is, bool binary) {
  std::streampos pos = is.tellg();
  if (pos == std::streampos(-1)) {
    is.clear();
    return false;
  }
  bool is_vector = false;
  if (binary) {
    std::string token;
    kaldi::ReadToken(is, true, &token);
    is_vector = (token == "FV" || token == "DV");
  } else {
    // text vectors are " [ 1 2 3 ]", text matrices start with " [\n"
    int c;
    while ((c = is.get()) != EOF && std::isspace(c)) { }
    if (c == '[') {
      while ((c = is.get()) == ' ' || c == '\t') { }
      is_vector = (c != '\n' && c != '\r' && c != EOF);
    }
  }
  is.clear();
  is.seekg(pos);
  return is_vector;
}

void ReadFeatureMatrix(const std::string &rxfilename, Matrix<BaseFloat> *mat,
                       bool *was_vector) {
  bool binary;
  kaldi::Input ki(rxfilename, &binary);
  std::istream &is = ki.Stream();
  bool is_vector = PeekIsVector(is, binary);
  if (is_vector) {
    Vector<BaseFloat> vec;
    vec.Read(is, binary);
    if (vec.Dim() == 0)
      KALDI_ERR << "Empty feature vector in " << rxfilename;
    mat->Resize(1, vec.Dim(), kaldi::kUndefined);
    mat->Row(0).CopyFromVec(vec);
  } else {
    mat->Read(is, binary);
  }
  if (was_vector != NULL) *was_vector = is_vector;
}

void WriteMatrixAtomic(const std::string &path,
                       const MatrixBase<BaseFloat> &mat) {
  CreateParentDirectories(path);
  std::string tmpl = path + ".tmp.XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  int fd = mkstemp(&(buf[0]));
  if (fd < 0)
    KALDI_ERR << "Cannot create temporary file for " << path << ": "
              << strerror(errno);
  // mkstemp creates the file private to the user
  if (fchmod(fd, 0644) != 0)
    KALDI_WARN << "Cannot change permissions of " << &(buf[0]) << ": "
               << strerror(errno);
  close(fd);
  std::string tmp_path(&(buf[0]));
  {
    kaldi::Output ko(tmp_path, true);
    mat.Write(ko.Stream(), true);
    if (!ko.Close()) {
      unlink(tmp_path.c_str());
      KALDI_ERR << "Error writing temporary file " << tmp_path;
    }
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    int err = errno;
    unlink(tmp_path.c_str());
    KALDI_ERR << "Cannot rename " << tmp_path << " to " << path << ": "
              << strerror(err);
  }
  KALDI_VLOG(3) << "Wrote cache file " << path;
}

}  // namespace ttsegs
