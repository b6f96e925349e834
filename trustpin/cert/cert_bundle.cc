// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/cert_bundle.h"

#include <algorithm>
#include <set>

#include "base/files/file_enumerator.h"
#include "base/files/file_util.h"
#include "base/logging.h"
#include "base/strings/string_util.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/x509_certificate.h"

namespace trustpin {

namespace {

const char* const kCertificateExtensions[] = {".cer", ".crt", ".der"};

}  // namespace

const size_t kMaxCertificateFileSize = 1024 * 1024;

bool HasCertificateFileExtension(const base::FilePath& path) {
  const std::string extension = path.FinalExtension();
  for (const char* candidate : kCertificateExtensions) {
    if (base::LowerCaseEqualsASCII(extension, candidate))
      return true;
  }
  return false;
}

int CertificatesInBundle(const base::FilePath& bundle_dir,
                         std::vector<std::string>* der_certs) {
  if (!base::DirectoryExists(bundle_dir)) {
    LOG(WARNING) << "Certificate bundle " << bundle_dir
                 << " is not a directory";
    return ERR_FILE_NOT_FOUND;
  }

  std::vector<base::FilePath> paths;
  base::FileEnumerator files(bundle_dir, false, base::FileEnumerator::FILES);
  for (base::FilePath path = files.Next(); !path.empty(); path = files.Next()) {
    if (HasCertificateFileExtension(path))
      paths.push_back(path);
  }
  std::sort(paths.begin(), paths.end());

  std::set<std::string> seen(der_certs->begin(), der_certs->end());
  for (const base::FilePath& path : paths) {
    std::string contents;
    if (!base::ReadFileToStringWithMaxSize(path, &contents,
                                           kMaxCertificateFileSize)) {
      VLOG(1) << "Skipping unreadable or oversized " << path;
      continue;
    }
    CertificateList certs = X509Certificate::CreateCertificateListFromBytes(
        contents.data(), contents.size(), X509Certificate::FORMAT_AUTO);
    if (certs.empty()) {
      VLOG(1) << "Skipping " << path << ": not a certificate";
      continue;
    }
    for (const auto& cert : certs) {
      if (seen.insert(cert->der_encoded()).second)
        der_certs->push_back(cert->der_encoded());
    }
  }

  VLOG(1) << "Loaded " << der_certs->size() << " certificates from "
          << bundle_dir;
  return OK;
}

}  // namespace trustpin
