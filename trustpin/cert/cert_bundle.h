// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_CERT_BUNDLE_H_
#define TRUSTPIN_CERT_CERT_BUNDLE_H_

#include <string>
#include <vector>

#include "base/files/file_path.h"
#include "trustpin/base/trustpin_export.h"

namespace trustpin {

// Files larger than this are not considered certificates.
TRUSTPIN_EXPORT extern const size_t kMaxCertificateFileSize;

// Scans |bundle_dir| (not recursively) for files named *.cer, *.crt or *.der,
// in any letter case, and appends the DER encoding of every certificate they
// contain to |der_certs|. PEM armoured files are decoded. Files that do not
// hold a certificate are skipped. The result is ordered by file name and
// holds no duplicates.
//
// Returns OK, or ERR_FILE_NOT_FOUND if |bundle_dir| is not a directory.
TRUSTPIN_EXPORT int CertificatesInBundle(const base::FilePath& bundle_dir,
                                         std::vector<std::string>* der_certs);

// Returns true if |path| has one of the certificate file extensions.
TRUSTPIN_EXPORT bool HasCertificateFileExtension(const base::FilePath& path);

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_CERT_BUNDLE_H_
