// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef CRYPTO_SCOPED_OPENSSL_TYPES_H_
#define CRYPTO_SCOPED_OPENSSL_TYPES_H_

#include <stdint.h>

#include <memory>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

namespace crypto {

// Simplistic helper that wraps a call to a deleter function. In a C++11 world,
// this would be std::function<>. An alternative would be to re-use
// base::internal::RunnableAdapter<>, but that's far too heavy weight.
template <typename Type, void (*Destroyer)(Type*)>
struct OpenSSLDestroyer {
  void operator()(Type* ptr) const { Destroyer(ptr); }
};

template <typename PointerType, void (*Destroyer)(PointerType*)>
using ScopedOpenSSL =
    std::unique_ptr<PointerType, OpenSSLDestroyer<PointerType, Destroyer>>;

namespace internal {

// STACK_OF(X509) is released together with the references it holds.
inline void FreeX509Stack(STACK_OF(X509)* stack) {
  sk_X509_pop_free(stack, X509_free);
}

// BIO_free returns int; wrapped so that it matches the destroyer signature.
inline void FreeBIO(BIO* bio) {
  BIO_free(bio);
}

}  // namespace internal

using ScopedBIO = ScopedOpenSSL<BIO, internal::FreeBIO>;
using ScopedEVP_PKEY = ScopedOpenSSL<EVP_PKEY, EVP_PKEY_free>;
using ScopedEVP_PKEY_CTX = ScopedOpenSSL<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using ScopedX509 = ScopedOpenSSL<X509, X509_free>;
using ScopedX509_NAME = ScopedOpenSSL<X509_NAME, X509_NAME_free>;
using ScopedX509Stack = ScopedOpenSSL<STACK_OF(X509), internal::FreeX509Stack>;
using ScopedX509_STORE = ScopedOpenSSL<X509_STORE, X509_STORE_free>;
using ScopedX509_STORE_CTX = ScopedOpenSSL<X509_STORE_CTX, X509_STORE_CTX_free>;

}  // namespace crypto

#endif  // CRYPTO_SCOPED_OPENSSL_TYPES_H_
