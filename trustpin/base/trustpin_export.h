// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_BASE_TRUSTPIN_EXPORT_H_
#define TRUSTPIN_BASE_TRUSTPIN_EXPORT_H_

// Defines TRUSTPIN_EXPORT so that functionality implemented by the trustpin
// module can be exported to consumers, and TRUSTPIN_EXPORT_PRIVATE that allows
// unit tests to access features not intended to be used directly by real
// consumers.

#if defined(COMPONENT_BUILD)

#if defined(TRUSTPIN_IMPLEMENTATION)
#define TRUSTPIN_EXPORT __attribute__((visibility("default")))
#define TRUSTPIN_EXPORT_PRIVATE __attribute__((visibility("default")))
#else
#define TRUSTPIN_EXPORT
#define TRUSTPIN_EXPORT_PRIVATE
#endif

#else  // defined(COMPONENT_BUILD)
#define TRUSTPIN_EXPORT
#define TRUSTPIN_EXPORT_PRIVATE
#endif

#endif  // TRUSTPIN_BASE_TRUSTPIN_EXPORT_H_
