// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <cstdio>

// Test programs return non-zero from the first failing check.
#define PW_CHECK(cond)                                                                             \
    if(!(cond)) {                                                                                  \
        fprintf(stderr, "%s:%d: check failed: %s\n", __FILE__, __LINE__, #cond);                   \
        return 1;                                                                                  \
    }

#define PW_RUN(testfunc)                                                                           \
    if(testfunc() != 0) {                                                                          \
        fprintf(stderr, "%s failed.\n", #testfunc);                                                \
        return 1;                                                                                  \
    }
