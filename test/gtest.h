#pragma once

// Wrapper for the GoogleTest header, silencing warnings from its macros.

#if defined(__GNUC__)
#pragma GCC system_header
#endif

#include <gtest/gtest.h>
