#pragma once

#ifndef MACCTL_VERSION
  #define MACCTL_VERSION "0.0.0"
#endif

/// Macro alias for trailing return type functions.
#define fn auto
