#pragma once

// Set by CMake from the project version
#ifndef TXA_VERSION_STRING
#define TXA_VERSION_STRING "0.0.0"
#endif
