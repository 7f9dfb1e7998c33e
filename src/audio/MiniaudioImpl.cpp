// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// Only MicrophoneCapture includes <miniaudio.h>, without the IMPLEMENTATION define.
#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_ENCODING
#define MA_NO_DECODING
#define MA_NO_GENERATION
#include <miniaudio.h>
