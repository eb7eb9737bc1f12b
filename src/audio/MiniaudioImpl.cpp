// SPDX-License-Identifier: Apache-2.0

// The one translation unit that compiles miniaudio's implementation. MicrophoneVoiceSession
// (capture) and WavFile (encode/decode) include <miniaudio.h> as a plain header.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
