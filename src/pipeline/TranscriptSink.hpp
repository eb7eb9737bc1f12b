// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

namespace voicescribe
{

/// @brief Receives attributed transcripts. Fire-and-forget: failures stay inside the sink.
class TranscriptSink
{
  public:
    virtual ~TranscriptSink() = default;

    /// @brief Publishes one transcript event.
    virtual void emit(const TranscriptEvent& event) = 0;
};

} // namespace voicescribe
