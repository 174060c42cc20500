/*
 * Copyright (c) 2024-2026, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-FileCopyrightText: Copyright (c) 2024-2026, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "property_animation_types.hpp"

namespace propanim {

//--------------------------------------------------------------------------------------------------
// Read position into a flat float buffer.
// Each call to next() returns `width` floats at the current position and moves forward by the
// stride, so a consumer can read only part of every sample (e.g. RGB out of RGBA).
//--------------------------------------------------------------------------------------------------
class OutputCursor
{
public:
  OutputCursor(std::span<const float> data, size_t offset, size_t stride);

  std::span<const float> next(size_t width);
  size_t                 position() const { return m_position; }

private:
  std::span<const float> m_data;
  size_t                 m_position = 0;
  size_t                 m_stride   = 1;
};

/*-------------------------------------------------------------------------------------------------
# class `propanim::ValueComposer`
> Turns the flat output floats of a sampler into typed values.

A sample is `componentsPerSample(type)` floats. A keyframe is one sample for STEP and LINEAR,
and three samples for CUBICSPLINE (in-tangent, value, out-tangent).

The composer reads `width` floats starting `offset` floats into each sample:
- `primary(type)` reads the whole sample, except for Color4 where only RGB is read
- `alpha()` reads the 4th float of each Color4 sample
-------------------------------------------------------------------------------------------------*/
class ValueComposer
{
public:
  // Throws std::logic_error for a type without an entry (eNone)
  static uint32_t componentsPerSample(ValueType type);
  static uint32_t samplesPerKeyframe(Interpolation interpolation);

  static ValueComposer primary(ValueType declaredType);
  static ValueComposer alpha();

  ValueType    outputType() const { return m_outputType; }
  uint32_t     stride() const { return m_stride; }
  uint32_t     offset() const { return m_offset; }
  uint32_t     width() const { return m_width; }
  OutputCursor makeCursor(std::span<const float> output) const;

  // Reads the next sample at the cursor and builds the value
  AnimationValue nextValue(OutputCursor& cursor) const;

private:
  ValueComposer(ValueType outputType, uint32_t stride, uint32_t offset, uint32_t width);

  ValueType m_outputType = ValueType::eFloat;
  uint32_t  m_stride     = 1;
  uint32_t  m_offset     = 0;
  uint32_t  m_width      = 1;
};

// Number of output floats a track of `keyCount` keyframes consumes
size_t requiredOutputSize(const ValueComposer& composer, Interpolation interpolation, size_t keyCount);

//--------------------------------------------------------------------------------------------------
// Builds one keyframe per input timestamp, consuming the output in timestamp order.
// Returns eAccessorRange, without reading anything, if `output` is too short.
//--------------------------------------------------------------------------------------------------
std::optional<AnimationError> buildKeyframes(std::span<const float> input,
                                             std::span<const float> output,
                                             Interpolation          interpolation,
                                             const ValueComposer&   composer,
                                             std::vector<Keyframe>& keys);

}  // namespace propanim
