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

#include <stdexcept>

#include <fmt/format.h>
#include <glm/gtc/type_ptr.hpp>

#include "value_composer.hpp"

namespace propanim {

OutputCursor::OutputCursor(std::span<const float> data, size_t offset, size_t stride)
    : m_data(data)
    , m_position(offset)
    , m_stride(stride)
{
}

std::span<const float> OutputCursor::next(size_t width)
{
  std::span<const float> sample = m_data.subspan(m_position, width);
  m_position += m_stride;
  return sample;
}

//--------------------------------------------------------------------------------------------------
//
ValueComposer::ValueComposer(ValueType outputType, uint32_t stride, uint32_t offset, uint32_t width)
    : m_outputType(outputType)
    , m_stride(stride)
    , m_offset(offset)
    , m_width(width)
{
}

uint32_t ValueComposer::componentsPerSample(ValueType type)
{
  switch(type)
  {
    case ValueType::eFloat:
      return 1;
    case ValueType::eVector2:
      return 2;
    case ValueType::eVector3:
    case ValueType::eColor3:
      return 3;
    case ValueType::eQuaternion:
    case ValueType::eColor4:
      return 4;
    case ValueType::eNone:
      break;
  }
  throw std::logic_error(fmt::format("No value composer for value type '{}'", toString(type)));
}

uint32_t ValueComposer::samplesPerKeyframe(Interpolation interpolation)
{
  return interpolation == Interpolation::eCubicSpline ? 3 : 1;
}

ValueComposer ValueComposer::primary(ValueType declaredType)
{
  const uint32_t stride = componentsPerSample(declaredType);
  if(declaredType == ValueType::eColor4)
  {
    return ValueComposer(ValueType::eColor3, stride, 0, 3);
  }
  return ValueComposer(declaredType, stride, 0, stride);
}

ValueComposer ValueComposer::alpha()
{
  return ValueComposer(ValueType::eFloat, 4, 3, 1);
}

OutputCursor ValueComposer::makeCursor(std::span<const float> output) const
{
  return OutputCursor(output, m_offset, m_stride);
}

AnimationValue ValueComposer::nextValue(OutputCursor& cursor) const
{
  std::span<const float> s = cursor.next(m_width);
  switch(m_outputType)
  {
    case ValueType::eFloat:
      return s[0];
    case ValueType::eVector2:
      return glm::make_vec2(s.data());
    case ValueType::eVector3:
    case ValueType::eColor3:
      return glm::make_vec3(s.data());
    case ValueType::eQuaternion:
      // glTF stores x, y, z, w which is also glm's default storage order
      return glm::make_quat(s.data());
    default:
      break;
  }
  throw std::logic_error(fmt::format("No value composer for value type '{}'", toString(m_outputType)));
}

//--------------------------------------------------------------------------------------------------
//
size_t requiredOutputSize(const ValueComposer& composer, Interpolation interpolation, size_t keyCount)
{
  return size_t(composer.stride()) * ValueComposer::samplesPerKeyframe(interpolation) * keyCount;
}

std::optional<AnimationError> buildKeyframes(std::span<const float> input,
                                             std::span<const float> output,
                                             Interpolation          interpolation,
                                             const ValueComposer&   composer,
                                             std::vector<Keyframe>& keys)
{
  const size_t required = requiredOutputSize(composer, interpolation, input.size());
  if(output.size() < required)
  {
    return AnimationError{ErrorCode::eAccessorRange,
                          fmt::format("Output has {} floats but {} keyframes of {} need {}", output.size(),
                                      input.size(), toString(interpolation), required)};
  }

  OutputCursor cursor = composer.makeCursor(output);
  keys.clear();
  keys.reserve(input.size());

  // The order in, value, out is the CUBICSPLINE sample layout
  for(size_t frameIndex = 0; frameIndex < input.size(); frameIndex++)
  {
    Keyframe key;
    key.frame = input[frameIndex];
    if(interpolation == Interpolation::eCubicSpline)
    {
      key.inTangent  = composer.nextValue(cursor);
      key.value      = composer.nextValue(cursor);
      key.outTangent = composer.nextValue(cursor);
    }
    else
    {
      key.value = composer.nextValue(cursor);
    }
    keys.push_back(std::move(key));
  }
  return std::nullopt;
}

}  // namespace propanim
