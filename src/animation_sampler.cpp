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

#include <fmt/format.h>

#include "animation_sampler.hpp"

namespace propanim {

AnimationSampler::AnimationSampler(int index, int inputAccessor, int outputAccessor, std::string interpolation)
    : m_index(index)
    , m_inputAccessor(inputAccessor)
    , m_outputAccessor(outputAccessor)
    , m_interpolation(std::move(interpolation))
{
}

AnimationSampler::AnimationSampler(int index, const tinygltf::AnimationSampler& sampler)
    : AnimationSampler(index, sampler.input, sampler.output, sampler.interpolation)
{
}

//--------------------------------------------------------------------------------------------------
// Single flight: only the first caller creates the future, the others share it
//
std::shared_future<SamplerDecodeResult> AnimationSampler::decode(const FloatAccessorReader& reader,
                                                                 const std::string&         context,
                                                                 std::launch                policy)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if(m_data.valid())
  {
    return m_data;
  }

  const std::optional<Interpolation> interpolation = parseInterpolation(m_interpolation);
  if(!interpolation)
  {
    std::promise<SamplerDecodeResult> failed;
    failed.set_value({nullptr, AnimationError{ErrorCode::eMalformedAnimation,
                                              fmt::format("{}/interpolation: Invalid value ({})", context, m_interpolation)}});
    m_data = failed.get_future().share();
    return m_data;
  }

  m_data = std::async(policy, [this, &reader, context, interp = *interpolation]() { return readBuffers(reader, context, interp); })
               .share();
  return m_data;
}

SamplerDecodeResult AnimationSampler::readBuffers(const FloatAccessorReader& reader, const std::string& context, Interpolation interpolation)
{
  m_decodeCount++;

  auto data           = std::make_shared<SamplerData>();
  data->interpolation = interpolation;
  std::optional<AnimationError> error = reader.readFloatAccessor(m_inputAccessor, data->input);
  if(!error)
  {
    error = reader.readFloatAccessor(m_outputAccessor, data->output);
  }
  if(error)
  {
    error->message = fmt::format("{}: {}", context, error->message);
    return {nullptr, std::move(error)};
  }
  return {std::move(data), std::nullopt};
}

}  // namespace propanim
