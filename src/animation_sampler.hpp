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

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <tinygltf/tiny_gltf.h>

#include "gltf_accessor_reader.hpp"
#include "property_animation_types.hpp"

namespace propanim {

// Decoded sampler buffers, immutable once produced and shared by all channels using the sampler
struct SamplerData
{
  std::vector<float> input;  // Timestamps
  Interpolation      interpolation = Interpolation::eLinear;
  std::vector<float> output;  // Flat values
};

struct SamplerDecodeResult
{
  std::shared_ptr<const SamplerData> data;
  std::optional<AnimationError>      error;
};

/*-------------------------------------------------------------------------------------------------
# class `propanim::AnimationSampler`
> One sampler of an animation and its cached decode.

The first call to `decode()` validates the interpolation and starts reading the input and
output accessors; every later call, concurrent or not, returns the same shared future.
A failed decode is cached as well.
-------------------------------------------------------------------------------------------------*/
class AnimationSampler
{
public:
  AnimationSampler(int index, int inputAccessor, int outputAccessor, std::string interpolation);
  AnimationSampler(int index, const tinygltf::AnimationSampler& sampler);

  AnimationSampler(const AnimationSampler&)            = delete;
  AnimationSampler& operator=(const AnimationSampler&) = delete;

  // `context` is the sampler's JSON path, used in error messages
  std::shared_future<SamplerDecodeResult> decode(const FloatAccessorReader& reader,
                                                 const std::string&         context,
                                                 std::launch                policy = std::launch::deferred);

  int                index() const { return m_index; }
  const std::string& interpolation() const { return m_interpolation; }

  // Number of times the accessors were read, 0 or 1
  uint32_t decodeCount() const { return m_decodeCount.load(); }

private:
  SamplerDecodeResult readBuffers(const FloatAccessorReader& reader, const std::string& context, Interpolation interpolation);

  int         m_index          = 0;
  int         m_inputAccessor  = -1;
  int         m_outputAccessor = -1;
  std::string m_interpolation;

  std::mutex                              m_mutex;
  std::shared_future<SamplerDecodeResult> m_data;
  std::atomic<uint32_t>                   m_decodeCount{0};
};

}  // namespace propanim
