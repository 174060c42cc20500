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

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "animation_group.hpp"
#include "animation_sampler.hpp"
#include "gltf_accessor_reader.hpp"
#include "target_path_resolver.hpp"

namespace propanim {

// One entry of the extension's "channels" array
struct PropertyChannel
{
  int         index   = 0;
  int         sampler = -1;
  std::string target;
};

// What a channel produced, attached to the group or not
struct AssembledChannel
{
  TargetDescriptor                   descriptor;
  std::shared_ptr<const SamplerData> samplerData;
  KeyframeTrack                      track;
  std::optional<KeyframeTrack>       alphaTrack;  // Color4 targets only
};

/*-------------------------------------------------------------------------------------------------
# class `propanim::ChannelAssembler`
> Builds the keyframe tracks of one EXT_property_animation channel.

- Decodes the channel's sampler (shared with other channels using it)
- Resolves the target path
- Builds the primary track, and for Color4 targets a second `alpha` float track with the same
  timestamps
- Attaches the tracks to the group when the target resolved to an object
-------------------------------------------------------------------------------------------------*/
class ChannelAssembler
{
public:
  ChannelAssembler(const TargetPathResolver& resolver, const FloatAccessorReader& reader, std::launch policy = std::launch::deferred);

  // `animationContext` is the animation's JSON path (e.g. "/animations/0"), `context` the channel's
  std::optional<AnimationError> assemble(const PropertyChannel&                          channel,
                                         std::vector<std::unique_ptr<AnimationSampler>>& samplers,
                                         AnimationGroup&                                 group,
                                         const std::string&                              animationContext,
                                         const std::string&                              context,
                                         AssembledChannel*                               result = nullptr) const;

private:
  const TargetPathResolver&  m_resolver;
  const FloatAccessorReader& m_reader;
  std::launch                m_policy;
};

}  // namespace propanim
