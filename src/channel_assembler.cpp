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

#include <nvutils/logger.hpp>

#include "channel_assembler.hpp"
#include "value_composer.hpp"

namespace propanim {

ChannelAssembler::ChannelAssembler(const TargetPathResolver& resolver, const FloatAccessorReader& reader, std::launch policy)
    : m_resolver(resolver)
    , m_reader(reader)
    , m_policy(policy)
{
}

//--------------------------------------------------------------------------------------------------
// Assemble one channel: sampler -> target -> track(s) -> group
//
std::optional<AnimationError> ChannelAssembler::assemble(const PropertyChannel&                          channel,
                                                         std::vector<std::unique_ptr<AnimationSampler>>& samplers,
                                                         AnimationGroup&                                 group,
                                                         const std::string&                              animationContext,
                                                         const std::string&                              context,
                                                         AssembledChannel*                               result) const
{
  if(channel.sampler < 0 || channel.sampler >= static_cast<int>(samplers.size()))
  {
    return AnimationError{ErrorCode::eMalformedAnimation, fmt::format("{}/sampler: Invalid index ({})", context, channel.sampler)};
  }

  // Waits for the decode, which other channels may share
  const std::string   samplerContext = fmt::format("{}/samplers/{}", animationContext, channel.sampler);
  SamplerDecodeResult decoded        = samplers[channel.sampler]->decode(m_reader, samplerContext, m_policy).get();
  if(decoded.error)
  {
    return decoded.error;
  }
  const SamplerData& data = *decoded.data;

  TargetDescriptor descriptor;
  if(std::optional<AnimationError> error = m_resolver.resolve(channel.target, descriptor, context))
  {
    return error;
  }

  const ValueComposer composer = ValueComposer::primary(descriptor.valueType);
  KeyframeTrack       track;
  if(std::optional<AnimationError> error = buildKeyframes(data.input, data.output, data.interpolation, composer, track.keys))
  {
    error->message = fmt::format("{}: {}", samplerContext, error->message);
    return error;
  }

  const size_t required = requiredOutputSize(composer, data.interpolation, data.input.size());
  if(data.output.size() > required)
  {
    LOGW("%s: output has %zu floats, only %zu are used\n", samplerContext.c_str(), data.output.size(), required);
  }

  track.name          = fmt::format("{}_{}_channel{}", group.name(), EXT_PROPERTY_ANIMATION_EXTENSION_NAME, group.nextTrackId());
  track.targetPath    = descriptor.targetPath;
  track.valueType     = composer.outputType();
  track.interpolation = data.interpolation;

  // The alpha of a Color4 is animated by its own track, reading the 4th float of each sample
  std::optional<KeyframeTrack> alphaTrack;
  if(descriptor.valueType == ValueType::eColor4)
  {
    alphaTrack.emplace();
    if(std::optional<AnimationError> error =
           buildKeyframes(data.input, data.output, data.interpolation, ValueComposer::alpha(), alphaTrack->keys))
    {
      error->message = fmt::format("{}: {}", samplerContext, error->message);
      return error;
    }
    alphaTrack->name          = track.name + "_alpha";
    alphaTrack->targetPath    = "alpha";
    alphaTrack->valueType     = ValueType::eFloat;
    alphaTrack->interpolation = data.interpolation;
  }

  if(result)
  {
    result->descriptor  = descriptor;
    result->samplerData = decoded.data;
    result->track       = track;
    result->alphaTrack  = alphaTrack;
  }

  // Unresolved targets still produce tracks, but nothing is attached
  if(descriptor.object.valid())
  {
    group.addTargetedAnimation(std::move(track), descriptor.object);
    if(alphaTrack)
    {
      group.addTargetedAnimation(std::move(*alphaTrack), descriptor.object);
    }
  }

  return std::nullopt;
}

}  // namespace propanim
