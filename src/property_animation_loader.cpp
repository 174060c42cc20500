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

#include <future>

#include <fmt/format.h>

#include <nvutils/logger.hpp>

#include "property_animation_loader.hpp"
#include "tinygltf_utils.hpp"

namespace propanim {

PropertyAnimationLoader::PropertyAnimationLoader(const tinygltf::Model& model, LoaderSettings settings)
    : m_model(model)
    , m_settings(settings)
    , m_gltfReader(model)
    , m_reader(m_gltfReader)
    , m_resolver(model)
{
}

PropertyAnimationLoader::PropertyAnimationLoader(const tinygltf::Model& model, const FloatAccessorReader& reader, LoaderSettings settings)
    : m_model(model)
    , m_settings(settings)
    , m_gltfReader(model)
    , m_reader(reader)
    , m_resolver(model)
{
}

bool PropertyAnimationLoader::hasPropertyAnimation(int animationIndex) const
{
  if(animationIndex < 0 || animationIndex >= static_cast<int>(m_model.animations.size()))
    return false;
  return tinygltf::utils::hasElementName(m_model.animations[animationIndex].extensions, EXT_PROPERTY_ANIMATION_EXTENSION_NAME);
}

std::string PropertyAnimationLoader::animationName(int animationIndex) const
{
  const std::string& name = m_model.animations[animationIndex].name;
  return name.empty() ? "Animation" + std::to_string(animationIndex) : name;
}

//--------------------------------------------------------------------------------------------------
// Reads the "channels" array of the extension object
//
std::optional<AnimationError> PropertyAnimationLoader::parseChannels(const tinygltf::Value&        extension,
                                                                     const std::string&            context,
                                                                     std::vector<PropertyChannel>& channels) const
{
  if(!extension.IsObject() || !extension.Has("channels") || !extension.Get("channels").IsArray())
  {
    return AnimationError{ErrorCode::eMalformedAnimation, fmt::format("{}/channels: Missing or not an array", context)};
  }

  const tinygltf::Value& array = extension.Get("channels");
  channels.clear();
  channels.reserve(array.ArrayLen());
  for(size_t i = 0; i < array.ArrayLen(); i++)
  {
    const tinygltf::Value&           entry   = array.Get(static_cast<int>(i));
    const std::optional<int>         sampler = tinygltf::utils::getInt(entry, "sampler");
    const std::optional<std::string> target  = tinygltf::utils::getString(entry, "target");
    if(!sampler || !target)
    {
      return AnimationError{ErrorCode::eMalformedAnimation,
                            fmt::format("{}/channels/{}: 'sampler' and 'target' are required", context, i)};
    }
    channels.push_back({static_cast<int>(i), *sampler, *target});
  }
  return std::nullopt;
}

//--------------------------------------------------------------------------------------------------
// Loads all channels of one animation into `group`, then normalizes the group
//
std::optional<AnimationError> PropertyAnimationLoader::loadAnimation(int animationIndex, AnimationGroup& group) const
{
  const std::string animationContext = fmt::format("/animations/{}", animationIndex);
  if(animationIndex < 0 || animationIndex >= static_cast<int>(m_model.animations.size()))
  {
    return AnimationError{ErrorCode::eMalformedAnimation, fmt::format("{}: Invalid index", animationContext)};
  }

  const tinygltf::Animation& animation = m_model.animations[animationIndex];
  if(!hasPropertyAnimation(animationIndex))
  {
    group.normalize();
    return std::nullopt;  // Nothing to load
  }

  const std::string extensionContext = animationContext + "/extensions/" EXT_PROPERTY_ANIMATION_EXTENSION_NAME;
  const tinygltf::Value& extension =
      tinygltf::utils::getElementValue(animation.extensions, EXT_PROPERTY_ANIMATION_EXTENSION_NAME);

  std::vector<PropertyChannel> channels;
  if(std::optional<AnimationError> error = parseChannels(extension, extensionContext, channels))
  {
    return error;
  }

  // Samplers live for the whole load, their decode is shared by the channels
  std::vector<std::unique_ptr<AnimationSampler>> samplers;
  samplers.reserve(animation.samplers.size());
  for(size_t i = 0; i < animation.samplers.size(); i++)
  {
    samplers.push_back(std::make_unique<AnimationSampler>(static_cast<int>(i), animation.samplers[i]));
  }

  const std::launch      policy = m_settings.asyncLoad ? std::launch::async : std::launch::deferred;
  const ChannelAssembler assembler(m_resolver, m_reader, policy);

  // Start every channel before waiting on any
  std::vector<std::future<std::optional<AnimationError>>> pending;
  pending.reserve(channels.size());
  for(const PropertyChannel& channel : channels)
  {
    pending.push_back(std::async(policy, [&, channel]() {
      const std::string context = fmt::format("{}/channels/{}", extensionContext, channel.index);
      return assembler.assemble(channel, samplers, group, animationContext, context);
    }));
  }

  // Join all of them, even after a failure: they reference the samplers above
  std::optional<AnimationError> firstError;
  for(auto& future : pending)
  {
    std::optional<AnimationError> error = future.get();
    if(error && !firstError)
    {
      firstError = std::move(error);
    }
  }
  if(firstError)
  {
    return firstError;
  }

  group.normalize();
  return std::nullopt;
}

//--------------------------------------------------------------------------------------------------
// Loads every animation carrying the extension
//
int PropertyAnimationLoader::loadAll(std::vector<AnimationGroup>& groups) const
{
  int failures = 0;
  for(int animationIndex = 0; animationIndex < static_cast<int>(m_model.animations.size()); animationIndex++)
  {
    if(!hasPropertyAnimation(animationIndex))
      continue;

    AnimationGroup group(animationName(animationIndex));
    if(std::optional<AnimationError> error = loadAnimation(animationIndex, group))
    {
      LOGE("%s: %s\n", std::string(toString(error->code)).c_str(), error->message.c_str());
      failures++;
      continue;
    }

    LOGI("%s: %zu tracks [%g, %g]\n", group.name().c_str(), group.targetedAnimations().size(), group.from(), group.to());
    groups.push_back(std::move(group));
  }
  return failures;
}

}  // namespace propanim
